/**
 * @file VaultStrategyTest.cpp
 * @brief Unit tests for Vault <-> strategy orchestration (mocked strategy)
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "mocks/TreasuryStack.hpp"
#include "mocks/MockReserveStrategy.hpp"
#include <algorithm>

using namespace treasury;
using namespace treasury::application;
using namespace treasury::tests;
using domain::Amount;
using domain::AssetId;
using domain::CallContext;
using domain::ErrorCode;
using domain::STABLE_UNIT;

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Truly;

class VaultStrategyTest : public ::testing::Test {
protected:
    void SetUp() override {
        stack_.build(false);
        vault_ = stack_.vault;
        stack_.fund("alice", 10000 * STABLE_UNIT);

        strategy_ = std::make_shared<NiceMock<MockReserveStrategy>>();
        ON_CALL(*strategy_, account()).WillByDefault(Return("mock-strategy"));
        ON_CALL(*strategy_, circuitBreakerTripped()).WillByDefault(Return(false));
        // Стоимость стратегии = её свободный остаток в custody
        ON_CALL(*strategy_, totalValue()).WillByDefault(Invoke([this]() {
            return stack_.stableOf("mock-strategy");
        }));
        ON_CALL(*strategy_, freeStableBalance()).WillByDefault(Invoke([this]() {
            return stack_.stableOf("mock-strategy");
        }));

        vault_->setStrategy(stack_.admin, strategy_);
    }

    /// withdraw стратегии, который действительно переводит средства
    void payOutOnWithdraw() {
        ON_CALL(*strategy_, withdraw(_, _)).WillByDefault(Invoke([this](const CallContext& ctx, Amount amount) {
            auto available = std::min(amount, stack_.stableOf("mock-strategy"));
            stack_.custody->transfer(AssetId::STABLE, "mock-strategy", ctx.caller, available);
            return available;
        }));
    }

    TreasuryStack stack_;
    std::shared_ptr<Vault> vault_;
    std::shared_ptr<NiceMock<MockReserveStrategy>> strategy_;
    CallContext alice_ = CallContext::user("alice");
};

// ============================================================================
// Deploy after deposit
// ============================================================================

TEST_F(VaultStrategyTest, Deposit_DeploysAboveLiquidityBuffer) {
    auto isOrchestrator = Truly([](const CallContext& ctx) {
        return ctx.caller == "vault" && ctx.has(domain::Role::ORCHESTRATOR);
    });
    EXPECT_CALL(*strategy_, deploy(isOrchestrator, 990 * STABLE_UNIT)).Times(1);

    vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    EXPECT_EQ(vault_->idleBalance(), 10 * STABLE_UNIT);
    EXPECT_EQ(stack_.stableOf("mock-strategy"), 990 * STABLE_UNIT);
    EXPECT_EQ(vault_->totalAssets(), 1000 * STABLE_UNIT);
}

TEST_F(VaultStrategyTest, Deposit_SmallIdle_KeepsMinimumBuffer) {
    // 1% от 50 USDC меньше minDeposit: буфер = 1 USDC
    EXPECT_CALL(*strategy_, deploy(_, 49 * STABLE_UNIT)).Times(1);

    vault_->deposit(alice_, 50 * STABLE_UNIT, "alice");

    EXPECT_EQ(vault_->idleBalance(), STABLE_UNIT);
}

TEST_F(VaultStrategyTest, Deposit_BreakerTripped_KeepsFundsIdle) {
    ON_CALL(*strategy_, circuitBreakerTripped()).WillByDefault(Return(true));
    EXPECT_CALL(*strategy_, deploy(_, _)).Times(0);

    vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    EXPECT_EQ(vault_->idleBalance(), 1000 * STABLE_UNIT);
}

TEST_F(VaultStrategyTest, Deposit_StrategyFails_DepositStandsAndDeferred) {
    EXPECT_CALL(*strategy_, deploy(_, _))
        .WillOnce(Invoke([](const CallContext&, Amount) {
            throw domain::ExecutionError(ErrorCode::SlippageExceeded, "pool moved");
        }));

    auto shares = vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    EXPECT_EQ(vault_->balanceOf("alice"), shares);
    EXPECT_EQ(vault_->totalAssets(), 1000 * STABLE_UNIT);

    auto deferred = stack_.events->lastJson("strategy.deploy_deferred");
    ASSERT_FALSE(deferred.empty());
    EXPECT_EQ(deferred["amount"].get<Amount>(), 990 * STABLE_UNIT);
    EXPECT_EQ(deferred["reason"], "SlippageExceeded");

    EXPECT_EQ(vault_->idleBalance(), 1000 * STABLE_UNIT);
    EXPECT_EQ(stack_.stableOf("mock-strategy"), 0u);
}

TEST_F(VaultStrategyTest, Deposit_StrategyPartiallyDeploys_ReturnsOnlyRemainder) {
    // Стратегия успевает потратить 600 USDC до отказа
    EXPECT_CALL(*strategy_, deploy(_, 990 * STABLE_UNIT))
        .WillOnce(Invoke([this](const CallContext&, Amount) {
            stack_.custody->transfer(AssetId::STABLE, "mock-strategy", "swap-pool", 600 * STABLE_UNIT);
            throw domain::ExecutionError(ErrorCode::VenueFailure, "lending pool offline");
        }));

    vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    EXPECT_EQ(vault_->idleBalance(), 400 * STABLE_UNIT);
    EXPECT_EQ(stack_.stableOf("mock-strategy"), 0u);
    EXPECT_EQ(stack_.events->lastJson("strategy.deploy_deferred")["reason"], "VenueFailure");
}

// ============================================================================
// Liquidity for withdrawals
// ============================================================================

TEST_F(VaultStrategyTest, Redeem_PullsShortfallFromStrategy) {
    payOutOnWithdraw();
    auto shares = vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    EXPECT_CALL(*strategy_, withdraw(_, 490 * STABLE_UNIT)).Times(1);

    auto assets = vault_->redeem(alice_, shares / 2, "alice", "alice");

    EXPECT_EQ(assets, 500 * STABLE_UNIT);
    EXPECT_EQ(stack_.stableOf("alice"), 9500 * STABLE_UNIT);
}

TEST_F(VaultStrategyTest, Redeem_IdleCovers_StrategyUntouched) {
    auto shares = vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");
    EXPECT_CALL(*strategy_, withdraw(_, _)).Times(0);

    vault_->redeem(alice_, shares / 200, "alice", "alice");

    EXPECT_EQ(stack_.stableOf("alice"), 9005 * STABLE_UNIT);
}

TEST_F(VaultStrategyTest, Redeem_StrategyShortDelivers_InsufficientLiquidity) {
    auto shares = vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");
    ON_CALL(*strategy_, withdraw(_, _)).WillByDefault(Return(0));

    try {
        vault_->redeem(alice_, shares, "alice", "alice");
        FAIL() << "Expected StateError";
    } catch (const domain::StateError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InsufficientLiquidity);
    }
    EXPECT_EQ(vault_->balanceOf("alice"), shares);
}

TEST_F(VaultStrategyTest, Redeem_StrategyBreakerActive_Propagates) {
    auto shares = vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");
    ON_CALL(*strategy_, withdraw(_, _)).WillByDefault(Invoke([](const CallContext&, Amount) -> Amount {
        throw domain::StateError(ErrorCode::CircuitBreakerActive, "tripped");
    }));

    try {
        vault_->redeem(alice_, shares, "alice", "alice");
        FAIL() << "Expected StateError";
    } catch (const domain::StateError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CircuitBreakerActive);
    }
    EXPECT_EQ(vault_->totalShares(), shares);
}

// ============================================================================
// Epoch dividend
// ============================================================================

TEST_F(VaultStrategyTest, RebalanceYield_StrategyDeliversShort_RecordsDelivered) {
    vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");
    stack_.advance(7 * 24 * 60 * 60);
    stack_.prices->setPrice(AssetId::SHARE, 50 * domain::PRICE_UNIT);

    // Стратегия отдаёт только половину запрошенного
    EXPECT_CALL(*strategy_, withdraw(_, _))
        .WillOnce(Invoke([this](const CallContext& ctx, Amount amount) {
            auto half = amount / 2;
            stack_.custody->transfer(AssetId::STABLE, "mock-strategy", ctx.caller, half);
            return half;
        }));

    auto report = vault_->rebalanceYield(stack_.keeper);

    ASSERT_GT(report.epochDividend, 0u);
    EXPECT_EQ(report.withdrawnForDividend, report.epochDividend / 2);
    EXPECT_EQ(vault_->state().totalDividendsPaid, report.epochDividend / 2);
    auto event = stack_.events->lastJson("vault.dividend_distributed");
    EXPECT_EQ(event["amount"].get<Amount>(), report.epochDividend / 2);
}

TEST_F(VaultStrategyTest, RebalanceYield_BelowPeg_WithdrawsBeforeHarvest) {
    vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");
    stack_.advance(7 * 24 * 60 * 60);
    stack_.prices->setPrice(AssetId::SHARE, 50 * domain::PRICE_UNIT);
    payOutOnWithdraw();

    ::testing::InSequence order;
    EXPECT_CALL(*strategy_, withdraw(_, _)).Times(1);
    EXPECT_CALL(*strategy_, harvestYield(_)).Times(1);

    vault_->rebalanceYield(stack_.keeper);
}

// ============================================================================
// Strategy administration
// ============================================================================

TEST_F(VaultStrategyTest, SetStrategy_ReplaceWhileFunded_Throws) {
    vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");
    auto replacement = std::make_shared<NiceMock<MockReserveStrategy>>();

    try {
        vault_->setStrategy(stack_.admin, replacement);
        FAIL() << "Expected ValidationError";
    } catch (const domain::ValidationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidParameter);
    }
}

TEST_F(VaultStrategyTest, SetStrategy_ReplaceWhenEmpty_PublishesUpdate) {
    auto replacement = std::make_shared<NiceMock<MockReserveStrategy>>();
    ON_CALL(*replacement, account()).WillByDefault(Return("strategy-v2"));

    vault_->setStrategy(stack_.admin, replacement);

    auto event = stack_.events->lastJson("vault.parameters_updated");
    EXPECT_EQ(event["parameter"], "strategy");
    EXPECT_EQ(event["values"]["account"], "strategy-v2");
}

TEST_F(VaultStrategyTest, EmergencyWithdraw_ForwardsToStrategyWithVaultRecipient) {
    EXPECT_CALL(*strategy_, emergencyWithdraw(_, "vault", true)).WillOnce(Return(777u));

    EXPECT_EQ(vault_->emergencyWithdrawFromStrategy(stack_.admin, true), 777u);
}

TEST_F(VaultStrategyTest, EmergencyWithdraw_NonAdmin_Unauthorized) {
    EXPECT_CALL(*strategy_, emergencyWithdraw(_, _, _)).Times(0);

    EXPECT_THROW(vault_->emergencyWithdrawFromStrategy(alice_, true), domain::StateError);
}

// ============================================================================
// Views
// ============================================================================

TEST_F(VaultStrategyTest, CollateralRatio_SplitsReserveAndCash) {
    vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");
    ON_CALL(*strategy_, volatileValue()).WillByDefault(Return(0));
    ON_CALL(*strategy_, cashReserveValue()).WillByDefault(Return(0));

    // Всё обеспечение - свободный стабильный актив хранилища и стратегии
    EXPECT_EQ(vault_->collateralRatio(), domain::PRECISION);
}
