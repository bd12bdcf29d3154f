/**
 * @file VaultTest.cpp
 * @brief Unit tests for Vault share ledger (without a reserve strategy)
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "mocks/TreasuryStack.hpp"

using namespace treasury;
using namespace treasury::application;
using namespace treasury::tests;
using domain::Amount;
using domain::CallContext;
using domain::ErrorCode;
using domain::STABLE_UNIT;

class VaultTest : public ::testing::Test {
protected:
    void SetUp() override {
        stack_.build(false);
        vault_ = stack_.vault;
        stack_.fund("alice", 10000 * STABLE_UNIT);
        stack_.fund("bob", 10000 * STABLE_UNIT);
    }

    template <typename Fn>
    static ErrorCode codeOf(Fn&& fn) {
        try {
            fn();
        } catch (const domain::TreasuryError& e) {
            return e.code();
        }
        ADD_FAILURE() << "Expected TreasuryError";
        return ErrorCode::VenueFailure;
    }

    TreasuryStack stack_;
    std::shared_ptr<Vault> vault_;
    CallContext alice_ = CallContext::user("alice");
    CallContext bob_ = CallContext::user("bob");
};

// ============================================================================
// Deposit
// ============================================================================

TEST_F(VaultTest, Deposit_FirstDeposit_MintsThousandSharesPerUnit) {
    auto shares = vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    EXPECT_EQ(shares, 1000000000000u);      // 1000 долей по 9 знаков
    EXPECT_EQ(vault_->balanceOf("alice"), shares);
    EXPECT_EQ(vault_->totalShares(), shares);
    EXPECT_EQ(vault_->totalAssets(), 1000 * STABLE_UNIT);
    EXPECT_EQ(stack_.stableOf("alice"), 9000 * STABLE_UNIT);
}

TEST_F(VaultTest, Deposit_PublishesDepositedEvent) {
    vault_->deposit(alice_, 1000 * STABLE_UNIT, "bob");

    auto event = stack_.events->lastJson("vault.deposited");
    ASSERT_FALSE(event.empty());
    EXPECT_EQ(event["sender"], "alice");
    EXPECT_EQ(event["owner"], "bob");
    EXPECT_EQ(event["assets"].get<Amount>(), 1000 * STABLE_UNIT);
    EXPECT_EQ(event["shares"].get<Amount>(), 1000000000000u);
    EXPECT_EQ(event["occurredAt"].get<std::int64_t>(), stack_.clock->now());
}

TEST_F(VaultTest, Deposit_SecondDepositor_SamePrice) {
    auto first = vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");
    auto second = vault_->deposit(bob_, 1000 * STABLE_UNIT, "bob");

    EXPECT_EQ(first, second);
    EXPECT_EQ(vault_->totalShares(), first + second);
}

TEST_F(VaultTest, Deposit_ZeroAmount_Throws) {
    EXPECT_EQ(codeOf([&] { vault_->deposit(alice_, 0, "alice"); }), ErrorCode::ZeroAmount);
}

TEST_F(VaultTest, Deposit_EmptyReceiver_Throws) {
    EXPECT_EQ(codeOf([&] { vault_->deposit(alice_, STABLE_UNIT, ""); }), ErrorCode::InvalidRecipient);
}

TEST_F(VaultTest, Deposit_BelowMinimum_Throws) {
    try {
        vault_->deposit(alice_, STABLE_UNIT - 1, "alice");
        FAIL() << "Expected ValidationError";
    } catch (const domain::ValidationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DepositTooSmall);
        EXPECT_EQ(e.category(), domain::ErrorCategory::VALIDATION);
    }
    EXPECT_EQ(vault_->totalShares(), 0u);
}

TEST_F(VaultTest, Deposit_AboveSingleLimit_Throws) {
    EXPECT_EQ(codeOf([&] { vault_->deposit(alice_, 1000001 * STABLE_UNIT, "alice"); }),
              ErrorCode::DepositTooLarge);
}

TEST_F(VaultTest, Deposit_ExceedsTotalCap_Throws) {
    domain::DepositLimits limits;
    limits.minDeposit = STABLE_UNIT;
    limits.maxSingleDeposit = 500 * STABLE_UNIT;
    limits.maxTotalDeposits = 1000 * STABLE_UNIT;
    vault_->setDepositLimits(stack_.admin, limits);

    vault_->deposit(alice_, 500 * STABLE_UNIT, "alice");
    vault_->deposit(bob_, 500 * STABLE_UNIT, "bob");

    EXPECT_EQ(codeOf([&] { vault_->deposit(alice_, STABLE_UNIT, "alice"); }), ErrorCode::DepositCapExceeded);
    EXPECT_EQ(vault_->totalAssets(), 1000 * STABLE_UNIT);
}

TEST_F(VaultTest, Deposit_MintingPaused_Throws) {
    vault_->setMintingPaused(stack_.admin, true);

    try {
        vault_->deposit(alice_, STABLE_UNIT, "alice");
        FAIL() << "Expected StateError";
    } catch (const domain::StateError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MintingPaused);
        EXPECT_EQ(e.category(), domain::ErrorCategory::STATE);
    }
    EXPECT_EQ(vault_->maxDeposit("alice"), 0u);
}

TEST_F(VaultTest, Deposit_CallerLacksFunds_NothingChanges) {
    CallContext carol = CallContext::user("carol");
    stack_.fund("carol", 5 * STABLE_UNIT);

    EXPECT_EQ(codeOf([&] { vault_->deposit(carol, 10 * STABLE_UNIT, "carol"); }), ErrorCode::InsufficientBalance);
    EXPECT_EQ(stack_.stableOf("carol"), 5 * STABLE_UNIT);
    EXPECT_EQ(vault_->balanceOf("carol"), 0u);
}

TEST_F(VaultTest, Deposit_StorageFailure_RefundsCaller) {
    stack_.vaultRepository->failNextSave();

    EXPECT_THROW(vault_->deposit(alice_, 100 * STABLE_UNIT, "alice"), std::runtime_error);
    EXPECT_EQ(stack_.stableOf("alice"), 10000 * STABLE_UNIT);
    EXPECT_EQ(vault_->totalShares(), 0u);
    EXPECT_EQ(stack_.events->countOf("vault.deposited"), 0);
}

TEST_F(VaultTest, Deposit_AfterDonation_VictimKeepsValue) {
    // Первая доля за минимум, затем прямой перевод в хранилище
    CallContext attacker = CallContext::user("mallory");
    stack_.fund("mallory", 10001 * STABLE_UNIT);
    vault_->deposit(attacker, STABLE_UNIT, "mallory");
    stack_.custody->transfer(domain::AssetId::STABLE, "mallory", "vault", 10000 * STABLE_UNIT);

    auto victimShares = vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    ASSERT_GT(victimShares, 0u);
    auto redeemable = vault_->previewRedeem(victimShares);
    EXPECT_GE(redeemable, 1000 * STABLE_UNIT - STABLE_UNIT);
}

// ============================================================================
// Mint
// ============================================================================

TEST_F(VaultTest, Mint_ExactShares_ChargesRoundedUp) {
    auto assets = vault_->mint(alice_, 1000000000000u, "alice");

    EXPECT_EQ(assets, 1000 * STABLE_UNIT);
    EXPECT_EQ(vault_->balanceOf("alice"), 1000000000000u);
    EXPECT_EQ(stack_.stableOf("alice"), 9000 * STABLE_UNIT);
}

TEST_F(VaultTest, Mint_ShareFraction_ChargesAtLeastOneUnit) {
    vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    // previewMint округляет вверх, previewDeposit вниз
    EXPECT_EQ(vault_->previewMint(1), 1u);
    EXPECT_EQ(vault_->previewDeposit(1), 1000u);
}

TEST_F(VaultTest, Mint_BelowMinimumCost_Throws) {
    EXPECT_EQ(codeOf([&] { vault_->mint(alice_, 1000, "alice"); }), ErrorCode::DepositTooSmall);
}

// ============================================================================
// Withdraw / Redeem
// ============================================================================

TEST_F(VaultTest, Withdraw_ExactAssets_BurnsRoundedUpShares) {
    vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    auto burned = vault_->withdraw(alice_, 400 * STABLE_UNIT, "alice", "alice");

    EXPECT_EQ(burned, 400000000000u);
    EXPECT_EQ(vault_->balanceOf("alice"), 600000000000u);
    EXPECT_EQ(stack_.stableOf("alice"), 9400 * STABLE_UNIT);

    auto event = stack_.events->lastJson("vault.withdrawn");
    EXPECT_EQ(event["receiver"], "alice");
    EXPECT_EQ(event["owner"], "alice");
    EXPECT_EQ(event["shares"].get<Amount>(), burned);
}

TEST_F(VaultTest, Withdraw_ToOtherReceiver_PaysReceiver) {
    vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    vault_->withdraw(alice_, 100 * STABLE_UNIT, "bob", "alice");

    EXPECT_EQ(stack_.stableOf("bob"), 10100 * STABLE_UNIT);
}

TEST_F(VaultTest, Withdraw_ForOtherOwner_Unauthorized) {
    vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    EXPECT_EQ(codeOf([&] { vault_->withdraw(bob_, 100 * STABLE_UNIT, "bob", "alice"); }),
              ErrorCode::Unauthorized);
    EXPECT_EQ(vault_->balanceOf("alice"), 1000000000000u);
}

TEST_F(VaultTest, Withdraw_MoreThanOwned_InsufficientShares) {
    vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");
    vault_->deposit(bob_, 1000 * STABLE_UNIT, "bob");

    EXPECT_EQ(codeOf([&] { vault_->withdraw(alice_, 1500 * STABLE_UNIT, "alice", "alice"); }),
              ErrorCode::InsufficientShares);
}

TEST_F(VaultTest, Redeem_AllShares_ClearsHolder) {
    auto shares = vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    auto assets = vault_->redeem(alice_, shares, "alice", "alice");

    EXPECT_EQ(assets, 1000 * STABLE_UNIT);
    EXPECT_EQ(vault_->totalShares(), 0u);
    EXPECT_EQ(vault_->state().shareBalances.count("alice"), 0u);
    EXPECT_EQ(stack_.vaultRepository->lastTouched(), std::set<std::string>{"alice"});
    EXPECT_EQ(stack_.stableOf("alice"), 10000 * STABLE_UNIT);
}

TEST_F(VaultTest, Redeem_Paused_Throws) {
    auto shares = vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");
    vault_->setRedeemingPaused(stack_.admin, true);

    EXPECT_EQ(codeOf([&] { vault_->redeem(alice_, shares, "alice", "alice"); }), ErrorCode::RedeemingPaused);
    EXPECT_EQ(codeOf([&] { vault_->withdraw(alice_, STABLE_UNIT, "alice", "alice"); }), ErrorCode::RedeemingPaused);
    EXPECT_EQ(vault_->maxRedeem("alice"), 0u);
}

TEST_F(VaultTest, Redeem_DustShares_Throws) {
    vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    EXPECT_EQ(codeOf([&] { vault_->redeem(alice_, 1, "alice", "alice"); }), ErrorCode::ZeroAmount);
}

TEST_F(VaultTest, Redeem_PayoutFails_RestoresShares) {
    auto shares = vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");
    stack_.custody->failTransfersTo("carol");

    EXPECT_THROW(vault_->redeem(alice_, shares, "carol", "alice"), domain::ExecutionError);

    EXPECT_EQ(vault_->balanceOf("alice"), shares);
    EXPECT_EQ(vault_->totalShares(), shares);
    EXPECT_EQ(stack_.vaultRepository->load()->totalShares, shares);
    EXPECT_EQ(stack_.events->countOf("vault.withdrawn"), 0);
}

// ============================================================================
// Transfer
// ============================================================================

TEST_F(VaultTest, Transfer_MovesShares) {
    auto shares = vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    vault_->transfer(alice_, "bob", shares / 4);

    EXPECT_EQ(vault_->balanceOf("alice"), shares - shares / 4);
    EXPECT_EQ(vault_->balanceOf("bob"), shares / 4);
    EXPECT_EQ(vault_->totalShares(), shares);

    auto event = stack_.events->lastJson("vault.shares_transferred");
    EXPECT_EQ(event["from"], "alice");
    EXPECT_EQ(event["to"], "bob");
}

TEST_F(VaultTest, Transfer_MoreThanOwned_Throws) {
    auto shares = vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    EXPECT_EQ(codeOf([&] { vault_->transfer(alice_, "bob", shares + 1); }), ErrorCode::InsufficientShares);
    EXPECT_EQ(codeOf([&] { vault_->transfer(alice_, "bob", 0); }), ErrorCode::ZeroAmount);
    EXPECT_EQ(codeOf([&] { vault_->transfer(alice_, "", 1); }), ErrorCode::InvalidRecipient);
}

TEST_F(VaultTest, Transfer_SumOfBalancesEqualsTotal) {
    vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");
    vault_->deposit(bob_, 300 * STABLE_UNIT, "bob");
    vault_->transfer(alice_, "carol", 123456789);
    vault_->transfer(bob_, "alice", 987654321);

    Amount sum = 0;
    for (const auto& [holder, balance] : vault_->state().shareBalances) {
        sum += balance;
    }
    EXPECT_EQ(sum, vault_->totalShares());
}

// ============================================================================
// Views
// ============================================================================

TEST_F(VaultTest, Views_EmptyVault) {
    EXPECT_EQ(vault_->totalAssets(), 0u);
    EXPECT_EQ(vault_->convertToShares(STABLE_UNIT), 1000 * STABLE_UNIT);
    EXPECT_EQ(vault_->assetsPerShare(), STABLE_UNIT);
    EXPECT_EQ(vault_->collateralRatio(), domain::INFINITE_RATIO);
    EXPECT_EQ(vault_->decimals(), 9);
    EXPECT_EQ(vault_->maxDeposit("alice"), 1000000 * STABLE_UNIT);
    EXPECT_EQ(vault_->epochPhase(), domain::EpochPhase::IDLE);
}

TEST_F(VaultTest, Decimals_WholeShareWorthOneUnitAtStart) {
    Amount wholeShare = 1;
    for (int i = 0; i < vault_->decimals(); ++i) {
        wholeShare *= 10;
    }

    EXPECT_EQ(vault_->deposit(alice_, 100 * STABLE_UNIT, "alice"), 100 * wholeShare);
    EXPECT_EQ(vault_->convertToAssets(wholeShare), STABLE_UNIT);
}

TEST_F(VaultTest, Views_AfterDeposit) {
    vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    EXPECT_EQ(vault_->assetsPerShare(), STABLE_UNIT);
    EXPECT_EQ(vault_->collateralRatio(), domain::PRECISION);
    EXPECT_EQ(vault_->projectedAnnualDividend(), 80 * STABLE_UNIT);
    EXPECT_EQ(vault_->previewWithdraw(400 * STABLE_UNIT), 400000000000u);
    EXPECT_EQ(vault_->maxRedeem("alice"), 1000000000000u);
}

TEST_F(VaultTest, MaxDeposit_RoomBelowMinimum_ReturnsZero) {
    domain::DepositLimits limits;
    limits.minDeposit = STABLE_UNIT;
    limits.maxSingleDeposit = 1000 * STABLE_UNIT;
    limits.maxTotalDeposits = 1000 * STABLE_UNIT + STABLE_UNIT / 2;
    vault_->setDepositLimits(stack_.admin, limits);

    vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");

    EXPECT_EQ(vault_->maxDeposit("bob"), 0u);
}

// ============================================================================
// Administration
// ============================================================================

TEST_F(VaultTest, Admin_NonAdministrator_Unauthorized) {
    EXPECT_EQ(codeOf([&] { vault_->setTargetPrice(alice_, 90 * domain::PRICE_UNIT); }), ErrorCode::Unauthorized);
    EXPECT_EQ(codeOf([&] { vault_->setMintingPaused(stack_.keeper, true); }), ErrorCode::Unauthorized);
}

TEST_F(VaultTest, SetDividendParams_Valid_PublishesUpdate) {
    domain::RateParams params{1000, 3000, 200, 3000};

    vault_->setDividendParams(stack_.admin, params);

    EXPECT_EQ(vault_->state().rateParams, params);
    auto event = stack_.events->lastJson("vault.parameters_updated");
    EXPECT_EQ(event["parameter"], "dividend_params");
    EXPECT_EQ(event["changedBy"], "treasury-admin");
    EXPECT_EQ(event["values"]["baseRateBps"].get<std::uint64_t>(), 1000u);
}

TEST_F(VaultTest, SetDividendParams_Invalid_KeepsPrevious) {
    domain::RateParams params{100, 2000, 800, 2500};

    EXPECT_EQ(codeOf([&] { vault_->setDividendParams(stack_.admin, params); }), ErrorCode::InvalidParameter);
    EXPECT_EQ(vault_->state().rateParams, domain::RateParams{});
}

TEST_F(VaultTest, SetParameters_OutOfRange_Throw) {
    EXPECT_EQ(codeOf([&] { vault_->setTargetPrice(stack_.admin, 0); }), ErrorCode::InvalidParameter);
    EXPECT_EQ(codeOf([&] { vault_->setEpochDuration(stack_.admin, 0); }), ErrorCode::InvalidParameter);
    EXPECT_EQ(codeOf([&] { vault_->setLiquidityBuffer(stack_.admin, domain::BASIS + 1); }),
              ErrorCode::InvalidParameter);

    domain::DepositLimits limits;
    limits.minDeposit = 0;
    EXPECT_EQ(codeOf([&] { vault_->setDepositLimits(stack_.admin, limits); }), ErrorCode::InvalidParameter);
}

TEST_F(VaultTest, SetEpochDuration_MovesNextEpoch) {
    auto start = stack_.clock->now();

    vault_->setEpochDuration(stack_.admin, 3600);

    EXPECT_EQ(vault_->nextEpochAt(), start + 3600);
}

TEST_F(VaultTest, SetStrategy_Null_Throws) {
    EXPECT_EQ(codeOf([&] { vault_->setStrategy(stack_.admin, nullptr); }), ErrorCode::InvalidParameter);
}

TEST_F(VaultTest, EmergencyWithdraw_NoStrategy_Throws) {
    EXPECT_EQ(codeOf([&] { vault_->emergencyWithdrawFromStrategy(stack_.admin, false); }),
              ErrorCode::StrategyNotSet);
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(VaultTest, Constructor_StoredState_Restored) {
    auto shares = vault_->deposit(alice_, 1000 * STABLE_UNIT, "alice");
    vault_->setTargetPrice(stack_.admin, 95 * domain::PRICE_UNIT);

    Vault restored(stack_.vaultSettings, stack_.custody, stack_.oracle, stack_.clock,
                   stack_.vaultRepository, stack_.events);

    EXPECT_EQ(restored.balanceOf("alice"), shares);
    EXPECT_EQ(restored.totalShares(), shares);
    EXPECT_EQ(restored.state().targetPrice, 95 * domain::PRICE_UNIT);
}

TEST_F(VaultTest, Constructor_InvalidSettings_Throws) {
    auto settings = std::make_shared<TestVaultSettings>();
    settings->rateParams.minRateBps = 5000;
    auto repository = std::make_shared<adapters::secondary::InMemoryVaultStateRepository>();

    EXPECT_THROW(Vault(settings, stack_.custody, stack_.oracle, stack_.clock, repository, stack_.events),
                 domain::ValidationError);
}
