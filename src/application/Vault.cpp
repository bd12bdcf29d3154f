// src/application/Vault.cpp
#include "application/Vault.hpp"
#include "domain/RateController.hpp"
#include <algorithm>
#include <iostream>

namespace treasury::application {

using domain::Amount;
using domain::AssetId;
using domain::EpochPhase;
using domain::ErrorCode;
using domain::Role;

namespace {

/**
 * @brief Возвращает фазу эпохи в исходную, если тик не дошёл до Settled
 */
class PhaseScope {
public:
    explicit PhaseScope(std::atomic<EpochPhase>& phase)
        : phase_(phase), previous_(phase.load()) {
        phase_ = EpochPhase::COMPUTING;
    }

    ~PhaseScope() {
        if (!settled_) {
            phase_ = previous_;
        }
    }

    void rebalancing() { phase_ = EpochPhase::REBALANCING; }

    void settle() {
        phase_ = EpochPhase::SETTLED;
        settled_ = true;
    }

private:
    std::atomic<EpochPhase>& phase_;
    EpochPhase previous_;
    bool settled_ = false;
};

} // namespace

Vault::Vault(
    std::shared_ptr<settings::IVaultSettings> settings,
    std::shared_ptr<ports::output::IAssetCustody> custody,
    std::shared_ptr<OracleGuard> oracle,
    std::shared_ptr<ports::output::IClock> clock,
    std::shared_ptr<ports::output::IVaultStateRepository> repository,
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher
) : custody_(std::move(custody))
  , oracle_(std::move(oracle))
  , clock_(std::move(clock))
  , repository_(std::move(repository))
  , eventPublisher_(std::move(eventPublisher))
  , account_(settings->getAccount())
  , orchestrator_(domain::CallContext::orchestrator(account_))
{
    auto stored = repository_->load();
    if (stored) {
        state_ = *stored;
        std::cout << "[Vault] Restored state: epoch=" << state_.epochCount
                  << " totalShares=" << state_.totalShares
                  << " holders=" << state_.shareBalances.size() << std::endl;
    } else {
        state_ = initialState(*settings, clock_->now());
        repository_->save(state_, {});
        std::cout << "[Vault] Created account=" << account_
                  << " target=" << state_.targetPrice
                  << " baseRate=" << state_.rateParams.baseRateBps << " bps" << std::endl;
    }
}

domain::VaultState Vault::initialState(const settings::IVaultSettings& settings, domain::UnixSeconds now) {
    domain::VaultState state;
    state.targetPrice = settings.getTargetPrice();
    state.rateParams = settings.getRateParams();
    state.currentRateBps = state.rateParams.baseRateBps;
    state.epochDuration = settings.getEpochDuration();
    state.lastEpochTimestamp = now;
    state.limits = settings.getDepositLimits();
    state.liquidityBufferBps = settings.getLiquidityBufferBps();

    domain::RateController::validate(state.rateParams);
    if (state.targetPrice <= 0) {
        throw domain::ValidationError(ErrorCode::InvalidParameter, "target price must be positive");
    }
    if (state.epochDuration <= 0) {
        throw domain::ValidationError(ErrorCode::InvalidParameter, "epoch duration must be positive");
    }
    return state;
}

// ============================================================================
// Пользовательские операции
// ============================================================================

Amount Vault::deposit(const domain::CallContext& ctx, Amount assets, const std::string& receiver) {
    ReentrancyGuard::Scope scope(guard_, "Vault");
    if (assets == 0) {
        throw domain::ValidationError(ErrorCode::ZeroAmount, "deposit amount is zero");
    }
    if (receiver.empty()) {
        throw domain::ValidationError(ErrorCode::InvalidRecipient, "receiver is empty");
    }

    auto total = totalAssets();
    validateDeposit(assets, total);

    auto shares = toShares(assets, total, state_.totalShares, false);
    if (shares == 0) {
        throw domain::ValidationError(ErrorCode::ZeroShares, "deposit of " + std::to_string(assets) + " mints no shares");
    }

    mintShares(ctx, assets, shares, receiver);
    return shares;
}

Amount Vault::mint(const domain::CallContext& ctx, Amount shares, const std::string& receiver) {
    ReentrancyGuard::Scope scope(guard_, "Vault");
    if (shares == 0) {
        throw domain::ValidationError(ErrorCode::ZeroAmount, "mint amount is zero");
    }
    if (receiver.empty()) {
        throw domain::ValidationError(ErrorCode::InvalidRecipient, "receiver is empty");
    }

    // Лимиты проверяются по фактической цене выпуска до изменения реестра
    auto total = totalAssets();
    auto assets = toAssets(shares, total, state_.totalShares, true);
    validateDeposit(assets, total);

    return mintShares(ctx, assets, shares, receiver);
}

Amount Vault::withdraw(const domain::CallContext& ctx, Amount assets,
                       const std::string& receiver, const std::string& owner) {
    ReentrancyGuard::Scope scope(guard_, "Vault");
    if (state_.redeemingPaused) {
        throw domain::StateError(ErrorCode::RedeemingPaused, "redeeming is paused");
    }
    if (assets == 0) {
        throw domain::ValidationError(ErrorCode::ZeroAmount, "withdraw amount is zero");
    }
    if (receiver.empty()) {
        throw domain::ValidationError(ErrorCode::InvalidRecipient, "receiver is empty");
    }
    if (ctx.caller != owner) {
        throw domain::StateError(ErrorCode::Unauthorized, "'" + ctx.caller + "' cannot withdraw for '" + owner + "'");
    }

    auto shares = toShares(assets, totalAssets(), state_.totalShares, true);
    auto balance = state_.balanceOf(owner);
    if (balance < shares) {
        throw domain::StateError(ErrorCode::InsufficientShares,
            owner + " holds " + std::to_string(balance) + " shares, needs " + std::to_string(shares));
    }

    burnShares(ctx, assets, shares, receiver, owner);
    return shares;
}

Amount Vault::redeem(const domain::CallContext& ctx, Amount shares,
                     const std::string& receiver, const std::string& owner) {
    ReentrancyGuard::Scope scope(guard_, "Vault");
    if (state_.redeemingPaused) {
        throw domain::StateError(ErrorCode::RedeemingPaused, "redeeming is paused");
    }
    if (shares == 0) {
        throw domain::ValidationError(ErrorCode::ZeroAmount, "redeem amount is zero");
    }
    if (receiver.empty()) {
        throw domain::ValidationError(ErrorCode::InvalidRecipient, "receiver is empty");
    }
    if (ctx.caller != owner) {
        throw domain::StateError(ErrorCode::Unauthorized, "'" + ctx.caller + "' cannot redeem for '" + owner + "'");
    }

    auto balance = state_.balanceOf(owner);
    if (balance < shares) {
        throw domain::StateError(ErrorCode::InsufficientShares,
            owner + " holds " + std::to_string(balance) + " shares, redeem requested " + std::to_string(shares));
    }

    auto assets = toAssets(shares, totalAssets(), state_.totalShares, false);
    if (assets == 0) {
        throw domain::ValidationError(ErrorCode::ZeroAmount, "redeem of " + std::to_string(shares) + " shares yields nothing");
    }

    burnShares(ctx, assets, shares, receiver, owner);
    return assets;
}

void Vault::transfer(const domain::CallContext& ctx, const std::string& to, Amount shares) {
    ReentrancyGuard::Scope scope(guard_, "Vault");
    if (shares == 0) {
        throw domain::ValidationError(ErrorCode::ZeroAmount, "transfer amount is zero");
    }
    if (to.empty()) {
        throw domain::ValidationError(ErrorCode::InvalidRecipient, "recipient is empty");
    }

    auto balance = state_.balanceOf(ctx.caller);
    if (balance < shares) {
        throw domain::StateError(ErrorCode::InsufficientShares,
            ctx.caller + " holds " + std::to_string(balance) + " shares");
    }

    auto next = state_;
    next.shareBalances[ctx.caller] -= shares;
    if (next.shareBalances[ctx.caller] == 0) {
        next.shareBalances.erase(ctx.caller);
    }
    next.shareBalances[to] += shares;
    commit(next, {ctx.caller, to});

    domain::SharesTransferredEvent event;
    event.from = ctx.caller;
    event.to = to;
    event.shares = shares;
    publish(event);

    std::cout << "[Vault] Transferred " << shares << " shares " << ctx.caller << " -> " << to << std::endl;
}

// ============================================================================
// Тик эпохи
// ============================================================================

domain::EpochReport Vault::rebalanceYield(const domain::CallContext& ctx) {
    ReentrancyGuard::Scope scope(guard_, "Vault");
    ctx.require(Role::KEEPER);

    auto now = clock_->now();
    auto due = state_.lastEpochTimestamp + state_.epochDuration;
    if (now < due) {
        throw domain::StateError(ErrorCode::EpochNotElapsed,
            "next epoch in " + std::to_string(due - now) + "s");
    }

    PhaseScope phase(phase_);

    // Computing: все чтения и расчёты до первого изменения
    auto next = state_;
    auto marketPrice = oracle_->read(AssetId::SHARE);
    auto newRate = domain::RateController::variableRate(next.targetPrice, marketPrice, next.rateParams);
    auto total = totalAssets();
    auto dividend = domain::RateController::epochDividend(total, newRate, next.epochDuration);

    domain::EpochReport report;
    report.marketPrice = marketPrice;
    report.targetPrice = next.targetPrice;
    report.newRateBps = newRate;
    report.totalAssets = total;
    report.epochDividend = dividend;

    auto aps = assetsPerShareOf(total, next.totalShares);
    if (next.lastAssetsPerShare > 0 && aps > next.lastAssetsPerShare) {
        report.yieldPerShareDelta = aps - next.lastAssetsPerShare;
        next.accumulatedYieldPerShare += report.yieldPerShareDelta;
    }

    bool belowPeg = marketPrice < next.targetPrice;
    bool abovePeg = marketPrice > next.targetPrice;
    bool payDividend = belowPeg && dividend > 0;

    if (payDividend && strategy_ && strategy_->circuitBreakerTripped()) {
        throw domain::StateError(ErrorCode::CircuitBreakerActive,
            "dividend liquidity cannot be moved while the strategy breaker is tripped");
    }

    // Rebalancing: сначала шаги под предохранителем, сбор дохода только после них
    phase.rebalancing();

    if (payDividend && strategy_) {
        auto cash = strategy_->cashReserveValue();
        if (cash < dividend && strategy_->volatileHeld() > 0) {
            report.liquidated = dividend - cash;
            strategy_->rebalance(orchestrator_, true, report.liquidated);
        }
        report.withdrawnForDividend = strategy_->withdraw(orchestrator_, dividend);
        next.totalDividendsPaid += report.withdrawnForDividend;
    }

    if (strategy_) {
        report.harvested = strategy_->harvestYield(orchestrator_);
    }

    if (abovePeg) {
        report.deployed = deployIdle();
    }

    // Settled
    next.lastAssetsPerShare = assetsPerShareOf(totalAssets(), next.totalShares);
    next.currentRateBps = newRate;
    next.lastEpochTimestamp += next.epochDuration;
    next.epochCount += 1;
    commit(next, {});

    report.epoch = next.epochCount;
    report.epochTimestamp = next.lastEpochTimestamp;

    if (report.withdrawnForDividend > 0) {
        domain::DividendDistributedEvent dividendEvent;
        dividendEvent.epoch = next.epochCount;
        dividendEvent.amount = report.withdrawnForDividend;
        dividendEvent.rateBps = newRate;
        publish(dividendEvent);
    }

    domain::YieldRebalancedEvent event;
    event.epoch = next.epochCount;
    event.newRateBps = newRate;
    event.marketPrice = marketPrice;
    event.targetPrice = next.targetPrice;
    event.totalAssets = total;
    event.accumulatedYieldPerShare = next.accumulatedYieldPerShare;
    publish(event);

    phase.settle();

    std::cout << "[Vault] Epoch " << next.epochCount << " settled by " << ctx.caller
              << ": price=" << marketPrice << " rate=" << newRate << " bps"
              << " dividend=" << dividend
              << " harvested=" << report.harvested
              << " deployed=" << report.deployed << std::endl;
    return report;
}

// ============================================================================
// Администрирование
// ============================================================================

void Vault::setDividendParams(const domain::CallContext& ctx, const domain::RateParams& params) {
    ReentrancyGuard::Scope scope(guard_, "Vault");
    ctx.require(Role::ADMINISTRATOR);
    domain::RateController::validate(params);

    auto next = state_;
    next.rateParams = params;
    commit(next, {});

    publishParameters(ctx, "dividend_params", {
        {"baseRateBps", params.baseRateBps},
        {"sensitivityBps", params.sensitivityBps},
        {"minRateBps", params.minRateBps},
        {"maxRateBps", params.maxRateBps}
    });
}

void Vault::setTargetPrice(const domain::CallContext& ctx, domain::Price targetPrice) {
    ReentrancyGuard::Scope scope(guard_, "Vault");
    ctx.require(Role::ADMINISTRATOR);
    if (targetPrice <= 0) {
        throw domain::ValidationError(ErrorCode::InvalidParameter, "target price must be positive");
    }

    auto next = state_;
    next.targetPrice = targetPrice;
    commit(next, {});

    publishParameters(ctx, "target_price", {{"targetPrice", targetPrice}});
}

void Vault::setEpochDuration(const domain::CallContext& ctx, domain::UnixSeconds duration) {
    ReentrancyGuard::Scope scope(guard_, "Vault");
    ctx.require(Role::ADMINISTRATOR);
    if (duration <= 0) {
        throw domain::ValidationError(ErrorCode::InvalidParameter, "epoch duration must be positive");
    }

    auto next = state_;
    next.epochDuration = duration;
    commit(next, {});

    publishParameters(ctx, "epoch_duration", {{"epochDuration", duration}});
}

void Vault::setDepositLimits(const domain::CallContext& ctx, const domain::DepositLimits& limits) {
    ReentrancyGuard::Scope scope(guard_, "Vault");
    ctx.require(Role::ADMINISTRATOR);
    if (limits.minDeposit == 0
        || limits.minDeposit > limits.maxSingleDeposit
        || limits.maxSingleDeposit > limits.maxTotalDeposits) {
        throw domain::ValidationError(ErrorCode::InvalidParameter,
            "deposit limits must satisfy 0 < min <= maxSingle <= maxTotal");
    }

    auto next = state_;
    next.limits = limits;
    commit(next, {});

    publishParameters(ctx, "limits", {
        {"minDeposit", limits.minDeposit},
        {"maxSingleDeposit", limits.maxSingleDeposit},
        {"maxTotalDeposits", limits.maxTotalDeposits}
    });
}

void Vault::setLiquidityBuffer(const domain::CallContext& ctx, std::uint64_t bufferBps) {
    ReentrancyGuard::Scope scope(guard_, "Vault");
    ctx.require(Role::ADMINISTRATOR);
    if (bufferBps > domain::BASIS) {
        throw domain::ValidationError(ErrorCode::InvalidParameter, "liquidity buffer above 10000 bps");
    }

    auto next = state_;
    next.liquidityBufferBps = bufferBps;
    commit(next, {});

    publishParameters(ctx, "liquidity_buffer", {{"liquidityBufferBps", bufferBps}});
}

void Vault::setMintingPaused(const domain::CallContext& ctx, bool paused) {
    ReentrancyGuard::Scope scope(guard_, "Vault");
    ctx.require(Role::ADMINISTRATOR);

    auto next = state_;
    next.mintingPaused = paused;
    commit(next, {});

    publishParameters(ctx, "pause", {{"mintingPaused", paused}, {"redeemingPaused", next.redeemingPaused}});
}

void Vault::setRedeemingPaused(const domain::CallContext& ctx, bool paused) {
    ReentrancyGuard::Scope scope(guard_, "Vault");
    ctx.require(Role::ADMINISTRATOR);

    auto next = state_;
    next.redeemingPaused = paused;
    commit(next, {});

    publishParameters(ctx, "pause", {{"mintingPaused", next.mintingPaused}, {"redeemingPaused", paused}});
}

void Vault::setStrategy(const domain::CallContext& ctx, std::shared_ptr<ports::input::IReserveStrategy> strategy) {
    ReentrancyGuard::Scope scope(guard_, "Vault");
    ctx.require(Role::ADMINISTRATOR);
    if (!strategy) {
        throw domain::ValidationError(ErrorCode::InvalidParameter, "strategy is null");
    }
    if (strategy_ && strategy_ != strategy) {
        auto remaining = strategy_->totalValue();
        if (remaining > 0) {
            throw domain::ValidationError(ErrorCode::InvalidParameter,
                "current strategy still holds " + std::to_string(remaining) + ", withdraw it first");
        }
    }

    strategy_ = std::move(strategy);
    publishParameters(ctx, "strategy", {{"account", strategy_->account()}});
}

Amount Vault::emergencyWithdrawFromStrategy(const domain::CallContext& ctx, bool liquidateVolatile) {
    ReentrancyGuard::Scope scope(guard_, "Vault");
    ctx.require(Role::ADMINISTRATOR);
    if (!strategy_) {
        throw domain::StateError(ErrorCode::StrategyNotSet, "no strategy attached");
    }

    auto recovered = strategy_->emergencyWithdraw(ctx, account_, liquidateVolatile);
    std::cout << "[Vault] Emergency withdraw by " << ctx.caller << " recovered " << recovered << std::endl;
    return recovered;
}

// ============================================================================
// Представления
// ============================================================================

Amount Vault::totalAssets() {
    auto lock = guard_.readLock();
    auto total = idleBalance() + heldVolatileValue();
    if (strategy_) {
        total += strategy_->totalValue();
    }
    return total;
}

Amount Vault::idleBalance() {
    return custody_->balanceOf(account_, AssetId::STABLE);
}

Amount Vault::heldVolatileValue() {
    auto held = custody_->balanceOf(account_, AssetId::VOLATILE);
    if (held == 0) {
        return 0;
    }
    auto volatilePrice = oracle_->read(AssetId::VOLATILE);
    auto stablePrice = oracle_->read(AssetId::STABLE);
    return domain::convertByPrice(held, volatilePrice, domain::VOLATILE_DECIMALS,
                                  stablePrice, domain::STABLE_DECIMALS);
}

Amount Vault::convertToShares(Amount assets) {
    auto lock = guard_.readLock();
    return toShares(assets, totalAssets(), state_.totalShares, false);
}

Amount Vault::convertToAssets(Amount shares) {
    auto lock = guard_.readLock();
    return toAssets(shares, totalAssets(), state_.totalShares, false);
}

Amount Vault::previewDeposit(Amount assets) {
    return convertToShares(assets);
}

Amount Vault::previewMint(Amount shares) {
    auto lock = guard_.readLock();
    return toAssets(shares, totalAssets(), state_.totalShares, true);
}

Amount Vault::previewWithdraw(Amount assets) {
    auto lock = guard_.readLock();
    return toShares(assets, totalAssets(), state_.totalShares, true);
}

Amount Vault::previewRedeem(Amount shares) {
    return convertToAssets(shares);
}

Amount Vault::maxDeposit(const std::string&) {
    auto lock = guard_.readLock();
    if (state_.mintingPaused) {
        return 0;
    }
    auto room = domain::saturatingSub(state_.limits.maxTotalDeposits, totalAssets());
    auto cap = std::min(room, state_.limits.maxSingleDeposit);
    return cap < state_.limits.minDeposit ? 0 : cap;
}

Amount Vault::maxRedeem(const std::string& owner) {
    auto lock = guard_.readLock();
    return state_.redeemingPaused ? 0 : state_.balanceOf(owner);
}

Amount Vault::balanceOf(const std::string& holder) const {
    auto lock = guard_.readLock();
    return state_.balanceOf(holder);
}

Amount Vault::totalShares() const {
    auto lock = guard_.readLock();
    return state_.totalShares;
}

Amount Vault::assetsPerShare() {
    auto lock = guard_.readLock();
    return assetsPerShareOf(totalAssets(), state_.totalShares);
}

std::uint64_t Vault::collateralRatio() {
    auto lock = guard_.readLock();
    Amount reserve = heldVolatileValue();
    Amount cash = idleBalance();
    if (strategy_) {
        reserve += strategy_->volatileValue();
        cash += strategy_->cashReserveValue() + strategy_->freeStableBalance();
    }
    auto liabilities = toAssets(state_.totalShares, reserve + cash, state_.totalShares, false);
    return domain::RateController::collateralRatio(reserve, cash, liabilities);
}

Amount Vault::projectedAnnualDividend() {
    auto lock = guard_.readLock();
    return domain::mulDiv(totalAssets(), state_.currentRateBps, domain::BASIS);
}

domain::UnixSeconds Vault::nextEpochAt() const {
    auto lock = guard_.readLock();
    return state_.lastEpochTimestamp + state_.epochDuration;
}

domain::VaultState Vault::state() const {
    auto lock = guard_.readLock();
    return state_;
}

// ============================================================================
// Private
// ============================================================================

Amount Vault::toShares(Amount assets, Amount totalAssets, Amount totalShares, bool roundUp) {
    auto virtualShares = totalShares + domain::VIRTUAL_SHARES;
    auto virtualAssets = totalAssets + domain::VIRTUAL_ASSETS;
    return roundUp ? domain::mulDivUp(assets, virtualShares, virtualAssets)
                   : domain::mulDiv(assets, virtualShares, virtualAssets);
}

Amount Vault::toAssets(Amount shares, Amount totalAssets, Amount totalShares, bool roundUp) {
    auto virtualShares = totalShares + domain::VIRTUAL_SHARES;
    auto virtualAssets = totalAssets + domain::VIRTUAL_ASSETS;
    return roundUp ? domain::mulDivUp(shares, virtualAssets, virtualShares)
                   : domain::mulDiv(shares, virtualAssets, virtualShares);
}

Amount Vault::assetsPerShareOf(Amount totalAssets, Amount totalShares) {
    constexpr Amount WHOLE_SHARE = 1000000000ULL;   // 10^SHARE_DECIMALS
    domain::detail::Wide value = domain::detail::Wide(totalAssets + domain::VIRTUAL_ASSETS) * WHOLE_SHARE
                               / (totalShares + domain::VIRTUAL_SHARES);
    if (value > domain::detail::Wide(std::numeric_limits<Amount>::max())) {
        return std::numeric_limits<Amount>::max();
    }
    return value.convert_to<Amount>();
}

void Vault::validateDeposit(Amount assets, Amount totalAssets) const {
    const auto& limits = state_.limits;
    if (state_.mintingPaused) {
        throw domain::StateError(ErrorCode::MintingPaused, "minting is paused");
    }
    if (assets < limits.minDeposit) {
        throw domain::ValidationError(ErrorCode::DepositTooSmall,
            std::to_string(assets) + " is below the minimum " + std::to_string(limits.minDeposit));
    }
    if (assets > limits.maxSingleDeposit) {
        throw domain::ValidationError(ErrorCode::DepositTooLarge,
            std::to_string(assets) + " is above the single deposit limit " + std::to_string(limits.maxSingleDeposit));
    }
    if (totalAssets + assets > limits.maxTotalDeposits) {
        throw domain::ValidationError(ErrorCode::DepositCapExceeded,
            "deposit would bring total assets to " + std::to_string(totalAssets + assets)
            + ", cap is " + std::to_string(limits.maxTotalDeposits));
    }
}

Amount Vault::mintShares(const domain::CallContext& ctx, Amount assets, Amount shares, const std::string& receiver) {
    // Перевод со своего же счёта не пополняет totalAssets
    if (ctx.caller == account_ || (strategy_ && ctx.caller == strategy_->account())) {
        throw domain::StateError(ErrorCode::Unauthorized,
            "'" + ctx.caller + "' is a treasury account and cannot buy shares");
    }
    auto callerBalance = custody_->balanceOf(ctx.caller, AssetId::STABLE);
    if (callerBalance < assets) {
        throw domain::StateError(ErrorCode::InsufficientBalance,
            ctx.caller + " holds " + std::to_string(callerBalance) + ", needs " + std::to_string(assets));
    }

    custody_->transfer(AssetId::STABLE, ctx.caller, account_, assets);

    auto next = state_;
    next.shareBalances[receiver] += shares;
    next.totalShares += shares;
    try {
        commit(next, {receiver});
    } catch (const std::exception& e) {
        std::cerr << "[Vault] Failed to record deposit, refunding " << ctx.caller << ": " << e.what() << std::endl;
        custody_->transfer(AssetId::STABLE, account_, ctx.caller, assets);
        throw;
    }

    domain::DepositedEvent event;
    event.sender = ctx.caller;
    event.owner = receiver;
    event.assets = assets;
    event.shares = shares;
    publish(event);

    std::cout << "[Vault] Deposit " << assets << " from " << ctx.caller
              << " -> " << shares << " shares to " << receiver << std::endl;

    deployIdle();
    return assets;
}

void Vault::burnShares(const domain::CallContext& ctx, Amount assets, Amount shares,
                       const std::string& receiver, const std::string& owner) {
    ensureLiquidity(assets);

    auto previous = state_;
    auto next = state_;
    next.shareBalances[owner] -= shares;
    if (next.shareBalances[owner] == 0) {
        next.shareBalances.erase(owner);
    }
    next.totalShares -= shares;
    commit(next, {owner});

    try {
        custody_->transfer(AssetId::STABLE, account_, receiver, assets);
    } catch (const std::exception& e) {
        std::cerr << "[Vault] Payout to " << receiver << " failed, restoring shares: " << e.what() << std::endl;
        commit(previous, {owner});
        throw;
    }

    domain::WithdrawnEvent event;
    event.sender = ctx.caller;
    event.receiver = receiver;
    event.owner = owner;
    event.assets = assets;
    event.shares = shares;
    publish(event);

    std::cout << "[Vault] Withdraw " << assets << " to " << receiver
              << " burning " << shares << " shares of " << owner << std::endl;
}

void Vault::ensureLiquidity(Amount required) {
    auto idle = idleBalance();
    if (idle >= required) {
        return;
    }

    auto shortfall = required - idle;
    if (!strategy_) {
        throw domain::StateError(ErrorCode::InsufficientLiquidity,
            "idle " + std::to_string(idle) + " below " + std::to_string(required) + " and no strategy attached");
    }

    std::cout << "[Vault] Pulling " << shortfall << " from strategy" << std::endl;
    strategy_->withdraw(orchestrator_, shortfall);

    idle = idleBalance();
    if (idle < required) {
        throw domain::StateError(ErrorCode::InsufficientLiquidity,
            "only " + std::to_string(idle) + " available of " + std::to_string(required));
    }
}

Amount Vault::deployIdle() {
    if (!strategy_) {
        return 0;
    }
    if (strategy_->circuitBreakerTripped()) {
        std::cout << "[Vault] Strategy breaker tripped, keeping funds idle" << std::endl;
        return 0;
    }

    auto idle = idleBalance();
    auto buffer = std::max(domain::mulDiv(idle, state_.liquidityBufferBps, domain::BASIS), state_.limits.minDeposit);
    if (idle <= buffer) {
        return 0;
    }

    auto amount = idle - buffer;
    try {
        custody_->transfer(AssetId::STABLE, account_, strategy_->account(), amount);
        strategy_->deploy(orchestrator_, amount);
    } catch (const domain::TreasuryError& e) {
        std::cerr << "[Vault] Deploy of " << amount << " deferred: " << e.what() << std::endl;

        // Неразмещённый остаток возвращается в idle хранилища
        auto stranded = std::min(amount, custody_->balanceOf(strategy_->account(), AssetId::STABLE));
        if (stranded > 0) {
            custody_->transfer(AssetId::STABLE, strategy_->account(), account_, stranded);
            std::cout << "[Vault] Returned " << stranded << " undeployed from strategy" << std::endl;
        }

        domain::DeployDeferredEvent event;
        event.amount = amount;
        event.reason = domain::toString(e.code());
        publish(event);
        return 0;
    }
    return amount;
}

void Vault::commit(domain::VaultState next, const std::set<std::string>& touchedHolders) {
    repository_->save(next, touchedHolders);
    state_ = std::move(next);
}

void Vault::publish(domain::DomainEvent& event) {
    event.occurredAt = clock_->now();
    eventPublisher_->publish(event.eventType, event.toJson());
}

void Vault::publishParameters(const domain::CallContext& ctx, const std::string& parameter,
                              const nlohmann::json& values) {
    domain::ParametersUpdatedEvent event;
    event.changedBy = ctx.caller;
    event.parameter = parameter;
    event.values = values;
    publish(event);

    std::cout << "[Vault] " << parameter << " updated by " << ctx.caller << ": " << values.dump() << std::endl;
}

} // namespace treasury::application
