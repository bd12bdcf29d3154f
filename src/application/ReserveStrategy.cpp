// src/application/ReserveStrategy.cpp
#include "application/ReserveStrategy.hpp"
#include <algorithm>
#include <iostream>
#include <limits>

namespace treasury::application {

using domain::Amount;
using domain::AssetId;
using domain::ErrorCode;
using domain::Price;
using domain::Role;

ReserveStrategy::ReserveStrategy(
    std::shared_ptr<settings::IStrategySettings> settings,
    std::shared_ptr<ports::output::IAssetCustody> custody,
    std::shared_ptr<ports::output::ISwapVenue> swapVenue,
    std::shared_ptr<ports::output::ILendingVenue> lendingVenue,
    std::shared_ptr<OracleGuard> oracle,
    std::shared_ptr<ports::output::IClock> clock,
    std::shared_ptr<ports::output::IStrategyStateRepository> repository,
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher
) : custody_(std::move(custody))
  , swapVenue_(std::move(swapVenue))
  , lendingVenue_(std::move(lendingVenue))
  , oracle_(std::move(oracle))
  , clock_(std::move(clock))
  , repository_(std::move(repository))
  , eventPublisher_(std::move(eventPublisher))
  , account_(settings->getAccount())
{
    auto stored = repository_->load();
    if (stored) {
        state_ = *stored;
        std::cout << "[ReserveStrategy] Restored state: volatileHeld=" << state_.volatileHeld
                  << " cashDeployed=" << state_.cashDeployed
                  << " breaker=" << (state_.circuitBreakerTripped ? "TRIPPED" : "ok") << std::endl;
    } else {
        state_ = initialState(*settings);
        repository_->save(state_);
        std::cout << "[ReserveStrategy] Created account=" << account_
                  << " allocation=" << state_.allocation.volatileBps << "/" << state_.allocation.cashBps
                  << std::endl;
    }
}

domain::StrategyState ReserveStrategy::initialState(const settings::IStrategySettings& settings) {
    domain::StrategyState state;
    state.allocation = settings.getAllocation();
    state.maxSlippageBps = settings.getMaxSlippageBps();
    state.breakerThresholdBps = settings.getBreakerThresholdBps();
    state.breakerWindowSeconds = settings.getBreakerWindowSeconds();
    state.swapDeadlineSeconds = settings.getSwapDeadlineSeconds();

    if (state.allocation.volatileBps + state.allocation.cashBps != domain::BASIS) {
        throw domain::ValidationError(ErrorCode::InvalidParameter, "allocation must sum to 10000 bps");
    }
    if (state.maxSlippageBps >= domain::BASIS) {
        throw domain::ValidationError(ErrorCode::InvalidParameter, "max slippage must be below 10000 bps");
    }
    return state;
}

// ============================================================================
// Движение капитала
// ============================================================================

void ReserveStrategy::deploy(const domain::CallContext& ctx, Amount amount) {
    ReentrancyGuard::Scope scope(guard_, "ReserveStrategy");
    ctx.require(Role::ORCHESTRATOR);
    if (amount == 0) {
        throw domain::ValidationError(ErrorCode::ZeroAmount, "deploy amount is zero");
    }

    auto next = state_;
    auto volatilePrice = checkCircuitBreaker(next);
    auto stablePrice = oracle_->read(AssetId::STABLE);

    auto free = stableBalance();
    if (free < amount) {
        throw domain::StateError(ErrorCode::InsufficientBalance,
            "strategy holds " + std::to_string(free) + ", deploy requested " + std::to_string(amount));
    }

    domain::CapitalDeployedEvent event;
    event.amount = amount;
    event.swappedStable = domain::mulDiv(amount, next.allocation.volatileBps, domain::BASIS);
    event.cashSupplied = amount - event.swappedStable;

    try {
        if (event.swappedStable > 0) {
            event.volatileReceived = buyVolatile(event.swappedStable, volatilePrice, stablePrice, next);
        }
        if (event.cashSupplied > 0) {
            lendingVenue_->supply(AssetId::STABLE, event.cashSupplied, account_);
            next.cashDeployed += event.cashSupplied;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ReserveStrategy] deploy failed: " << e.what() << std::endl;
        commit(next);
        throw;
    }

    commit(next);
    publish(event);

    std::cout << "[ReserveStrategy] Deployed " << amount
              << ": volatile +" << event.volatileReceived
              << ", cash +" << event.cashSupplied << std::endl;
}

Amount ReserveStrategy::withdraw(const domain::CallContext& ctx, Amount amount) {
    ReentrancyGuard::Scope scope(guard_, "ReserveStrategy");
    ctx.require(Role::ORCHESTRATOR);
    if (amount == 0) {
        throw domain::ValidationError(ErrorCode::ZeroAmount, "withdraw amount is zero");
    }

    auto next = state_;
    auto volatilePrice = checkCircuitBreaker(next);
    auto stablePrice = oracle_->read(AssetId::STABLE);

    domain::CapitalWithdrawnEvent event;
    event.recipient = ctx.caller;
    event.requested = amount;

    try {
        auto available = stableBalance();

        if (available < amount) {
            auto fromCash = std::min(amount - available, lendingVenue_->balanceOf(AssetId::STABLE, account_));
            if (fromCash > 0) {
                event.fromCash = withdrawFromLending(fromCash, next);
                available += event.fromCash;
            }
        }

        if (available < amount && next.volatileHeld > 0) {
            auto sold = liquidate(amount - available, next, volatilePrice, stablePrice);
            event.volatileSold = sold.volatileSold;
            available += sold.stableReceived;
        }

        event.delivered = std::min(amount, available);
        if (event.delivered > 0) {
            custody_->transfer(AssetId::STABLE, account_, ctx.caller, event.delivered);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ReserveStrategy] withdraw failed: " << e.what() << std::endl;
        commit(next);
        throw;
    }

    commit(next);
    publish(event);

    std::cout << "[ReserveStrategy] Withdrawn " << event.delivered << "/" << amount
              << " to " << ctx.caller
              << " (cash " << event.fromCash << ", volatile sold " << event.volatileSold << ")"
              << std::endl;
    return event.delivered;
}

void ReserveStrategy::rebalance(const domain::CallContext& ctx, bool sellVolatile, Amount amount) {
    ReentrancyGuard::Scope scope(guard_, "ReserveStrategy");
    ctx.require(Role::ORCHESTRATOR);
    if (amount == 0) {
        throw domain::ValidationError(ErrorCode::ZeroAmount, "rebalance amount is zero");
    }

    auto next = state_;
    auto volatilePrice = checkCircuitBreaker(next);
    auto stablePrice = oracle_->read(AssetId::STABLE);

    domain::ReserveRebalancedEvent event;
    event.sellVolatile = sellVolatile;
    event.amount = amount;

    if (sellVolatile && next.volatileHeld == 0) {
        throw domain::StateError(ErrorCode::InsufficientReserve, "no volatile position to sell");
    }
    if (!sellVolatile) {
        auto liveCash = lendingVenue_->balanceOf(AssetId::STABLE, account_);
        if (amount > liveCash) {
            throw domain::StateError(ErrorCode::InsufficientReserve,
                "cash reserve " + std::to_string(liveCash) + " is below " + std::to_string(amount));
        }
    }

    try {
        if (sellVolatile) {
            auto sold = liquidate(amount, next, volatilePrice, stablePrice);
            event.volatileDelta = sold.volatileSold;
            if (sold.stableReceived > 0) {
                lendingVenue_->supply(AssetId::STABLE, sold.stableReceived, account_);
                next.cashDeployed += sold.stableReceived;
                event.cashDelta = sold.stableReceived;
            }
        } else {
            event.cashDelta = withdrawFromLending(amount, next);
            if (event.cashDelta > 0) {
                event.volatileDelta = buyVolatile(event.cashDelta, volatilePrice, stablePrice, next);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ReserveStrategy] rebalance failed: " << e.what() << std::endl;
        commit(next);
        throw;
    }

    commit(next);
    publish(event);

    std::cout << "[ReserveStrategy] Rebalanced " << (sellVolatile ? "volatile -> cash" : "cash -> volatile")
              << ": volatile " << event.volatileDelta << ", cash " << event.cashDelta << std::endl;
}

Amount ReserveStrategy::harvestYield(const domain::CallContext& ctx) {
    ReentrancyGuard::Scope scope(guard_, "ReserveStrategy");
    ctx.require(Role::ORCHESTRATOR);

    auto live = lendingVenue_->balanceOf(AssetId::STABLE, account_);
    if (live <= state_.cashDeployed) {
        std::cout << "[ReserveStrategy] Nothing to harvest" << std::endl;
        return 0;
    }

    auto before = stableBalance();
    lendingVenue_->withdraw(AssetId::STABLE, live - state_.cashDeployed, account_);
    auto harvested = domain::saturatingSub(stableBalance(), before);
    if (harvested > 0) {
        custody_->transfer(AssetId::STABLE, account_, ctx.caller, harvested);
    }

    domain::YieldHarvestedEvent event;
    event.recipient = ctx.caller;
    event.amount = harvested;
    publish(event);

    std::cout << "[ReserveStrategy] Harvested " << harvested << " to " << ctx.caller << std::endl;
    return harvested;
}

// ============================================================================
// Администрирование
// ============================================================================

Amount ReserveStrategy::emergencyWithdraw(const domain::CallContext& ctx,
                                          const std::string& recipient,
                                          bool liquidateVolatile) {
    ReentrancyGuard::Scope scope(guard_, "ReserveStrategy");
    ctx.require(Role::ADMINISTRATOR);
    if (recipient.empty()) {
        throw domain::ValidationError(ErrorCode::InvalidRecipient, "emergency recipient is empty");
    }

    auto next = state_;

    domain::CapitalWithdrawnEvent event;
    event.recipient = recipient;
    event.emergency = true;

    try {
        auto liveCash = lendingVenue_->balanceOf(AssetId::STABLE, account_);
        if (liveCash > 0) {
            event.fromCash = withdrawFromLending(liveCash, next);
            next.cashDeployed = 0;
        }

        if (next.volatileHeld > 0) {
            if (liquidateVolatile) {
                auto volatilePrice = oracle_->read(AssetId::VOLATILE);
                auto stablePrice = oracle_->read(AssetId::STABLE);
                auto sold = liquidate(std::numeric_limits<Amount>::max(), next, volatilePrice, stablePrice);
                event.volatileSold = sold.volatileSold;
            } else {
                custody_->transfer(AssetId::VOLATILE, account_, recipient, next.volatileHeld);
                next.volatileHeld = 0;
            }
        }

        event.delivered = stableBalance();
        if (event.delivered > 0) {
            custody_->transfer(AssetId::STABLE, account_, recipient, event.delivered);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ReserveStrategy] emergencyWithdraw failed: " << e.what() << std::endl;
        commit(next);
        throw;
    }

    event.requested = event.delivered;
    commit(next);
    publish(event);

    std::cout << "[ReserveStrategy] EMERGENCY withdraw by " << ctx.caller
              << ": " << event.delivered << " stable to " << recipient << std::endl;
    return event.delivered;
}

void ReserveStrategy::setAllocation(const domain::CallContext& ctx, const domain::Allocation& allocation) {
    ReentrancyGuard::Scope scope(guard_, "ReserveStrategy");
    ctx.require(Role::ADMINISTRATOR);
    if (allocation.volatileBps + allocation.cashBps != domain::BASIS) {
        throw domain::ValidationError(ErrorCode::InvalidParameter, "allocation must sum to 10000 bps");
    }

    auto next = state_;
    next.allocation = allocation;
    commit(next);

    std::cout << "[ReserveStrategy] Allocation set to " << allocation.volatileBps
              << "/" << allocation.cashBps << " by " << ctx.caller << std::endl;
}

void ReserveStrategy::setMaxSlippage(const domain::CallContext& ctx, std::uint64_t maxSlippageBps) {
    ReentrancyGuard::Scope scope(guard_, "ReserveStrategy");
    ctx.require(Role::ADMINISTRATOR);
    if (maxSlippageBps >= domain::BASIS) {
        throw domain::ValidationError(ErrorCode::InvalidParameter, "max slippage must be below 10000 bps");
    }

    auto next = state_;
    next.maxSlippageBps = maxSlippageBps;
    commit(next);

    std::cout << "[ReserveStrategy] Max slippage set to " << maxSlippageBps << " bps" << std::endl;
}

void ReserveStrategy::setBreakerConfig(const domain::CallContext& ctx, std::uint64_t thresholdBps,
                                       domain::UnixSeconds windowSeconds) {
    ReentrancyGuard::Scope scope(guard_, "ReserveStrategy");
    ctx.require(Role::ADMINISTRATOR);
    if (thresholdBps == 0 || thresholdBps > domain::BASIS || windowSeconds <= 0) {
        throw domain::ValidationError(ErrorCode::InvalidParameter, "breaker threshold or window out of range");
    }

    auto next = state_;
    next.breakerThresholdBps = thresholdBps;
    next.breakerWindowSeconds = windowSeconds;
    commit(next);

    std::cout << "[ReserveStrategy] Breaker: " << thresholdBps << " bps within "
              << windowSeconds << "s" << std::endl;
}

void ReserveStrategy::resetCircuitBreaker(const domain::CallContext& ctx) {
    ReentrancyGuard::Scope scope(guard_, "ReserveStrategy");
    ctx.require(Role::ADMINISTRATOR);

    auto price = oracle_->read(AssetId::VOLATILE);

    auto next = state_;
    next.circuitBreakerTripped = false;
    next.lastObservedPrice = price;
    next.lastObservedTimestamp = clock_->now();
    commit(next);

    domain::CircuitBreakerResetEvent event;
    event.resetBy = ctx.caller;
    event.checkpointPrice = price;
    publish(event);

    std::cout << "[ReserveStrategy] Circuit breaker reset by " << ctx.caller
              << ", checkpoint=" << price << std::endl;
}

// ============================================================================
// Оценка
// ============================================================================

Amount ReserveStrategy::totalValue() {
    auto lock = guard_.readLock();
    return freeStableBalance() + cashReserveValue() + volatileValue();
}

Amount ReserveStrategy::volatileValue() {
    auto held = volatileHeld();
    if (held == 0) {
        return 0;
    }
    auto volatilePrice = oracle_->read(AssetId::VOLATILE);
    auto stablePrice = oracle_->read(AssetId::STABLE);
    return domain::convertByPrice(held, volatilePrice, domain::VOLATILE_DECIMALS,
                                  stablePrice, domain::STABLE_DECIMALS);
}

Amount ReserveStrategy::cashReserveValue() {
    return lendingVenue_->balanceOf(AssetId::STABLE, account_);
}

Amount ReserveStrategy::freeStableBalance() {
    return stableBalance();
}

Amount ReserveStrategy::volatileHeld() const {
    auto lock = guard_.readLock();
    return state_.volatileHeld;
}

bool ReserveStrategy::circuitBreakerTripped() const {
    auto lock = guard_.readLock();
    return state_.circuitBreakerTripped;
}

domain::StrategyState ReserveStrategy::state() const {
    auto lock = guard_.readLock();
    return state_;
}

// ============================================================================
// Private
// ============================================================================

Price ReserveStrategy::checkCircuitBreaker(domain::StrategyState& next) {
    if (next.circuitBreakerTripped) {
        throw domain::StateError(ErrorCode::CircuitBreakerActive,
            "circuit breaker is tripped, administrator reset required");
    }

    auto price = oracle_->read(AssetId::VOLATILE);
    auto now = clock_->now();

    if (next.lastObservedPrice <= 0 || now - next.lastObservedTimestamp > next.breakerWindowSeconds) {
        next.lastObservedPrice = price;
        next.lastObservedTimestamp = now;
        return price;
    }

    if (price < next.lastObservedPrice) {
        auto checkpoint = static_cast<Amount>(next.lastObservedPrice);
        auto dropBps = domain::mulDiv(checkpoint - static_cast<Amount>(price), domain::BASIS, checkpoint);

        if (dropBps > next.breakerThresholdBps) {
            auto tripped = state_;
            tripped.circuitBreakerTripped = true;
            commit(tripped);

            domain::CircuitBreakerTrippedEvent event;
            event.checkpointPrice = next.lastObservedPrice;
            event.currentPrice = price;
            event.dropBps = dropBps;
            publish(event);

            std::cerr << "[ReserveStrategy] CIRCUIT BREAKER TRIPPED: price " << next.lastObservedPrice
                      << " -> " << price << " (" << dropBps << " bps)" << std::endl;
            throw domain::StateError(ErrorCode::CircuitBreakerActive,
                "volatile price dropped " + std::to_string(dropBps) + " bps within the breaker window");
        }
    }

    return price;
}

Amount ReserveStrategy::buyVolatile(Amount stableAmount, Price volatilePrice,
                                    Price stablePrice, domain::StrategyState& next) {
    auto expectedOut = domain::convertByPrice(stableAmount, stablePrice, domain::STABLE_DECIMALS,
                                              volatilePrice, domain::VOLATILE_DECIMALS);
    auto minOut = domain::mulDiv(expectedOut, domain::BASIS - next.maxSlippageBps, domain::BASIS);

    auto stableBefore = stableBalance();
    auto volatileBefore = volatileBalance();

    auto reported = swapVenue_->swapExactInput(AssetId::STABLE, AssetId::VOLATILE,
                                               stableAmount, minOut, deadline(next), account_);

    auto received = domain::saturatingSub(volatileBalance(), volatileBefore);
    auto spent = domain::saturatingSub(stableBefore, stableBalance());
    next.volatileHeld += received;

    if (reported != received) {
        std::cerr << "[ReserveStrategy] Venue reported " << reported
                  << " volatile, balance grew by " << received << std::endl;
    }
    if (spent > stableAmount) {
        throw domain::ExecutionError(ErrorCode::VenueFailure,
            "swap spent " + std::to_string(spent) + ", allowed " + std::to_string(stableAmount));
    }
    if (received < minOut) {
        throw domain::ExecutionError(ErrorCode::SlippageExceeded,
            "swap delivered " + std::to_string(received) + ", minimum " + std::to_string(minOut));
    }
    return received;
}

ReserveStrategy::Liquidation ReserveStrategy::liquidate(Amount stableNeeded, domain::StrategyState& next,
                                                        Price volatilePrice, Price stablePrice) {
    Liquidation result;
    if (stableNeeded == 0 || next.volatileHeld == 0) {
        return result;
    }

    auto heldValue = domain::convertByPrice(next.volatileHeld, volatilePrice, domain::VOLATILE_DECIMALS,
                                            stablePrice, domain::STABLE_DECIMALS);
    bool sellAll = stableNeeded >= heldValue;

    auto stableBefore = stableBalance();
    auto volatileBefore = volatileBalance();

    if (sellAll) {
        auto minOut = domain::mulDiv(heldValue, domain::BASIS - next.maxSlippageBps, domain::BASIS);
        swapVenue_->swapExactInput(AssetId::VOLATILE, AssetId::STABLE,
                                   next.volatileHeld, minOut, deadline(next), account_);
    } else {
        auto expectedIn = domain::convertByPrice(stableNeeded, stablePrice, domain::STABLE_DECIMALS,
                                                 volatilePrice, domain::VOLATILE_DECIMALS, true);
        auto maxIn = std::min(domain::mulDiv(expectedIn, domain::BASIS + next.maxSlippageBps, domain::BASIS),
                              next.volatileHeld);
        swapVenue_->swapExactOutput(AssetId::VOLATILE, AssetId::STABLE,
                                    stableNeeded, maxIn, deadline(next), account_);
    }

    result.stableReceived = domain::saturatingSub(stableBalance(), stableBefore);
    result.volatileSold = domain::saturatingSub(volatileBefore, volatileBalance());

    if (result.volatileSold > next.volatileHeld) {
        auto oversold = result.volatileSold;
        next.volatileHeld = 0;
        throw domain::ExecutionError(ErrorCode::VenueFailure,
            "swap took " + std::to_string(oversold) + " volatile, position was smaller");
    }
    next.volatileHeld -= result.volatileSold;

    auto fairOut = domain::convertByPrice(result.volatileSold, volatilePrice, domain::VOLATILE_DECIMALS,
                                          stablePrice, domain::STABLE_DECIMALS);
    auto minOut = domain::mulDiv(fairOut, domain::BASIS - next.maxSlippageBps, domain::BASIS);
    if (result.stableReceived < minOut) {
        throw domain::ExecutionError(ErrorCode::SlippageExceeded,
            "liquidation delivered " + std::to_string(result.stableReceived)
            + ", minimum " + std::to_string(minOut));
    }
    if (!sellAll && result.stableReceived < stableNeeded) {
        throw domain::ExecutionError(ErrorCode::VenueFailure,
            "swap delivered " + std::to_string(result.stableReceived)
            + ", requested " + std::to_string(stableNeeded));
    }
    return result;
}

Amount ReserveStrategy::withdrawFromLending(Amount amount, domain::StrategyState& next) {
    auto before = stableBalance();
    auto reported = lendingVenue_->withdraw(AssetId::STABLE, amount, account_);
    auto received = domain::saturatingSub(stableBalance(), before);

    if (reported != received) {
        std::cerr << "[ReserveStrategy] Lending venue reported " << reported
                  << ", balance grew by " << received << std::endl;
    }
    next.cashDeployed = domain::saturatingSub(next.cashDeployed, received);
    return received;
}

Amount ReserveStrategy::stableBalance() {
    return custody_->balanceOf(account_, AssetId::STABLE);
}

Amount ReserveStrategy::volatileBalance() {
    return custody_->balanceOf(account_, AssetId::VOLATILE);
}

domain::UnixSeconds ReserveStrategy::deadline(const domain::StrategyState& next) const {
    return clock_->now() + next.swapDeadlineSeconds;
}

void ReserveStrategy::commit(domain::StrategyState next) {
    repository_->save(next);
    state_ = std::move(next);
}

void ReserveStrategy::publish(domain::DomainEvent& event) {
    event.occurredAt = clock_->now();
    eventPublisher_->publish(event.eventType, event.toJson());
}

} // namespace treasury::application
