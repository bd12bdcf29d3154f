// src/adapters/secondary/venues/SimulatedSwapVenue.cpp
#include "adapters/secondary/venues/SimulatedSwapVenue.hpp"
#include <iostream>

namespace treasury::adapters::secondary {

using domain::Amount;
using domain::AssetId;
using domain::ErrorCode;

namespace {
const std::string VENUE_ACCOUNT = "swap-venue";
}

SimulatedSwapVenue::SimulatedSwapVenue(
    std::shared_ptr<SimulatedCustody> custody,
    std::shared_ptr<ports::output::IPriceOracle> oracle,
    std::shared_ptr<ports::output::IClock> clock,
    std::uint64_t feeBps)
    : custody_(std::move(custody))
    , oracle_(std::move(oracle))
    , clock_(std::move(clock))
    , feeBps_(feeBps)
{
    if (feeBps_ >= domain::BASIS) {
        throw domain::ValidationError(ErrorCode::InvalidParameter, "swap fee must be below 10000 bps");
    }
    std::cout << "[SimulatedSwapVenue] Created, fee=" << feeBps_ << " bps" << std::endl;
}

// ============================================================================
// ISwapVenue
// ============================================================================

Amount SimulatedSwapVenue::swapExactInput(AssetId assetIn, AssetId assetOut, Amount amountIn,
                                          Amount minAmountOut, domain::UnixSeconds deadline,
                                          const std::string& account) {
    auto rateBps = prepare(deadline);
    auto amountOut = quoteOut(assetIn, assetOut, amountIn, rateBps);

    if (amountOut < minAmountOut) {
        std::cerr << "[SimulatedSwapVenue] Slippage: out=" << amountOut
                  << " min=" << minAmountOut << std::endl;
        throw domain::ExecutionError(ErrorCode::SlippageExceeded,
            "output " + std::to_string(amountOut) + " below minimum " + std::to_string(minAmountOut));
    }

    settle(assetIn, assetOut, amountIn, amountOut, account);
    std::cout << "[SimulatedSwapVenue] " << account << " sold " << amountIn << " "
              << domain::toString(assetIn) << " for " << amountOut << " "
              << domain::toString(assetOut) << std::endl;
    return reported(amountOut);
}

Amount SimulatedSwapVenue::swapExactOutput(AssetId assetIn, AssetId assetOut, Amount amountOut,
                                           Amount maxAmountIn, domain::UnixSeconds deadline,
                                           const std::string& account) {
    auto rateBps = prepare(deadline);
    auto amountIn = quoteIn(assetIn, assetOut, amountOut, rateBps);

    if (amountIn > maxAmountIn) {
        std::cerr << "[SimulatedSwapVenue] Slippage: in=" << amountIn
                  << " max=" << maxAmountIn << std::endl;
        throw domain::ExecutionError(ErrorCode::SlippageExceeded,
            "input " + std::to_string(amountIn) + " above maximum " + std::to_string(maxAmountIn));
    }

    settle(assetIn, assetOut, amountIn, amountOut, account);
    std::cout << "[SimulatedSwapVenue] " << account << " bought " << amountOut << " "
              << domain::toString(assetOut) << " for " << amountIn << " "
              << domain::toString(assetIn) << std::endl;
    return reported(amountIn);
}

// ============================================================================
// Методы для тестов
// ============================================================================

void SimulatedSwapVenue::setFeeBps(std::uint64_t feeBps) {
    std::lock_guard<std::mutex> lock(mutex_);
    feeBps_ = feeBps;
}

void SimulatedSwapVenue::setPriceImpactBps(std::uint64_t impactBps) {
    std::lock_guard<std::mutex> lock(mutex_);
    impactBps_ = impactBps;
}

void SimulatedSwapVenue::setExecutionDelay(domain::UnixSeconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    executionDelay_ = delay;
}

void SimulatedSwapVenue::setReportSkew(std::int64_t skew) {
    std::lock_guard<std::mutex> lock(mutex_);
    reportSkew_ = skew;
}

void SimulatedSwapVenue::setBeforeSwapHook(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    beforeSwap_ = std::move(hook);
}

void SimulatedSwapVenue::failNextSwap() {
    std::lock_guard<std::mutex> lock(mutex_);
    failNext_ = true;
}

std::size_t SimulatedSwapVenue::swapCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return swapCount_;
}

// ============================================================================
// Private
// ============================================================================

std::uint64_t SimulatedSwapVenue::prepare(domain::UnixSeconds deadline) {
    std::function<void()> hook;
    std::uint64_t cost = 0;
    domain::UnixSeconds delay = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hook = beforeSwap_;
        cost = feeBps_ + impactBps_;
        delay = executionDelay_;
        if (failNext_) {
            failNext_ = false;
            throw domain::ExecutionError(ErrorCode::VenueFailure, "swap venue unavailable");
        }
    }

    // Колбэк вызывается без блокировки площадки
    if (hook) {
        hook();
    }

    auto executedAt = clock_->now() + delay;
    if (executedAt > deadline) {
        throw domain::ExecutionError(ErrorCode::DeadlineExpired,
            "executed at " + std::to_string(executedAt) + ", deadline " + std::to_string(deadline));
    }
    if (cost >= domain::BASIS) {
        throw domain::ExecutionError(ErrorCode::VenueFailure, "no liquidity at this fee level");
    }
    return domain::BASIS - cost;
}

Amount SimulatedSwapVenue::quoteOut(AssetId assetIn, AssetId assetOut, Amount amountIn, std::uint64_t rateBps) {
    auto priceIn = oracle_->latestPrice(assetIn).price;
    auto priceOut = oracle_->latestPrice(assetOut).price;
    if (priceIn <= 0 || priceOut <= 0) {
        throw domain::ExecutionError(ErrorCode::VenueFailure, "no market for the pair");
    }
    auto fair = domain::convertByPrice(amountIn, priceIn, domain::decimalsOf(assetIn),
                                       priceOut, domain::decimalsOf(assetOut));
    return domain::mulDiv(fair, rateBps, domain::BASIS);
}

Amount SimulatedSwapVenue::quoteIn(AssetId assetIn, AssetId assetOut, Amount amountOut, std::uint64_t rateBps) {
    auto priceIn = oracle_->latestPrice(assetIn).price;
    auto priceOut = oracle_->latestPrice(assetOut).price;
    if (priceIn <= 0 || priceOut <= 0) {
        throw domain::ExecutionError(ErrorCode::VenueFailure, "no market for the pair");
    }
    auto fair = domain::convertByPrice(amountOut, priceOut, domain::decimalsOf(assetOut),
                                       priceIn, domain::decimalsOf(assetIn), true);
    return domain::mulDivUp(fair, domain::BASIS, rateBps);
}

void SimulatedSwapVenue::settle(AssetId assetIn, AssetId assetOut,
                                Amount amountIn, Amount amountOut, const std::string& account) {
    custody_->transfer(assetIn, account, VENUE_ACCOUNT, amountIn);
    custody_->debit(VENUE_ACCOUNT, assetIn, amountIn);
    custody_->credit(account, assetOut, amountOut);

    std::lock_guard<std::mutex> lock(mutex_);
    ++swapCount_;
}

Amount SimulatedSwapVenue::reported(Amount actual) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reportSkew_ < 0) {
        return domain::saturatingSub(actual, static_cast<Amount>(-reportSkew_));
    }
    return actual + static_cast<Amount>(reportSkew_);
}

} // namespace treasury::adapters::secondary
