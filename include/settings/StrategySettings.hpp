#pragma once

#include "settings/IStrategySettings.hpp"
#include <cstdlib>
#include <string>

namespace treasury::settings {

/**
 * @brief Параметры резервной стратегии из ENV
 *
 * - STRATEGY_VOLATILE_BPS / STRATEGY_CASH_BPS (default: 8000 / 2000)
 * - STRATEGY_MAX_SLIPPAGE_BPS (default: 100)
 * - STRATEGY_BREAKER_THRESHOLD_BPS (default: 2000)
 * - STRATEGY_BREAKER_WINDOW_SECONDS (default: 3600)
 * - STRATEGY_SWAP_DEADLINE_SECONDS (default: 300)
 * - STRATEGY_ACCOUNT (default: "reserve-strategy")
 */
class StrategySettings : public IStrategySettings {
public:
    StrategySettings() {
        allocation_.volatileBps = std::stoull(getEnvOrDefault("STRATEGY_VOLATILE_BPS", "8000"));
        allocation_.cashBps = std::stoull(getEnvOrDefault("STRATEGY_CASH_BPS", "2000"));
        maxSlippageBps_ = std::stoull(getEnvOrDefault("STRATEGY_MAX_SLIPPAGE_BPS", "100"));
        breakerThresholdBps_ = std::stoull(getEnvOrDefault("STRATEGY_BREAKER_THRESHOLD_BPS", "2000"));
        breakerWindowSeconds_ = std::stoll(getEnvOrDefault("STRATEGY_BREAKER_WINDOW_SECONDS", "3600"));
        swapDeadlineSeconds_ = std::stoll(getEnvOrDefault("STRATEGY_SWAP_DEADLINE_SECONDS", "300"));
        account_ = getEnvOrDefault("STRATEGY_ACCOUNT", "reserve-strategy");
    }

    domain::Allocation getAllocation() const override { return allocation_; }
    std::uint64_t getMaxSlippageBps() const override { return maxSlippageBps_; }
    std::uint64_t getBreakerThresholdBps() const override { return breakerThresholdBps_; }
    domain::UnixSeconds getBreakerWindowSeconds() const override { return breakerWindowSeconds_; }
    domain::UnixSeconds getSwapDeadlineSeconds() const override { return swapDeadlineSeconds_; }
    std::string getAccount() const override { return account_; }

private:
    domain::Allocation allocation_;
    std::uint64_t maxSlippageBps_;
    std::uint64_t breakerThresholdBps_;
    domain::UnixSeconds breakerWindowSeconds_;
    domain::UnixSeconds swapDeadlineSeconds_;
    std::string account_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace treasury::settings
