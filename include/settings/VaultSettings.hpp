#pragma once

#include "settings/IVaultSettings.hpp"
#include <cstdlib>
#include <string>

namespace treasury::settings {

/**
 * @brief Параметры хранилища из ENV
 *
 * Денежные значения в минимальных единицах (цена: 8 знаков, USDC: 6 знаков).
 * - VAULT_TARGET_PRICE (default: 10000000000 = $100)
 * - VAULT_BASE_RATE_BPS / VAULT_SENSITIVITY_BPS / VAULT_MIN_RATE_BPS / VAULT_MAX_RATE_BPS
 * - VAULT_EPOCH_DURATION_SECONDS (default: 604800)
 * - VAULT_MIN_DEPOSIT / VAULT_MAX_SINGLE_DEPOSIT / VAULT_MAX_TOTAL_DEPOSITS
 * - VAULT_LIQUIDITY_BUFFER_BPS (default: 100)
 * - VAULT_ACCOUNT (default: "vault")
 */
class VaultSettings : public IVaultSettings {
public:
    VaultSettings() {
        targetPrice_ = std::stoll(getEnvOrDefault("VAULT_TARGET_PRICE", "10000000000"));
        rateParams_.baseRateBps = std::stoull(getEnvOrDefault("VAULT_BASE_RATE_BPS", "800"));
        rateParams_.sensitivityBps = std::stoull(getEnvOrDefault("VAULT_SENSITIVITY_BPS", "2000"));
        rateParams_.minRateBps = std::stoull(getEnvOrDefault("VAULT_MIN_RATE_BPS", "100"));
        rateParams_.maxRateBps = std::stoull(getEnvOrDefault("VAULT_MAX_RATE_BPS", "2500"));
        epochDuration_ = std::stoll(getEnvOrDefault("VAULT_EPOCH_DURATION_SECONDS", "604800"));
        limits_.minDeposit = std::stoull(getEnvOrDefault("VAULT_MIN_DEPOSIT", "1000000"));
        limits_.maxSingleDeposit = std::stoull(getEnvOrDefault("VAULT_MAX_SINGLE_DEPOSIT", "1000000000000"));
        limits_.maxTotalDeposits = std::stoull(getEnvOrDefault("VAULT_MAX_TOTAL_DEPOSITS", "100000000000000"));
        liquidityBufferBps_ = std::stoull(getEnvOrDefault("VAULT_LIQUIDITY_BUFFER_BPS", "100"));
        account_ = getEnvOrDefault("VAULT_ACCOUNT", "vault");
    }

    domain::Price getTargetPrice() const override { return targetPrice_; }
    domain::RateParams getRateParams() const override { return rateParams_; }
    domain::UnixSeconds getEpochDuration() const override { return epochDuration_; }
    domain::DepositLimits getDepositLimits() const override { return limits_; }
    std::uint64_t getLiquidityBufferBps() const override { return liquidityBufferBps_; }
    std::string getAccount() const override { return account_; }

private:
    domain::Price targetPrice_;
    domain::RateParams rateParams_;
    domain::UnixSeconds epochDuration_;
    domain::DepositLimits limits_;
    std::uint64_t liquidityBufferBps_;
    std::string account_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace treasury::settings
