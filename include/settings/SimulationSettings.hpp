#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>

namespace treasury::settings {

/**
 * @brief Настройки симулированных площадок (custody, оракул, swap, lending)
 *
 * Переменные окружения:
 * - SIM_VOLATILE_PRICE: цена волатильного актива, 8 знаков (default: $97000)
 * - SIM_STABLE_PRICE: цена стабильного актива, 8 знаков (default: $1)
 * - SIM_SHARE_PRICE: рыночная цена доли, 8 знаков (default: $100)
 * - SIM_SWAP_FEE_BPS: комиссия обмена (default: 0)
 * - SIM_LENDING_APY_BPS: доходность lending-площадки (default: 500 = 5%)
 * - SIM_SEED_ACCOUNTS: счета с начальным балансом через запятую (default: "alice,bob")
 * - SIM_SEED_BALANCE: начальный баланс USDC, 6 знаков (default: 100000 USDC)
 *
 * @example K8s ConfigMap:
 * ```yaml
 * data:
 *   SIM_VOLATILE_PRICE: "9700000000000"
 *   SIM_SWAP_FEE_BPS: "30"
 *   SIM_LENDING_APY_BPS: "450"
 * ```
 */
class SimulationSettings {
public:
    SimulationSettings() {
        volatilePrice_ = std::stoll(getEnvOrDefault("SIM_VOLATILE_PRICE", "9700000000000"));
        stablePrice_ = std::stoll(getEnvOrDefault("SIM_STABLE_PRICE", "100000000"));
        sharePrice_ = std::stoll(getEnvOrDefault("SIM_SHARE_PRICE", "10000000000"));
        swapFeeBps_ = std::stoull(getEnvOrDefault("SIM_SWAP_FEE_BPS", "0"));
        lendingApyBps_ = std::stoull(getEnvOrDefault("SIM_LENDING_APY_BPS", "500"));
        seedAccounts_ = getEnvOrDefault("SIM_SEED_ACCOUNTS", "alice,bob");
        seedBalance_ = std::stoull(getEnvOrDefault("SIM_SEED_BALANCE", "100000000000"));
    }

    std::int64_t getVolatilePrice() const { return volatilePrice_; }
    std::int64_t getStablePrice() const { return stablePrice_; }
    std::int64_t getSharePrice() const { return sharePrice_; }
    std::uint64_t getSwapFeeBps() const { return swapFeeBps_; }
    std::uint64_t getLendingApyBps() const { return lendingApyBps_; }
    std::string getSeedAccounts() const { return seedAccounts_; }
    std::uint64_t getSeedBalance() const { return seedBalance_; }

private:
    std::int64_t volatilePrice_;
    std::int64_t stablePrice_;
    std::int64_t sharePrice_;
    std::uint64_t swapFeeBps_;
    std::uint64_t lendingApyBps_;
    std::string seedAccounts_;
    std::uint64_t seedBalance_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace treasury::settings
