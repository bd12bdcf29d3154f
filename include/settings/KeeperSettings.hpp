#pragma once

#include <chrono>
#include <cstdlib>
#include <string>

namespace treasury::settings {

/**
 * @brief Настройки фонового хранителя эпох и режима хранения
 *
 * - KEEPER_POLL_INTERVAL_MS (default: 60000)
 * - KEEPER_ACCOUNT (default: "epoch-keeper")
 * - TREASURY_STORAGE: "postgres" | "memory" (default: "postgres")
 */
class KeeperSettings {
public:
    KeeperSettings() {
        pollInterval_ = std::chrono::milliseconds(std::stoll(getEnvOrDefault("KEEPER_POLL_INTERVAL_MS", "60000")));
        account_ = getEnvOrDefault("KEEPER_ACCOUNT", "epoch-keeper");
        storage_ = getEnvOrDefault("TREASURY_STORAGE", "postgres");
    }

    std::chrono::milliseconds getPollInterval() const { return pollInterval_; }
    std::string getAccount() const { return account_; }
    std::string getStorage() const { return storage_; }
    bool useInMemoryStorage() const { return storage_ == "memory"; }

private:
    std::chrono::milliseconds pollInterval_;
    std::string account_;
    std::string storage_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace treasury::settings
