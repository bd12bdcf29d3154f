#pragma once

#include "settings/IOracleSettings.hpp"
#include <cstdlib>
#include <string>

namespace treasury::settings {

/**
 * @brief Допустимый возраст цен оракула
 *
 * - ORACLE_VOLATILE_MAX_AGE_SECONDS (default: 3600)
 * - ORACLE_STABLE_MAX_AGE_SECONDS (default: 86400)
 * - ORACLE_SHARE_MAX_AGE_SECONDS (default: 86400)
 */
class OracleSettings : public IOracleSettings {
public:
    OracleSettings() {
        volatileMaxAge_ = std::stoll(getEnvOrDefault("ORACLE_VOLATILE_MAX_AGE_SECONDS", "3600"));
        stableMaxAge_ = std::stoll(getEnvOrDefault("ORACLE_STABLE_MAX_AGE_SECONDS", "86400"));
        shareMaxAge_ = std::stoll(getEnvOrDefault("ORACLE_SHARE_MAX_AGE_SECONDS", "86400"));
    }

    domain::UnixSeconds getMaxAge(domain::AssetId asset) const override {
        switch (asset) {
            case domain::AssetId::VOLATILE: return volatileMaxAge_;
            case domain::AssetId::STABLE:   return stableMaxAge_;
            case domain::AssetId::SHARE:    return shareMaxAge_;
        }
        return 0;
    }

private:
    domain::UnixSeconds volatileMaxAge_;
    domain::UnixSeconds stableMaxAge_;
    domain::UnixSeconds shareMaxAge_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace treasury::settings
