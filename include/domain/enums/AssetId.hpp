#pragma once

#include "domain/Amount.hpp"
#include <string>

namespace treasury::domain {

/**
 * @brief Активы, с которыми работает казначейство
 */
enum class AssetId {
    STABLE,     ///< Депозитный стабильный актив (USDC)
    VOLATILE,   ///< Волатильный резервный актив (WBTC)
    SHARE       ///< Доля хранилища на вторичном рынке
};

inline std::string toString(AssetId asset) {
    switch (asset) {
        case AssetId::STABLE:   return "STABLE";
        case AssetId::VOLATILE: return "VOLATILE";
        case AssetId::SHARE:    return "SHARE";
    }
    return "UNKNOWN";
}

inline AssetId assetIdFromString(const std::string& str) {
    if (str == "VOLATILE") return AssetId::VOLATILE;
    if (str == "SHARE") return AssetId::SHARE;
    return AssetId::STABLE;
}

inline int decimalsOf(AssetId asset) {
    switch (asset) {
        case AssetId::STABLE:   return STABLE_DECIMALS;
        case AssetId::VOLATILE: return VOLATILE_DECIMALS;
        case AssetId::SHARE:    return SHARE_DECIMALS;
    }
    return 0;
}

} // namespace treasury::domain
