#pragma once

#include <cstdint>

namespace treasury::domain {

/**
 * @brief Параметры саморегулирующейся ставки (в базисных пунктах)
 *
 * Инвариант: minRateBps <= baseRateBps <= maxRateBps <= BASIS
 */
struct RateParams {
    std::uint64_t baseRateBps = 800;        ///< 8%
    std::uint64_t sensitivityBps = 2000;    ///< 20%
    std::uint64_t minRateBps = 100;         ///< 1%
    std::uint64_t maxRateBps = 2500;        ///< 25%

    bool operator==(const RateParams& other) const {
        return baseRateBps == other.baseRateBps
            && sensitivityBps == other.sensitivityBps
            && minRateBps == other.minRateBps
            && maxRateBps == other.maxRateBps;
    }
};

} // namespace treasury::domain
