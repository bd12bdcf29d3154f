#include "domain/RateController.hpp"
#include "domain/TreasuryError.hpp"
#include <algorithm>
#include <string>

namespace treasury::domain {

std::uint64_t RateController::variableRate(
    Price targetPrice,
    Price marketPrice,
    std::uint64_t baseRateBps,
    std::uint64_t sensitivityBps,
    std::uint64_t minRateBps,
    std::uint64_t maxRateBps
) {
    if (targetPrice <= 0 || marketPrice <= 0) {
        throw OracleError(ErrorCode::InvalidPrice,
            "rate inputs must be positive (target=" + std::to_string(targetPrice) +
            ", market=" + std::to_string(marketPrice) + ")");
    }

    const auto target = static_cast<std::uint64_t>(targetPrice);
    const auto market = static_cast<std::uint64_t>(marketPrice);

    std::uint64_t rate = 0;
    if (market <= target) {
        // Ниже якоря: премия к базовой ставке
        std::uint64_t deviationBps = mulDiv(target - market, BASIS, target);
        std::uint64_t adjustment = mulDiv(sensitivityBps, deviationBps, BASIS);
        rate = std::min(baseRateBps + adjustment, maxRateBps);
    } else {
        // Выше якоря: скидка, но не ниже нуля
        std::uint64_t deviationBps = mulDiv(market - target, BASIS, target);
        std::uint64_t adjustment = mulDiv(sensitivityBps, deviationBps, BASIS);
        rate = adjustment < baseRateBps ? baseRateBps - adjustment : minRateBps;
    }

    // Безусловный clamp: защищает от неверной конфигурации
    if (rate < minRateBps) rate = minRateBps;
    if (rate > maxRateBps) rate = maxRateBps;
    return rate;
}

Amount RateController::epochDividend(Amount totalAssets, std::uint64_t rateBps, UnixSeconds epochDuration) {
    if (totalAssets == 0 || rateBps == 0 || epochDuration <= 0) {
        return 0;
    }
    detail::Wide numerator = detail::Wide(totalAssets) * rateBps * static_cast<std::uint64_t>(epochDuration);
    return detail::narrow(numerator / (detail::Wide(BASIS) * SECONDS_PER_YEAR));
}

std::uint64_t RateController::collateralRatio(Amount reserveValue, Amount cashValue, Amount totalLiabilities) {
    if (totalLiabilities == 0) {
        return INFINITE_RATIO;
    }
    detail::Wide ratio = (detail::Wide(reserveValue) + cashValue) * PRECISION / totalLiabilities;
    if (ratio >= detail::Wide(INFINITE_RATIO)) {
        return INFINITE_RATIO;
    }
    return ratio.convert_to<std::uint64_t>();
}

void RateController::validate(const RateParams& params) {
    if (params.minRateBps > params.baseRateBps ||
        params.baseRateBps > params.maxRateBps ||
        params.maxRateBps > BASIS) {
        throw ValidationError(ErrorCode::InvalidParameter,
            "rate bounds must satisfy min <= base <= max <= 10000 (min=" +
            std::to_string(params.minRateBps) + ", base=" + std::to_string(params.baseRateBps) +
            ", max=" + std::to_string(params.maxRateBps) + ")");
    }
}

} // namespace treasury::domain
