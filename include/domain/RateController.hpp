#pragma once

#include "domain/Amount.hpp"
#include "domain/RateParams.hpp"
#include <cstdint>

namespace treasury::domain {

/**
 * @brief Саморегулирующаяся ставка дивиденда (чистые функции, без состояния)
 *
 * Цена доли ниже целевой -> ставка растёт (доля привлекательнее, спрос
 * возвращает цену к якорю). Выше целевой -> ставка падает.
 *
 * VDR = base + sensitivity * (target - market) / target, в пределах [min, max]
 */
class RateController {
public:
    RateController() = delete;

    /**
     * @brief Переменная ставка в базисных пунктах
     *
     * @param targetPrice Целевая цена доли (8 знаков)
     * @param marketPrice Рыночная цена доли (8 знаков)
     * @throws OracleError(InvalidPrice) при неположительной цене
     */
    static std::uint64_t variableRate(
        Price targetPrice,
        Price marketPrice,
        std::uint64_t baseRateBps,
        std::uint64_t sensitivityBps,
        std::uint64_t minRateBps,
        std::uint64_t maxRateBps
    );

    static std::uint64_t variableRate(Price targetPrice, Price marketPrice, const RateParams& params) {
        return variableRate(targetPrice, marketPrice, params.baseRateBps, params.sensitivityBps,
                            params.minRateBps, params.maxRateBps);
    }

    /**
     * @brief Дивиденд эпохи: totalAssets * rate * duration / (BASIS * SECONDS_PER_YEAR)
     *
     * @note Усечение к нулю. Систематическое недораспределение (< 1 единицы
     *       на эпоху) принимается осознанно.
     */
    static Amount epochDividend(Amount totalAssets, std::uint64_t rateBps, UnixSeconds epochDuration);

    /**
     * @brief Коэффициент обеспечения (масштаб PRECISION)
     *
     * @return INFINITE_RATIO если обязательств нет; насыщается на нём же
     */
    static std::uint64_t collateralRatio(Amount reserveValue, Amount cashValue, Amount totalLiabilities);

    /**
     * @brief Проверка min <= base <= max <= BASIS
     * @throws ValidationError(InvalidParameter)
     */
    static void validate(const RateParams& params);
};

} // namespace treasury::domain
