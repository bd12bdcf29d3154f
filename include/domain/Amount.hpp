#pragma once

#include "domain/TreasuryError.hpp"
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <limits>

namespace treasury::domain {

/**
 * @brief Количество актива в минимальных единицах
 *
 * Стабильный актив: 6 знаков, волатильный: 8 знаков, доли: 9 знаков.
 * Никаких double — только целочисленная арифметика с фиксированной точкой.
 */
using Amount = std::uint64_t;

/// Цена в USD с 8 знаками. Знаковая: оракул может вернуть мусор.
using Price = std::int64_t;

/// Unix-время в секундах
using UnixSeconds = std::int64_t;

constexpr std::uint64_t BASIS = 10000;
constexpr std::uint64_t SECONDS_PER_YEAR = 365ULL * 24 * 60 * 60;
constexpr std::uint64_t PRECISION = 1000000000000000000ULL;   // 1e18

constexpr int STABLE_DECIMALS = 6;
constexpr int VOLATILE_DECIMALS = 8;
constexpr int PRICE_DECIMALS = 8;
constexpr int DECIMALS_OFFSET = 3;
constexpr int SHARE_DECIMALS = STABLE_DECIMALS + DECIMALS_OFFSET;

constexpr Amount STABLE_UNIT = 1000000ULL;          // 1 USD
constexpr Amount VOLATILE_UNIT = 100000000ULL;      // 1 BTC
constexpr Price PRICE_UNIT = 100000000LL;           // $1.00

/// Виртуальные доли/активы против атаки инфляции цены доли
constexpr Amount VIRTUAL_SHARES = 1000;
constexpr Amount VIRTUAL_ASSETS = 1;

/// Сентинел "бесконечного" коэффициента обеспечения
constexpr std::uint64_t INFINITE_RATIO = std::numeric_limits<std::uint64_t>::max();

namespace detail {
using Wide = boost::multiprecision::uint256_t;

inline Amount narrow(const Wide& value) {
    if (value > Wide(std::numeric_limits<Amount>::max())) {
        throw ExecutionError(ErrorCode::ArithmeticOverflow, "result does not fit into 64 bits");
    }
    return value.convert_to<Amount>();
}
} // namespace detail

/**
 * @brief a * b / d с промежуточным 256-битным произведением, округление вниз
 */
inline Amount mulDiv(Amount a, Amount b, Amount d) {
    if (d == 0) {
        throw ExecutionError(ErrorCode::ArithmeticOverflow, "division by zero");
    }
    detail::Wide product = detail::Wide(a) * b;
    return detail::narrow(product / d);
}

/**
 * @brief a * b / d с округлением вверх
 */
inline Amount mulDivUp(Amount a, Amount b, Amount d) {
    if (d == 0) {
        throw ExecutionError(ErrorCode::ArithmeticOverflow, "division by zero");
    }
    detail::Wide product = detail::Wide(a) * b;
    detail::Wide quotient = product / d;
    if (product % d != 0) {
        ++quotient;
    }
    return detail::narrow(quotient);
}

/**
 * @brief Перевод количества между активами с разной разрядностью по ценам
 *
 * amountOut = amountIn * priceIn * 10^decimalsOut / (priceOut * 10^decimalsIn)
 */
inline Amount convertByPrice(Amount amountIn, Price priceIn, int decimalsIn,
                             Price priceOut, int decimalsOut, bool roundUp = false) {
    detail::Wide numerator = detail::Wide(amountIn) * static_cast<std::uint64_t>(priceIn);
    detail::Wide denominator = detail::Wide(static_cast<std::uint64_t>(priceOut));
    for (int i = 0; i < decimalsOut; ++i) numerator *= 10;
    for (int i = 0; i < decimalsIn; ++i) denominator *= 10;

    detail::Wide quotient = numerator / denominator;
    if (roundUp && numerator % denominator != 0) {
        ++quotient;
    }
    return detail::narrow(quotient);
}

/**
 * @brief Насыщающее вычитание (никогда не уходит ниже нуля)
 */
inline Amount saturatingSub(Amount a, Amount b) {
    return a > b ? a - b : 0;
}

} // namespace treasury::domain
