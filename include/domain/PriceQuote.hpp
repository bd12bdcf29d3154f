#pragma once

#include "domain/Amount.hpp"
#include "enums/AssetId.hpp"

namespace treasury::domain {

/**
 * @brief Цена от оракула
 *
 * price — USD с 8 знаками. Может быть отрицательной или нулевой,
 * поэтому хранится со знаком и проверяется OracleGuard.
 */
struct PriceQuote {
    AssetId asset = AssetId::STABLE;
    Price price = 0;
    UnixSeconds updatedAt = 0;

    PriceQuote() = default;

    PriceQuote(AssetId asset, Price price, UnixSeconds updatedAt)
        : asset(asset), price(price), updatedAt(updatedAt) {}
};

} // namespace treasury::domain
