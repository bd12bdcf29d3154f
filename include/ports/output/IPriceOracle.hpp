#pragma once

#include "domain/PriceQuote.hpp"
#include "domain/enums/AssetId.hpp"

namespace treasury::ports::output {

/**
 * @brief Источник цен (pull-модель)
 *
 * Возвращает последнюю известную цену как есть. Проверку свежести и
 * знака делает OracleGuard, не реализация.
 *
 * @throws domain::OracleError(PriceUnavailable) если цены нет вовсе
 */
class IPriceOracle {
public:
    virtual ~IPriceOracle() = default;

    virtual domain::PriceQuote latestPrice(domain::AssetId asset) = 0;
};

} // namespace treasury::ports::output
