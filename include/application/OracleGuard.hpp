#pragma once

#include "ports/output/IPriceOracle.hpp"
#include "ports/output/IClock.hpp"
#include "settings/IOracleSettings.hpp"
#include "domain/TreasuryError.hpp"
#include <memory>
#include <iostream>

namespace treasury::application {

/**
 * @brief Проверенное чтение цен оракула
 *
 * Каждое чтение проверяет:
 * - price > 0, иначе InvalidPrice
 * - updatedAt не в будущем, иначе InvalidPrice
 * - now - updatedAt <= maxAge(asset), иначе StalePrice
 *
 * Ошибка прерывает вызывающую операцию до каких-либо изменений.
 */
class OracleGuard {
public:
    OracleGuard(
        std::shared_ptr<ports::output::IPriceOracle> oracle,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<settings::IOracleSettings> settings
    ) : oracle_(std::move(oracle))
      , clock_(std::move(clock))
      , settings_(std::move(settings))
    {}

    domain::Price read(domain::AssetId asset) const {
        auto quote = oracle_->latestPrice(asset);
        auto now = clock_->now();

        if (quote.price <= 0) {
            std::cerr << "[OracleGuard] Non-positive " << domain::toString(asset)
                      << " price: " << quote.price << std::endl;
            throw domain::OracleError(domain::ErrorCode::InvalidPrice,
                domain::toString(asset) + " price is not positive");
        }
        if (quote.updatedAt > now) {
            std::cerr << "[OracleGuard] " << domain::toString(asset)
                      << " price timestamp is in the future" << std::endl;
            throw domain::OracleError(domain::ErrorCode::InvalidPrice,
                domain::toString(asset) + " price timestamp is in the future");
        }

        auto age = now - quote.updatedAt;
        auto maxAge = settings_->getMaxAge(asset);
        if (age > maxAge) {
            std::cerr << "[OracleGuard] Stale " << domain::toString(asset)
                      << " price: age=" << age << "s max=" << maxAge << "s" << std::endl;
            throw domain::OracleError(domain::ErrorCode::StalePrice,
                domain::toString(asset) + " price is " + std::to_string(age) + "s old");
        }

        return quote.price;
    }

private:
    std::shared_ptr<ports::output::IPriceOracle> oracle_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<settings::IOracleSettings> settings_;
};

} // namespace treasury::application
