// include/adapters/secondary/venues/SimulatedPriceOracle.hpp
#pragma once

#include "ports/output/IPriceOracle.hpp"
#include "ports/output/IClock.hpp"
#include "domain/TreasuryError.hpp"
#include <map>
#include <memory>
#include <mutex>

namespace treasury::adapters::secondary {

/**
 * @brief Оракул с ценами, выставляемыми вручную
 *
 * setPrice() штампует цену текущим временем часов. touch() обновляет
 * штамп всех цен, не меняя их (имитация живого фида).
 */
class SimulatedPriceOracle : public ports::output::IPriceOracle {
public:
    explicit SimulatedPriceOracle(std::shared_ptr<ports::output::IClock> clock)
        : clock_(std::move(clock)) {}

    domain::PriceQuote latestPrice(domain::AssetId asset) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = quotes_.find(asset);
        if (it == quotes_.end()) {
            throw domain::OracleError(domain::ErrorCode::PriceUnavailable,
                "no " + domain::toString(asset) + " price published");
        }
        return it->second;
    }

    void setPrice(domain::AssetId asset, domain::Price price) {
        setQuote(asset, price, clock_->now());
    }

    void setQuote(domain::AssetId asset, domain::Price price, domain::UnixSeconds updatedAt) {
        std::lock_guard<std::mutex> lock(mutex_);
        quotes_[asset] = domain::PriceQuote(asset, price, updatedAt);
    }

    void touch() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_->now();
        for (auto& [asset, quote] : quotes_) {
            quote.updatedAt = now;
        }
    }

private:
    std::shared_ptr<ports::output::IClock> clock_;
    std::mutex mutex_;
    std::map<domain::AssetId, domain::PriceQuote> quotes_;
};

} // namespace treasury::adapters::secondary
