// include/adapters/secondary/venues/SimulatedSwapVenue.hpp
#pragma once

#include "ports/output/ISwapVenue.hpp"
#include "ports/output/IPriceOracle.hpp"
#include "ports/output/IClock.hpp"
#include "adapters/secondary/venues/SimulatedCustody.hpp"
#include <functional>
#include <memory>
#include <mutex>

namespace treasury::adapters::secondary {

/**
 * @brief Площадка обмена по цене оракула
 *
 * Курс = цена оракула минус комиссия и ценовое воздействие. Проданный
 * актив сжигается, купленный выпускается на счёт через SimulatedCustody.
 *
 * Управление для тестов:
 * - setFeeBps / setPriceImpactBps: ухудшение курса
 * - setExecutionDelay: исполнение позже now на delay секунд (проверка deadline)
 * - setReportSkew: возвращаемое значение расходится с фактически зачисленным
 * - setBeforeSwapHook: колбэк перед исполнением (повторный вход)
 * - failNextSwap: следующий обмен падает с VenueFailure
 */
class SimulatedSwapVenue : public ports::output::ISwapVenue {
public:
    SimulatedSwapVenue(
        std::shared_ptr<SimulatedCustody> custody,
        std::shared_ptr<ports::output::IPriceOracle> oracle,
        std::shared_ptr<ports::output::IClock> clock,
        std::uint64_t feeBps = 0);

    domain::Amount swapExactInput(
        domain::AssetId assetIn,
        domain::AssetId assetOut,
        domain::Amount amountIn,
        domain::Amount minAmountOut,
        domain::UnixSeconds deadline,
        const std::string& account) override;

    domain::Amount swapExactOutput(
        domain::AssetId assetIn,
        domain::AssetId assetOut,
        domain::Amount amountOut,
        domain::Amount maxAmountIn,
        domain::UnixSeconds deadline,
        const std::string& account) override;

    // Методы для тестов
    void setFeeBps(std::uint64_t feeBps);
    void setPriceImpactBps(std::uint64_t impactBps);
    void setExecutionDelay(domain::UnixSeconds delay);
    void setReportSkew(std::int64_t skew);
    void setBeforeSwapHook(std::function<void()> hook);
    void failNextSwap();
    std::size_t swapCount() const;

private:
    std::shared_ptr<SimulatedCustody> custody_;
    std::shared_ptr<ports::output::IPriceOracle> oracle_;
    std::shared_ptr<ports::output::IClock> clock_;

    mutable std::mutex mutex_;
    std::uint64_t feeBps_;
    std::uint64_t impactBps_ = 0;
    domain::UnixSeconds executionDelay_ = 0;
    std::int64_t reportSkew_ = 0;
    std::function<void()> beforeSwap_;
    bool failNext_ = false;
    std::size_t swapCount_ = 0;

    /// Общие проверки и колбэк; возвращает множитель курса в bps
    std::uint64_t prepare(domain::UnixSeconds deadline);

    domain::Amount quoteOut(domain::AssetId assetIn, domain::AssetId assetOut,
                            domain::Amount amountIn, std::uint64_t rateBps);
    domain::Amount quoteIn(domain::AssetId assetIn, domain::AssetId assetOut,
                           domain::Amount amountOut, std::uint64_t rateBps);

    void settle(domain::AssetId assetIn, domain::AssetId assetOut,
                domain::Amount amountIn, domain::Amount amountOut, const std::string& account);

    domain::Amount reported(domain::Amount actual) const;
};

} // namespace treasury::adapters::secondary
