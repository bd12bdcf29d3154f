#pragma once

#include "ports/input/IReserveStrategy.hpp"
#include "ports/output/IAssetCustody.hpp"
#include "ports/output/ISwapVenue.hpp"
#include "ports/output/ILendingVenue.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IStrategyStateRepository.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "settings/IStrategySettings.hpp"
#include "application/OracleGuard.hpp"
#include "application/ReentrancyGuard.hpp"
#include "domain/StrategyState.hpp"
#include "domain/events/StrategyEvents.hpp"
#include <memory>
#include <string>

namespace treasury::application {

/**
 * @brief Резервная стратегия: волатильный актив + денежный резерв в lending
 *
 * Архитектура:
 * - deploy: amount делится по allocation, волатильная часть покупается
 *   через ISwapVenue с границей проскальзывания, денежная идёт в ILendingVenue
 * - withdraw: свободный стабильный -> денежный резерв -> продажа волатильного
 * - результат обмена проверяется по изменению баланса в custody, а не по
 *   возвращённому площадкой значению
 * - предохранитель: падение цены волатильного актива больше порога в окне
 *   блокирует движение капитала до ручного сброса администратором
 *
 * Состояние меняется на рабочей копии и фиксируется (save -> swap) после
 * успеха. Если внешняя площадка уже исполнила шаг, а следующий шаг упал,
 * фиксируется фактически достигнутое состояние и ошибка пробрасывается.
 */
class ReserveStrategy : public ports::input::IReserveStrategy {
public:
    ReserveStrategy(
        std::shared_ptr<settings::IStrategySettings> settings,
        std::shared_ptr<ports::output::IAssetCustody> custody,
        std::shared_ptr<ports::output::ISwapVenue> swapVenue,
        std::shared_ptr<ports::output::ILendingVenue> lendingVenue,
        std::shared_ptr<OracleGuard> oracle,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IStrategyStateRepository> repository,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher
    );

    // IReserveStrategy: движение капитала
    void deploy(const domain::CallContext& ctx, domain::Amount amount) override;
    domain::Amount withdraw(const domain::CallContext& ctx, domain::Amount amount) override;
    void rebalance(const domain::CallContext& ctx, bool sellVolatile, domain::Amount amount) override;
    domain::Amount harvestYield(const domain::CallContext& ctx) override;

    // IReserveStrategy: администрирование
    domain::Amount emergencyWithdraw(const domain::CallContext& ctx,
                                     const std::string& recipient,
                                     bool liquidateVolatile) override;
    void setAllocation(const domain::CallContext& ctx, const domain::Allocation& allocation) override;
    void setMaxSlippage(const domain::CallContext& ctx, std::uint64_t maxSlippageBps) override;
    void setBreakerConfig(const domain::CallContext& ctx, std::uint64_t thresholdBps,
                          domain::UnixSeconds windowSeconds) override;
    void resetCircuitBreaker(const domain::CallContext& ctx) override;

    // IReserveStrategy: оценка
    domain::Amount totalValue() override;
    domain::Amount volatileValue() override;
    domain::Amount cashReserveValue() override;
    domain::Amount freeStableBalance() override;
    domain::Amount volatileHeld() const override;
    bool circuitBreakerTripped() const override;
    domain::StrategyState state() const override;
    std::string account() const override { return account_; }

private:
    /// Результат продажи волатильного актива
    struct Liquidation {
        domain::Amount stableReceived = 0;
        domain::Amount volatileSold = 0;
    };

    std::shared_ptr<ports::output::IAssetCustody> custody_;
    std::shared_ptr<ports::output::ISwapVenue> swapVenue_;
    std::shared_ptr<ports::output::ILendingVenue> lendingVenue_;
    std::shared_ptr<OracleGuard> oracle_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::IStrategyStateRepository> repository_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;

    std::string account_;
    domain::StrategyState state_;
    ReentrancyGuard guard_;

    static domain::StrategyState initialState(const settings::IStrategySettings& settings);

    /**
     * @brief Проверка предохранителя
     *
     * Обновляет контрольную точку в next, при срабатывании фиксирует
     * состояние и бросает StateError(CircuitBreakerActive).
     *
     * @return Текущая проверенная цена волатильного актива
     */
    domain::Price checkCircuitBreaker(domain::StrategyState& next);

    domain::Amount buyVolatile(domain::Amount stableAmount, domain::Price volatilePrice,
                               domain::Price stablePrice, domain::StrategyState& next);

    /**
     * @brief Получить stableNeeded продажей волатильного (или продать весь, если его не хватает)
     */
    Liquidation liquidate(domain::Amount stableNeeded, domain::StrategyState& next,
                          domain::Price volatilePrice, domain::Price stablePrice);

    domain::Amount withdrawFromLending(domain::Amount amount, domain::StrategyState& next);

    domain::Amount stableBalance();
    domain::Amount volatileBalance();
    domain::UnixSeconds deadline(const domain::StrategyState& next) const;

    void commit(domain::StrategyState next);
    void publish(domain::DomainEvent& event);
};

} // namespace treasury::application
