#pragma once

#include "domain/Amount.hpp"
#include "domain/Allocation.hpp"
#include "domain/CallContext.hpp"
#include "domain/StrategyState.hpp"
#include <string>

namespace treasury::ports::input {

/**
 * @brief Резервная стратегия: волатильный резерв + денежный резерв
 *
 * Изменяющие операции требуют полномочия ORCHESTRATOR (хранилище) или
 * ADMINISTRATOR (настройка, аварийный вывод, сброс предохранителя).
 */
class IReserveStrategy {
public:
    virtual ~IReserveStrategy() = default;

    // =========================================================================
    // Движение капитала (ORCHESTRATOR)
    // =========================================================================

    /**
     * @brief Разместить amount, заранее переведённый на счёт стратегии
     */
    virtual void deploy(const domain::CallContext& ctx, domain::Amount amount) = 0;

    /**
     * @brief Вернуть до amount стабильного актива на счёт вызывающего
     * @return Фактически переданное количество
     */
    virtual domain::Amount withdraw(const domain::CallContext& ctx, domain::Amount amount) = 0;

    /**
     * @brief Перелить стоимость amount между резервами
     * @param sellVolatile true: волатильный -> кэш, false: кэш -> волатильный
     */
    virtual void rebalance(const domain::CallContext& ctx, bool sellVolatile, domain::Amount amount) = 0;

    /**
     * @brief Забрать накопленные проценты на счёт вызывающего
     * @return Собранная сумма (0 если процентов нет)
     */
    virtual domain::Amount harvestYield(const domain::CallContext& ctx) = 0;

    // =========================================================================
    // Администрирование (ADMINISTRATOR)
    // =========================================================================

    /**
     * @brief Вывести всё на recipient в обход предохранителя
     */
    virtual domain::Amount emergencyWithdraw(const domain::CallContext& ctx,
                                             const std::string& recipient,
                                             bool liquidateVolatile) = 0;

    virtual void setAllocation(const domain::CallContext& ctx, const domain::Allocation& allocation) = 0;
    virtual void setMaxSlippage(const domain::CallContext& ctx, std::uint64_t maxSlippageBps) = 0;
    virtual void setBreakerConfig(const domain::CallContext& ctx, std::uint64_t thresholdBps,
                                  domain::UnixSeconds windowSeconds) = 0;
    virtual void resetCircuitBreaker(const domain::CallContext& ctx) = 0;

    // =========================================================================
    // Оценка
    // =========================================================================

    /// Свободный стабильный + денежный резерв + волатильный по цене оракула
    virtual domain::Amount totalValue() = 0;
    virtual domain::Amount volatileValue() = 0;
    virtual domain::Amount cashReserveValue() = 0;
    virtual domain::Amount freeStableBalance() = 0;
    virtual domain::Amount volatileHeld() const = 0;
    virtual bool circuitBreakerTripped() const = 0;
    virtual domain::StrategyState state() const = 0;

    /// Счёт стратегии в custody
    virtual std::string account() const = 0;
};

} // namespace treasury::ports::input
