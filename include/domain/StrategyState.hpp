#pragma once

#include "domain/Amount.hpp"
#include "domain/Allocation.hpp"

namespace treasury::domain {

/**
 * @brief Персистентное состояние резервной стратегии
 *
 * cashDeployed — учтённая основная сумма в lending-площадке. Живой баланс
 * площадки больше на накопленные проценты, разница и есть урожай.
 */
struct StrategyState {
    Amount volatileHeld = 0;
    Amount cashDeployed = 0;
    Allocation allocation;

    // Предохранитель
    bool circuitBreakerTripped = false;
    Price lastObservedPrice = 0;
    UnixSeconds lastObservedTimestamp = 0;
    std::uint64_t breakerThresholdBps = 2000;       ///< падение на 20%...
    UnixSeconds breakerWindowSeconds = 3600;        ///< ...за час

    // Исполнение
    std::uint64_t maxSlippageBps = 100;
    UnixSeconds swapDeadlineSeconds = 300;
};

} // namespace treasury::domain
