#pragma once

#include <string>

namespace treasury::domain {

/**
 * @brief Фазы тика эпохи
 *
 * Idle -> Computing -> Rebalancing -> Settled -> Idle
 */
enum class EpochPhase {
    IDLE,
    COMPUTING,
    REBALANCING,
    SETTLED
};

inline std::string toString(EpochPhase phase) {
    switch (phase) {
        case EpochPhase::IDLE:        return "IDLE";
        case EpochPhase::COMPUTING:   return "COMPUTING";
        case EpochPhase::REBALANCING: return "REBALANCING";
        case EpochPhase::SETTLED:     return "SETTLED";
    }
    return "UNKNOWN";
}

} // namespace treasury::domain
