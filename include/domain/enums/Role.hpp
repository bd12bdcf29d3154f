#pragma once

#include <string>

namespace treasury::domain {

/**
 * @brief Классы полномочий
 *
 * ADMINISTRATOR — параметры, пауза, аварийный вывод, сброс предохранителя.
 * KEEPER        — только тик эпохи.
 * ORCHESTRATOR  — полномочие Vault на вызов deploy/withdraw/rebalance/harvest.
 */
enum class Role {
    ADMINISTRATOR,
    KEEPER,
    ORCHESTRATOR
};

inline std::string toString(Role role) {
    switch (role) {
        case Role::ADMINISTRATOR: return "ADMINISTRATOR";
        case Role::KEEPER:        return "KEEPER";
        case Role::ORCHESTRATOR:  return "ORCHESTRATOR";
    }
    return "UNKNOWN";
}

} // namespace treasury::domain
