#pragma once

#include "enums/Role.hpp"
#include "domain/TreasuryError.hpp"
#include <set>
#include <string>

namespace treasury::domain {

/**
 * @brief Контекст вызова: кто вызывает и с какими полномочиями
 *
 * Передаётся в каждую изменяющую операцию. Реестр ролей живёт во внешнем
 * сервисе доступа, здесь только выданный им токен полномочий.
 */
struct CallContext {
    std::string caller;         ///< Идентификатор вызывающего (и его счёт в custody)
    std::set<Role> roles;       ///< Выданные полномочия

    CallContext() = default;

    explicit CallContext(const std::string& caller, std::set<Role> roles = {})
        : caller(caller), roles(std::move(roles)) {}

    bool has(Role role) const {
        return roles.count(role) > 0;
    }

    /**
     * @brief Бросает StateError(Unauthorized), если полномочия нет
     */
    void require(Role role) const {
        if (!has(role)) {
            throw StateError(ErrorCode::Unauthorized,
                "'" + caller + "' lacks " + toString(role) + " capability");
        }
    }

    static CallContext user(const std::string& caller) {
        return CallContext(caller);
    }

    static CallContext administrator(const std::string& caller) {
        return CallContext(caller, {Role::ADMINISTRATOR});
    }

    static CallContext keeper(const std::string& caller) {
        return CallContext(caller, {Role::KEEPER});
    }

    static CallContext orchestrator(const std::string& caller) {
        return CallContext(caller, {Role::ORCHESTRATOR});
    }
};

} // namespace treasury::domain
