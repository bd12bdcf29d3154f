#pragma once

#include "domain/VaultState.hpp"
#include <optional>
#include <set>
#include <string>

namespace treasury::ports::output {

/**
 * @brief Репозиторий состояния хранилища
 */
class IVaultStateRepository {
public:
    virtual ~IVaultStateRepository() = default;

    /**
     * @brief Загрузить сохранённое состояние
     * @return std::nullopt если состояния ещё нет
     */
    virtual std::optional<domain::VaultState> load() = 0;

    /**
     * @brief Сохранить состояние
     *
     * @param touchedHolders Держатели, чьи балансы изменились (пустой набор
     *        означает, что реестр долей не менялся)
     * @throws std::exception при ошибке хранилища; операция отменяется
     */
    virtual void save(const domain::VaultState& state, const std::set<std::string>& touchedHolders) = 0;
};

} // namespace treasury::ports::output
