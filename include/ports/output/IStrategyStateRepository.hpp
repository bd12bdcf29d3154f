#pragma once

#include "domain/StrategyState.hpp"
#include <optional>

namespace treasury::ports::output {

/**
 * @brief Репозиторий состояния резервной стратегии
 */
class IStrategyStateRepository {
public:
    virtual ~IStrategyStateRepository() = default;

    virtual std::optional<domain::StrategyState> load() = 0;

    virtual void save(const domain::StrategyState& state) = 0;
};

} // namespace treasury::ports::output
