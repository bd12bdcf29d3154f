#pragma once

#include "ports/output/IStrategyStateRepository.hpp"
#include <mutex>
#include <optional>
#include <stdexcept>

namespace treasury::adapters::secondary {

/**
 * @brief In-memory реализация репозитория состояния стратегии
 */
class InMemoryStrategyStateRepository : public ports::output::IStrategyStateRepository {
public:
    std::optional<domain::StrategyState> load() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    void save(const domain::StrategyState& state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failNextSave_) {
            failNextSave_ = false;
            throw std::runtime_error("strategy state storage unavailable");
        }
        state_ = state;
        ++saveCount_;
    }

    void failNextSave() {
        std::lock_guard<std::mutex> lock(mutex_);
        failNextSave_ = true;
    }

    size_t saveCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return saveCount_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<domain::StrategyState> state_;
    size_t saveCount_ = 0;
    bool failNextSave_ = false;
};

} // namespace treasury::adapters::secondary
