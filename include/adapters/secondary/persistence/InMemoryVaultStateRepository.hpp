#pragma once

#include "ports/output/IVaultStateRepository.hpp"
#include <mutex>
#include <optional>
#include <stdexcept>

namespace treasury::adapters::secondary {

/**
 * @brief In-memory реализация репозитория состояния хранилища
 *
 * Для локального запуска (TREASURY_STORAGE=memory) и тестов.
 * failNextSave() имитирует отказ хранилища на следующей записи.
 */
class InMemoryVaultStateRepository : public ports::output::IVaultStateRepository {
public:
    std::optional<domain::VaultState> load() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    void save(const domain::VaultState& state, const std::set<std::string>& touchedHolders) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failNextSave_) {
            failNextSave_ = false;
            throw std::runtime_error("vault state storage unavailable");
        }
        state_ = state;
        lastTouched_ = touchedHolders;
        ++saveCount_;
    }

    void failNextSave() {
        std::lock_guard<std::mutex> lock(mutex_);
        failNextSave_ = true;
    }

    std::set<std::string> lastTouched() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastTouched_;
    }

    size_t saveCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return saveCount_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<domain::VaultState> state_;
    std::set<std::string> lastTouched_;
    size_t saveCount_ = 0;
    bool failNextSave_ = false;
};

} // namespace treasury::adapters::secondary
