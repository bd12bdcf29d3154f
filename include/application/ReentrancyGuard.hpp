#pragma once

#include "domain/TreasuryError.hpp"
#include <mutex>
#include <string>

namespace treasury::application {

/**
 * @brief Защита от повторного входа
 *
 * Рекурсивный мьютекс сериализует операции разных потоков (keeper,
 * потребитель команд). Флаг входа отвергает повторный вход из того же
 * потока, например из колбэка внешней площадки.
 *
 * @example
 * ```cpp
 * void Vault::deposit(...) {
 *     ReentrancyGuard::Scope scope(guard_, "Vault");
 *     ...
 * }
 * ```
 */
class ReentrancyGuard {
public:
    class Scope {
    public:
        Scope(ReentrancyGuard& guard, const std::string& component)
            : guard_(guard)
        {
            guard_.mutex_.lock();
            if (guard_.entered_) {
                guard_.mutex_.unlock();
                throw domain::StateError(domain::ErrorCode::Reentrancy,
                    component + " re-entered during an operation in progress");
            }
            guard_.entered_ = true;
        }

        ~Scope() {
            guard_.entered_ = false;
            guard_.mutex_.unlock();
        }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        ReentrancyGuard& guard_;
    };

    ReentrancyGuard() = default;

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    /**
     * @brief Блокировка для чтения без флага входа (представления)
     */
    std::unique_lock<std::recursive_mutex> readLock() const {
        return std::unique_lock<std::recursive_mutex>(mutex_);
    }

    bool entered() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return entered_;
    }

private:
    mutable std::recursive_mutex mutex_;
    bool entered_ = false;
};

} // namespace treasury::application
