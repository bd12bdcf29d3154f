// include/adapters/secondary/events/InMemoryEventBus.hpp
#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace treasury::adapters::secondary {

/**
 * @brief In-memory шина событий с журналом публикаций
 *
 * Синхронная доставка: publish() сразу вызывает обработчики, подписанные
 * на routingKey. Все опубликованные сообщения остаются в журнале (audit
 * trail) для локального режима и интеграционных тестов.
 *
 * Используется вместо RabbitMQAdapter при TREASURY_STORAGE=memory.
 */
class InMemoryEventBus : public ports::output::IEventPublisher,
                         public ports::output::IEventConsumer {
public:
    using Entry = std::pair<std::string, std::string>;

    void publish(const std::string& routingKey, const std::string& message) override {
        std::vector<ports::output::EventHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            journal_.emplace_back(routingKey, message);
            if (started_) {
                auto it = handlers_.find(routingKey);
                if (it != handlers_.end()) {
                    handlers = it->second;
                }
            }
        }

        // Обработчики вызываются вне блокировки: они сами публикуют результат
        for (const auto& handler : handlers) {
            try {
                handler(routingKey, message);
            } catch (const std::exception& e) {
                std::cerr << "[InMemoryEventBus] Handler error on " << routingKey
                          << ": " << e.what() << std::endl;
            }
        }
    }

    void subscribe(const std::vector<std::string>& routingKeys,
                   ports::output::EventHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& key : routingKeys) {
            handlers_[key].push_back(handler);
        }
    }

    void start() override {
        std::lock_guard<std::mutex> lock(mutex_);
        started_ = true;
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        started_ = false;
    }

    std::vector<Entry> journal() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return journal_;
    }

    std::vector<std::string> messagesFor(const std::string& routingKey) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (const auto& entry : journal_) {
            if (entry.first == routingKey) {
                result.push_back(entry.second);
            }
        }
        return result;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        journal_.clear();
    }

private:
    mutable std::mutex mutex_;
    bool started_ = false;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> handlers_;
    std::vector<Entry> journal_;
};

} // namespace treasury::adapters::secondary
