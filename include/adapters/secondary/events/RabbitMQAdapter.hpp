// include/adapters/secondary/events/RabbitMQAdapter.hpp
#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace treasury::adapters::secondary {

/**
 * @brief RabbitMQ адаптер событий казначейства
 *
 * Реализует IEventPublisher и IEventConsumer.
 *
 * Архитектура:
 * - Exchange: topic (treasury.events)
 * - Публикуемые ключи: vault.*, strategy.*, vault.command.completed/rejected
 * - Слушаемые ключи: vault.deposit, vault.mint, vault.withdraw, vault.redeem, vault.transfer
 * - Очередь: auto-generated exclusive
 *
 * Все обращения к каналу выполняются в потоке io_context: publish() из
 * других потоков ставится в очередь через boost::asio::post. Сообщения,
 * опубликованные до объявления exchange, отправляются после него.
 */
class RabbitMQAdapter : public ports::output::IEventPublisher,
                        public ports::output::IEventConsumer {
public:
    explicit RabbitMQAdapter(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , ready_(false)
        , ioContext_()
        , workGuard_(boost::asio::make_work_guard(ioContext_))
        , handler_(ioContext_)
    {
        exchangeName_ = settings_->getExchange();
        std::cout << "[RabbitMQAdapter] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " exchange=" << exchangeName_ << std::endl;
    }

    ~RabbitMQAdapter() override {
        stop();
    }

    // =========================================================================
    // IEventPublisher
    // =========================================================================

    void publish(const std::string& routingKey, const std::string& message) override {
        if (!running_) {
            std::cerr << "[RabbitMQAdapter] Cannot publish " << routingKey << ": not started" << std::endl;
            return;
        }

        boost::asio::post(ioContext_, [this, routingKey, message]() {
            if (!ready_) {
                pendingPublishes_.emplace_back(routingKey, message);
                return;
            }
            sendNow(routingKey, message);
        });
    }

    // =========================================================================
    // IEventConsumer
    // =========================================================================

    void subscribe(const std::vector<std::string>& routingKeys,
                   ports::output::EventHandler handler) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);

        for (const auto& key : routingKeys) {
            handlers_[key].push_back(handler);
            pendingBindings_.push_back(key);
        }
    }

    void start() override {
        if (running_.exchange(true)) return;

        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Worker error: " << e.what() << std::endl;
                running_ = false;
            }
        });

        std::cout << "[RabbitMQAdapter] Started" << std::endl;
    }

    void stop() override {
        if (!running_.exchange(false)) return;

        boost::asio::post(ioContext_, [this]() {
            if (channel_) channel_->close();
            if (connection_) connection_->close();
        });
        workGuard_.reset();
        ioContext_.stop();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        channel_.reset();
        connection_.reset();
        ready_ = false;

        std::cout << "[RabbitMQAdapter] Stopped" << std::endl;
    }

private:
    void connect() {
        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_,
            AMQP::Address(settings_->getConnectionString()));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->onError([](const char* msg) {
            std::cerr << "[RabbitMQAdapter] Channel error: " << msg << std::endl;
        });

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                std::cout << "[RabbitMQAdapter] Exchange declared: " << exchangeName_ << std::endl;
                ready_ = true;
                flushPending();
                setupBindings();
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Exchange error: " << msg << std::endl;
            });
    }

    void sendNow(const std::string& routingKey, const std::string& message) {
        if (!channel_ || !channel_->usable()) {
            std::cerr << "[RabbitMQAdapter] Dropped " << routingKey << ": channel unusable" << std::endl;
            return;
        }
        channel_->publish(exchangeName_, routingKey, message);
        std::cout << "[RabbitMQAdapter] Published " << routingKey
                  << ": " << message.substr(0, 100) << std::endl;
    }

    void flushPending() {
        auto pending = std::move(pendingPublishes_);
        pendingPublishes_.clear();
        for (const auto& item : pending) {
            sendNow(item.first, item.second);
        }
    }

    void setupBindings() {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        if (pendingBindings_.empty()) {
            return;
        }

        channel_->declareQueue(AMQP::exclusive)
            .onSuccess([this](const std::string& name, uint32_t, uint32_t) {
                queueName_ = name;
                std::cout << "[RabbitMQAdapter] Queue declared: " << queueName_ << std::endl;

                std::lock_guard<std::mutex> lock(handlersMutex_);
                for (const auto& key : pendingBindings_) {
                    channel_->bindQueue(exchangeName_, queueName_, key);
                    std::cout << "[RabbitMQAdapter] Bound: " << key << std::endl;
                }
                pendingBindings_.clear();

                startConsuming();
            });
    }

    void startConsuming() {
        channel_->consume(queueName_)
            .onReceived([this](const AMQP::Message& msg, uint64_t tag, bool) {
                std::string routingKey = msg.routingkey();
                std::string body(msg.body(), msg.bodySize());

                std::vector<ports::output::EventHandler> handlers;
                {
                    std::lock_guard<std::mutex> lock(handlersMutex_);
                    auto it = handlers_.find(routingKey);
                    if (it != handlers_.end()) {
                        handlers = it->second;
                    }
                }

                for (const auto& handler : handlers) {
                    try {
                        handler(routingKey, body);
                    } catch (const std::exception& e) {
                        std::cerr << "[RabbitMQAdapter] Handler error on " << routingKey
                                  << ": " << e.what() << std::endl;
                    }
                }

                channel_->ack(tag);
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Consume error: " << msg << std::endl;
            });
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;
    std::string queueName_;

    std::atomic<bool> running_;
    bool ready_;   // только в потоке io_context
    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    AMQP::LibBoostAsioHandler handler_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::thread workerThread_;

    std::mutex handlersMutex_;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> handlers_;
    std::vector<std::string> pendingBindings_;
    std::vector<std::pair<std::string, std::string>> pendingPublishes_;
};

} // namespace treasury::adapters::secondary
