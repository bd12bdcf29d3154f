// include/TreasuryApp.hpp
#pragma once

#include "ports/input/IVaultService.hpp"
#include "ports/input/IReserveStrategy.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "application/EpochKeeper.hpp"
#include "application/VaultCommandHandler.hpp"
#include "adapters/secondary/venues/SimulatedPriceOracle.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace treasury {

/**
 * @brief Treasury Service Application (Event-Driven)
 *
 * Слушает: vault.deposit, vault.mint, vault.withdraw, vault.redeem, vault.transfer
 * Публикует: vault.*, strategy.*, vault.command.* (в treasury.events)
 * Фон: EpochKeeper закрывает эпохи по часам
 *
 * Template Method: run() -> loadEnvironment() -> configureInjection() -> start().
 * start() блокирует поток до stop().
 */
class TreasuryApp {
public:
    TreasuryApp();
    ~TreasuryApp();

    TreasuryApp(const TreasuryApp&) = delete;
    TreasuryApp& operator=(const TreasuryApp&) = delete;

    void run(int argc, char* argv[]);

    /**
     * @brief Остановить сервис (безопасно вызывать из обработчика сигнала)
     */
    void stop();

protected:
    void loadEnvironment(int argc, char* argv[]);
    void configureInjection();
    void start();

private:
    std::shared_ptr<ports::input::IVaultService> vault_;
    std::shared_ptr<ports::input::IReserveStrategy> strategy_;
    std::shared_ptr<ports::output::IEventConsumer> eventConsumer_;
    std::shared_ptr<application::VaultCommandHandler> commandHandler_;
    std::shared_ptr<application::EpochKeeper> keeper_;
    std::shared_ptr<adapters::secondary::SimulatedPriceOracle> priceFeed_;

    std::atomic<bool> stopRequested_{false};
    std::mutex waitMutex_;
    std::condition_variable waitCondition_;
};

} // namespace treasury
