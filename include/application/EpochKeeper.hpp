// include/application/EpochKeeper.hpp
#pragma once

#include "ports/input/IVaultService.hpp"
#include "domain/CallContext.hpp"
#include "domain/TreasuryError.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace treasury::application {

/**
 * @brief Фоновый поток, запускающий тик эпохи хранилища
 *
 * Раз в pollInterval проверяет, не истекла ли эпоха, и вызывает
 * rebalanceYield с полномочием KEEPER. Пропущенные эпохи догоняются
 * по одной за вызов, пока хранилище не ответит EpochNotElapsed.
 */
class EpochKeeper {
public:
    EpochKeeper(
        std::shared_ptr<ports::input::IVaultService> vault,
        const std::string& account,
        std::chrono::milliseconds interval = std::chrono::milliseconds{60000})
        : vault_(std::move(vault))
        , ctx_(domain::CallContext::keeper(account))
        , interval_(interval)
        , running_(false)
        , tickCount_(0)
        , epochsSettled_(0)
    {}

    ~EpochKeeper() {
        stop();
    }

    // Non-copyable, non-movable
    EpochKeeper(const EpochKeeper&) = delete;
    EpochKeeper& operator=(const EpochKeeper&) = delete;

    void start() {
        if (running_.exchange(true)) return;

        std::cout << "[EpochKeeper] Started, poll interval " << interval_.count() << " ms" << std::endl;
        thread_ = std::thread([this]() {
            while (running_) {
                doTick();
                sleepInterval();
            }
        });
    }

    void stop() {
        running_ = false;
        if (thread_.joinable()) {
            thread_.join();
            std::cout << "[EpochKeeper] Stopped after " << tickCount_ << " ticks" << std::endl;
        }
    }

    bool isRunning() const { return running_; }

    std::uint64_t tickCount() const { return tickCount_; }

    std::uint64_t epochsSettled() const { return epochsSettled_; }

    /**
     * @brief Выполнить один тик вручную (для тестов)
     * @return Количество эпох, закрытых за тик
     */
    std::uint64_t manualTick() {
        return doTick();
    }

private:
    std::shared_ptr<ports::input::IVaultService> vault_;
    domain::CallContext ctx_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_;
    std::atomic<std::uint64_t> tickCount_;
    std::atomic<std::uint64_t> epochsSettled_;
    std::thread thread_;

    std::uint64_t doTick() {
        std::uint64_t settled = 0;
        try {
            while (true) {
                auto report = vault_->rebalanceYield(ctx_);
                ++settled;
                std::cout << "[EpochKeeper] Epoch " << report.epoch
                          << " settled, rate=" << report.newRateBps << " bps" << std::endl;
            }
        } catch (const domain::TreasuryError& e) {
            if (e.code() != domain::ErrorCode::EpochNotElapsed) {
                std::cerr << "[EpochKeeper] Epoch tick failed: " << e.what() << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[EpochKeeper] Unexpected error: " << e.what() << std::endl;
        }

        epochsSettled_ += settled;
        ++tickCount_;
        return settled;
    }

    // Сон короткими отрезками, чтобы stop() не ждал весь интервал
    void sleepInterval() {
        auto step = std::chrono::milliseconds{50};
        auto waited = std::chrono::milliseconds{0};
        while (running_ && waited < interval_) {
            auto chunk = std::min(step, interval_ - waited);
            std::this_thread::sleep_for(chunk);
            waited += chunk;
        }
    }
};

} // namespace treasury::application
