// include/adapters/secondary/persistence/PostgresStrategyStateRepository.hpp
#pragma once

#include "ports/output/IStrategyStateRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <string>

namespace treasury::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория состояния стратегии
 *
 * Таблица: strategy_state (одна строка, id = 1)
 * - volatile_held, cash_deployed NUMERIC(20,0)
 * - allocation, предохранитель, проскальзывание
 */
class PostgresStrategyStateRepository : public ports::output::IStrategyStateRepository {
public:
    explicit PostgresStrategyStateRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    std::optional<domain::StrategyState> load() override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec(
                "SELECT volatile_held, cash_deployed, volatile_bps, cash_bps, "
                "breaker_tripped, last_observed_price, last_observed_timestamp, "
                "breaker_threshold_bps, breaker_window_seconds, max_slippage_bps, "
                "swap_deadline_seconds "
                "FROM strategy_state WHERE id = 1"
            );

            if (result.empty()) {
                return std::nullopt;
            }

            const auto& row = result[0];
            domain::StrategyState state;
            state.volatileHeld = std::stoull(row["volatile_held"].as<std::string>());
            state.cashDeployed = std::stoull(row["cash_deployed"].as<std::string>());
            state.allocation.volatileBps = row["volatile_bps"].as<int64_t>();
            state.allocation.cashBps = row["cash_bps"].as<int64_t>();
            state.circuitBreakerTripped = row["breaker_tripped"].as<bool>();
            state.lastObservedPrice = row["last_observed_price"].as<int64_t>();
            state.lastObservedTimestamp = row["last_observed_timestamp"].as<int64_t>();
            state.breakerThresholdBps = row["breaker_threshold_bps"].as<int64_t>();
            state.breakerWindowSeconds = row["breaker_window_seconds"].as<int64_t>();
            state.maxSlippageBps = row["max_slippage_bps"].as<int64_t>();
            state.swapDeadlineSeconds = row["swap_deadline_seconds"].as<int64_t>();

            return state;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresStrategyRepo] load error: " << e.what() << std::endl;
            throw;
        }
    }

    void save(const domain::StrategyState& state) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                R"(
                    INSERT INTO strategy_state (
                        id, volatile_held, cash_deployed, volatile_bps, cash_bps,
                        breaker_tripped, last_observed_price, last_observed_timestamp,
                        breaker_threshold_bps, breaker_window_seconds, max_slippage_bps,
                        swap_deadline_seconds, updated_at
                    )
                    VALUES (1, $1::NUMERIC, $2::NUMERIC, $3, $4, $5, $6, $7, $8, $9, $10, $11, NOW())
                    ON CONFLICT (id) DO UPDATE SET
                        volatile_held = EXCLUDED.volatile_held,
                        cash_deployed = EXCLUDED.cash_deployed,
                        volatile_bps = EXCLUDED.volatile_bps,
                        cash_bps = EXCLUDED.cash_bps,
                        breaker_tripped = EXCLUDED.breaker_tripped,
                        last_observed_price = EXCLUDED.last_observed_price,
                        last_observed_timestamp = EXCLUDED.last_observed_timestamp,
                        breaker_threshold_bps = EXCLUDED.breaker_threshold_bps,
                        breaker_window_seconds = EXCLUDED.breaker_window_seconds,
                        max_slippage_bps = EXCLUDED.max_slippage_bps,
                        swap_deadline_seconds = EXCLUDED.swap_deadline_seconds,
                        updated_at = NOW()
                )",
                std::to_string(state.volatileHeld),
                std::to_string(state.cashDeployed),
                static_cast<int64_t>(state.allocation.volatileBps),
                static_cast<int64_t>(state.allocation.cashBps),
                state.circuitBreakerTripped,
                state.lastObservedPrice,
                state.lastObservedTimestamp,
                static_cast<int64_t>(state.breakerThresholdBps),
                state.breakerWindowSeconds,
                static_cast<int64_t>(state.maxSlippageBps),
                state.swapDeadlineSeconds
            );

            txn.commit();
            std::cout << "[PostgresStrategyRepo] Saved volatile=" << state.volatileHeld
                      << " cash=" << state.cashDeployed
                      << " tripped=" << state.circuitBreakerTripped << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresStrategyRepo] save error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS strategy_state (
                    id INTEGER PRIMARY KEY,
                    volatile_held NUMERIC(20,0) NOT NULL DEFAULT 0,
                    cash_deployed NUMERIC(20,0) NOT NULL DEFAULT 0,
                    volatile_bps BIGINT NOT NULL,
                    cash_bps BIGINT NOT NULL,
                    breaker_tripped BOOLEAN NOT NULL DEFAULT FALSE,
                    last_observed_price BIGINT NOT NULL DEFAULT 0,
                    last_observed_timestamp BIGINT NOT NULL DEFAULT 0,
                    breaker_threshold_bps BIGINT NOT NULL,
                    breaker_window_seconds BIGINT NOT NULL,
                    max_slippage_bps BIGINT NOT NULL,
                    swap_deadline_seconds BIGINT NOT NULL,
                    updated_at TIMESTAMP DEFAULT NOW()
                )
            )");

            txn.commit();
            std::cout << "[PostgresStrategyRepo] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresStrategyRepo] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace treasury::adapters::secondary
