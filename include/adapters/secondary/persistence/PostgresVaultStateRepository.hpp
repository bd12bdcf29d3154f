// include/adapters/secondary/persistence/PostgresVaultStateRepository.hpp
#pragma once

#include "ports/output/IVaultStateRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <string>

namespace treasury::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория состояния хранилища
 *
 * Таблица: vault_state (одна строка, id = 1)
 * - параметры ставки, лимиты, пауза, счётчики эпох
 * - суммы хранятся как NUMERIC(20,0): uint64 не помещается в BIGINT
 *
 * Таблица: share_balances
 * - holder VARCHAR(128) PRIMARY KEY
 * - shares NUMERIC(20,0) NOT NULL
 *
 * Запись идёт одной транзакцией: строка состояния + изменённые балансы.
 * Нулевые балансы удаляются. load() возвращает std::nullopt только для
 * пустой таблицы, ошибка чтения пробрасывается.
 */
class PostgresVaultStateRepository : public ports::output::IVaultStateRepository {
public:
    explicit PostgresVaultStateRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    std::optional<domain::VaultState> load() override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec(
                "SELECT total_shares, target_price, base_rate_bps, sensitivity_bps, "
                "min_rate_bps, max_rate_bps, current_rate_bps, epoch_duration, "
                "last_epoch_timestamp, epoch_count, accumulated_yield_per_share, "
                "last_assets_per_share, total_dividends_paid, minting_paused, "
                "redeeming_paused, min_deposit, max_single_deposit, max_total_deposits, "
                "liquidity_buffer_bps "
                "FROM vault_state WHERE id = 1"
            );

            if (result.empty()) {
                return std::nullopt;
            }

            const auto& row = result[0];
            domain::VaultState state;
            state.totalShares = toAmount(row["total_shares"]);
            state.targetPrice = row["target_price"].as<int64_t>();
            state.rateParams.baseRateBps = row["base_rate_bps"].as<int64_t>();
            state.rateParams.sensitivityBps = row["sensitivity_bps"].as<int64_t>();
            state.rateParams.minRateBps = row["min_rate_bps"].as<int64_t>();
            state.rateParams.maxRateBps = row["max_rate_bps"].as<int64_t>();
            state.currentRateBps = row["current_rate_bps"].as<int64_t>();
            state.epochDuration = row["epoch_duration"].as<int64_t>();
            state.lastEpochTimestamp = row["last_epoch_timestamp"].as<int64_t>();
            state.epochCount = row["epoch_count"].as<int64_t>();
            state.accumulatedYieldPerShare = toAmount(row["accumulated_yield_per_share"]);
            state.lastAssetsPerShare = toAmount(row["last_assets_per_share"]);
            state.totalDividendsPaid = toAmount(row["total_dividends_paid"]);
            state.mintingPaused = row["minting_paused"].as<bool>();
            state.redeemingPaused = row["redeeming_paused"].as<bool>();
            state.limits.minDeposit = toAmount(row["min_deposit"]);
            state.limits.maxSingleDeposit = toAmount(row["max_single_deposit"]);
            state.limits.maxTotalDeposits = toAmount(row["max_total_deposits"]);
            state.liquidityBufferBps = row["liquidity_buffer_bps"].as<int64_t>();

            auto balances = txn.exec("SELECT holder, shares FROM share_balances");
            for (const auto& balance : balances) {
                state.shareBalances[balance["holder"].as<std::string>()] = toAmount(balance["shares"]);
            }

            std::cout << "[PostgresVaultRepo] Loaded epoch=" << state.epochCount
                      << " holders=" << state.shareBalances.size() << std::endl;
            return state;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresVaultRepo] load error: " << e.what() << std::endl;
            throw;
        }
    }

    void save(const domain::VaultState& state, const std::set<std::string>& touchedHolders) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                R"(
                    INSERT INTO vault_state (
                        id, total_shares, target_price, base_rate_bps, sensitivity_bps,
                        min_rate_bps, max_rate_bps, current_rate_bps, epoch_duration,
                        last_epoch_timestamp, epoch_count, accumulated_yield_per_share,
                        last_assets_per_share, total_dividends_paid, minting_paused,
                        redeeming_paused, min_deposit, max_single_deposit, max_total_deposits,
                        liquidity_buffer_bps, updated_at
                    )
                    VALUES (1, $1::NUMERIC, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11::NUMERIC,
                            $12::NUMERIC, $13::NUMERIC, $14, $15, $16::NUMERIC, $17::NUMERIC,
                            $18::NUMERIC, $19, NOW())
                    ON CONFLICT (id) DO UPDATE SET
                        total_shares = EXCLUDED.total_shares,
                        target_price = EXCLUDED.target_price,
                        base_rate_bps = EXCLUDED.base_rate_bps,
                        sensitivity_bps = EXCLUDED.sensitivity_bps,
                        min_rate_bps = EXCLUDED.min_rate_bps,
                        max_rate_bps = EXCLUDED.max_rate_bps,
                        current_rate_bps = EXCLUDED.current_rate_bps,
                        epoch_duration = EXCLUDED.epoch_duration,
                        last_epoch_timestamp = EXCLUDED.last_epoch_timestamp,
                        epoch_count = EXCLUDED.epoch_count,
                        accumulated_yield_per_share = EXCLUDED.accumulated_yield_per_share,
                        last_assets_per_share = EXCLUDED.last_assets_per_share,
                        total_dividends_paid = EXCLUDED.total_dividends_paid,
                        minting_paused = EXCLUDED.minting_paused,
                        redeeming_paused = EXCLUDED.redeeming_paused,
                        min_deposit = EXCLUDED.min_deposit,
                        max_single_deposit = EXCLUDED.max_single_deposit,
                        max_total_deposits = EXCLUDED.max_total_deposits,
                        liquidity_buffer_bps = EXCLUDED.liquidity_buffer_bps,
                        updated_at = NOW()
                )",
                std::to_string(state.totalShares),
                state.targetPrice,
                static_cast<int64_t>(state.rateParams.baseRateBps),
                static_cast<int64_t>(state.rateParams.sensitivityBps),
                static_cast<int64_t>(state.rateParams.minRateBps),
                static_cast<int64_t>(state.rateParams.maxRateBps),
                static_cast<int64_t>(state.currentRateBps),
                state.epochDuration,
                state.lastEpochTimestamp,
                static_cast<int64_t>(state.epochCount),
                std::to_string(state.accumulatedYieldPerShare),
                std::to_string(state.lastAssetsPerShare),
                std::to_string(state.totalDividendsPaid),
                state.mintingPaused,
                state.redeemingPaused,
                std::to_string(state.limits.minDeposit),
                std::to_string(state.limits.maxSingleDeposit),
                std::to_string(state.limits.maxTotalDeposits),
                static_cast<int64_t>(state.liquidityBufferBps)
            );

            for (const auto& holder : touchedHolders) {
                auto shares = state.balanceOf(holder);
                if (shares == 0) {
                    txn.exec_params("DELETE FROM share_balances WHERE holder = $1", holder);
                } else {
                    txn.exec_params(
                        "INSERT INTO share_balances (holder, shares, updated_at) "
                        "VALUES ($1, $2::NUMERIC, NOW()) "
                        "ON CONFLICT (holder) DO UPDATE SET "
                        "shares = EXCLUDED.shares, updated_at = NOW()",
                        holder,
                        std::to_string(shares)
                    );
                }
            }

            txn.commit();
            std::cout << "[PostgresVaultRepo] Saved epoch=" << state.epochCount
                      << " touched=" << touchedHolders.size() << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresVaultRepo] save error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static domain::Amount toAmount(const pqxx::field& field) {
        return std::stoull(field.as<std::string>());
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS vault_state (
                    id INTEGER PRIMARY KEY,
                    total_shares NUMERIC(20,0) NOT NULL DEFAULT 0,
                    target_price BIGINT NOT NULL,
                    base_rate_bps BIGINT NOT NULL,
                    sensitivity_bps BIGINT NOT NULL,
                    min_rate_bps BIGINT NOT NULL,
                    max_rate_bps BIGINT NOT NULL,
                    current_rate_bps BIGINT NOT NULL,
                    epoch_duration BIGINT NOT NULL,
                    last_epoch_timestamp BIGINT NOT NULL,
                    epoch_count BIGINT NOT NULL DEFAULT 0,
                    accumulated_yield_per_share NUMERIC(20,0) NOT NULL DEFAULT 0,
                    last_assets_per_share NUMERIC(20,0) NOT NULL DEFAULT 0,
                    total_dividends_paid NUMERIC(20,0) NOT NULL DEFAULT 0,
                    minting_paused BOOLEAN NOT NULL DEFAULT FALSE,
                    redeeming_paused BOOLEAN NOT NULL DEFAULT FALSE,
                    min_deposit NUMERIC(20,0) NOT NULL,
                    max_single_deposit NUMERIC(20,0) NOT NULL,
                    max_total_deposits NUMERIC(20,0) NOT NULL,
                    liquidity_buffer_bps BIGINT NOT NULL,
                    updated_at TIMESTAMP DEFAULT NOW()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS share_balances (
                    holder VARCHAR(128) PRIMARY KEY,
                    shares NUMERIC(20,0) NOT NULL,
                    updated_at TIMESTAMP DEFAULT NOW()
                )
            )");

            txn.commit();
            std::cout << "[PostgresVaultRepo] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresVaultRepo] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace treasury::adapters::secondary
