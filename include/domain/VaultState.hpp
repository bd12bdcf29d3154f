#pragma once

#include "domain/Amount.hpp"
#include "domain/RateParams.hpp"
#include "domain/DepositLimits.hpp"
#include <map>
#include <string>

namespace treasury::domain {

/**
 * @brief Персистентное состояние хранилища
 *
 * Реестр долей + параметры ставки + счётчики эпох. Свободный остаток
 * стабильного актива хранится в custody, а не здесь.
 *
 * Инвариант: сумма shareBalances == totalShares.
 */
struct VaultState {
    // Реестр долей
    std::map<std::string, Amount> shareBalances;    ///< holder -> shares (нулевые удаляются)
    Amount totalShares = 0;

    // Параметры ставки
    Price targetPrice = 100 * PRICE_UNIT;           ///< $100
    RateParams rateParams;
    std::uint64_t currentRateBps = 800;

    // Эпохи
    UnixSeconds epochDuration = 7 * 24 * 60 * 60;   ///< неделя
    UnixSeconds lastEpochTimestamp = 0;
    std::uint64_t epochCount = 0;

    // Учёт доходности
    Amount accumulatedYieldPerShare = 0;            ///< единицы стабильного актива на целую долю, не убывает
    Amount lastAssetsPerShare = 0;                  ///< снимок после ребалансировки
    Amount totalDividendsPaid = 0;

    // Пауза и лимиты
    bool mintingPaused = false;
    bool redeemingPaused = false;
    DepositLimits limits;
    std::uint64_t liquidityBufferBps = 100;         ///< 1% свободного остатка

    Amount balanceOf(const std::string& holder) const {
        auto it = shareBalances.find(holder);
        return it != shareBalances.end() ? it->second : 0;
    }
};

} // namespace treasury::domain
