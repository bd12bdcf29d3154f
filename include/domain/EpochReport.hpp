#pragma once

#include "domain/Amount.hpp"
#include <cstdint>

namespace treasury::domain {

/**
 * @brief Итог одного тика эпохи
 */
struct EpochReport {
    std::uint64_t epoch = 0;            ///< Номер завершённой эпохи (после инкремента)
    Price marketPrice = 0;
    Price targetPrice = 0;
    std::uint64_t newRateBps = 0;
    Amount totalAssets = 0;             ///< Снимок до ребалансировки
    Amount epochDividend = 0;           ///< Целевой дивиденд эпохи
    Amount harvested = 0;               ///< Проценты, переведённые в хранилище
    Amount liquidated = 0;              ///< Волатильный актив, проданный в кэш (в USD-единицах)
    Amount withdrawnForDividend = 0;    ///< Ликвидность, подтянутая под дивиденд
    Amount deployed = 0;                ///< Свободный остаток, вложенный в стратегию
    Amount yieldPerShareDelta = 0;      ///< Прирост accumulatedYieldPerShare
    UnixSeconds epochTimestamp = 0;     ///< Новый lastEpochTimestamp
};

} // namespace treasury::domain
