#pragma once

#include "domain/Amount.hpp"
#include "domain/enums/AssetId.hpp"
#include <string>

namespace treasury::ports::output {

/**
 * @brief Площадка обмена активов
 *
 * Обмен списывает и зачисляет средства на счёт account в custody.
 * Исполнение после deadline -> ExecutionError(DeadlineExpired),
 * нарушение границы -> ExecutionError(SlippageExceeded).
 */
class ISwapVenue {
public:
    virtual ~ISwapVenue() = default;

    /**
     * @brief Продать ровно amountIn, получить не меньше minAmountOut
     * @return Фактически полученное количество assetOut
     */
    virtual domain::Amount swapExactInput(
        domain::AssetId assetIn,
        domain::AssetId assetOut,
        domain::Amount amountIn,
        domain::Amount minAmountOut,
        domain::UnixSeconds deadline,
        const std::string& account) = 0;

    /**
     * @brief Получить ровно amountOut, потратив не больше maxAmountIn
     * @return Фактически потраченное количество assetIn
     */
    virtual domain::Amount swapExactOutput(
        domain::AssetId assetIn,
        domain::AssetId assetOut,
        domain::Amount amountOut,
        domain::Amount maxAmountIn,
        domain::UnixSeconds deadline,
        const std::string& account) = 0;
};

} // namespace treasury::ports::output
