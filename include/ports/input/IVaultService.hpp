#pragma once

#include "domain/Amount.hpp"
#include "domain/CallContext.hpp"
#include "domain/DepositLimits.hpp"
#include "domain/EpochReport.hpp"
#include "domain/RateParams.hpp"
#include "domain/VaultState.hpp"
#include "domain/enums/EpochPhase.hpp"
#include "ports/input/IReserveStrategy.hpp"
#include <memory>
#include <string>

namespace treasury::ports::input {

/**
 * @brief Казначейское хранилище: реестр долей, депозиты/выводы, тик эпохи
 *
 * Счёт вызывающего в custody совпадает с ctx.caller.
 */
class IVaultService {
public:
    virtual ~IVaultService() = default;

    // =========================================================================
    // Пользовательские операции
    // =========================================================================

    /**
     * @brief Внести assets, выпустить доли на receiver
     * @return Выпущенные доли (округление вниз)
     */
    virtual domain::Amount deposit(const domain::CallContext& ctx, domain::Amount assets,
                                   const std::string& receiver) = 0;

    /**
     * @brief Выпустить ровно shares на receiver
     * @return Списанные активы (округление вверх)
     */
    virtual domain::Amount mint(const domain::CallContext& ctx, domain::Amount shares,
                                const std::string& receiver) = 0;

    /**
     * @brief Вывести ровно assets на receiver, сжечь доли owner
     * @return Сожжённые доли (округление вверх)
     */
    virtual domain::Amount withdraw(const domain::CallContext& ctx, domain::Amount assets,
                                    const std::string& receiver, const std::string& owner) = 0;

    /**
     * @brief Погасить shares owner, перевести активы на receiver
     * @return Переведённые активы (округление вниз)
     */
    virtual domain::Amount redeem(const domain::CallContext& ctx, domain::Amount shares,
                                  const std::string& receiver, const std::string& owner) = 0;

    virtual void transfer(const domain::CallContext& ctx, const std::string& to, domain::Amount shares) = 0;

    // =========================================================================
    // Тик эпохи (KEEPER)
    // =========================================================================

    virtual domain::EpochReport rebalanceYield(const domain::CallContext& ctx) = 0;

    // =========================================================================
    // Администрирование (ADMINISTRATOR)
    // =========================================================================

    virtual void setDividendParams(const domain::CallContext& ctx, const domain::RateParams& params) = 0;
    virtual void setTargetPrice(const domain::CallContext& ctx, domain::Price targetPrice) = 0;
    virtual void setEpochDuration(const domain::CallContext& ctx, domain::UnixSeconds duration) = 0;
    virtual void setDepositLimits(const domain::CallContext& ctx, const domain::DepositLimits& limits) = 0;
    virtual void setLiquidityBuffer(const domain::CallContext& ctx, std::uint64_t bufferBps) = 0;
    virtual void setMintingPaused(const domain::CallContext& ctx, bool paused) = 0;
    virtual void setRedeemingPaused(const domain::CallContext& ctx, bool paused) = 0;
    virtual void setStrategy(const domain::CallContext& ctx, std::shared_ptr<IReserveStrategy> strategy) = 0;

    /**
     * @brief Аварийно забрать всё из стратегии в хранилище
     * @return Полученная сумма стабильного актива
     */
    virtual domain::Amount emergencyWithdrawFromStrategy(const domain::CallContext& ctx,
                                                         bool liquidateVolatile) = 0;

    // =========================================================================
    // Представления
    // =========================================================================

    virtual domain::Amount totalAssets() = 0;
    virtual domain::Amount idleBalance() = 0;
    virtual domain::Amount convertToShares(domain::Amount assets) = 0;
    virtual domain::Amount convertToAssets(domain::Amount shares) = 0;
    virtual domain::Amount previewDeposit(domain::Amount assets) = 0;
    virtual domain::Amount previewMint(domain::Amount shares) = 0;
    virtual domain::Amount previewWithdraw(domain::Amount assets) = 0;
    virtual domain::Amount previewRedeem(domain::Amount shares) = 0;
    virtual domain::Amount maxDeposit(const std::string& receiver) = 0;
    virtual domain::Amount maxRedeem(const std::string& owner) = 0;

    virtual domain::Amount balanceOf(const std::string& holder) const = 0;
    virtual domain::Amount totalShares() const = 0;
    virtual int decimals() const = 0;

    /// Стоимость одной целой доли (10^9 единиц) в единицах стабильного актива
    virtual domain::Amount assetsPerShare() = 0;

    /// (резерв + кэш) * PRECISION / обязательства
    virtual std::uint64_t collateralRatio() = 0;

    /// totalAssets * currentRate / BASIS
    virtual domain::Amount projectedAnnualDividend() = 0;

    virtual domain::EpochPhase epochPhase() const = 0;
    virtual domain::UnixSeconds nextEpochAt() const = 0;
    virtual domain::VaultState state() const = 0;
};

} // namespace treasury::ports::input
