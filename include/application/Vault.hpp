#pragma once

#include "ports/input/IVaultService.hpp"
#include "ports/input/IReserveStrategy.hpp"
#include "ports/output/IAssetCustody.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IVaultStateRepository.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "settings/IVaultSettings.hpp"
#include "application/OracleGuard.hpp"
#include "application/ReentrancyGuard.hpp"
#include "domain/VaultState.hpp"
#include "domain/events/VaultEvents.hpp"
#include "domain/events/StrategyEvents.hpp"
#include <atomic>
#include <memory>
#include <set>
#include <string>

namespace treasury::application {

/**
 * @brief Казначейское хранилище
 *
 * Архитектура:
 * - реестр долей с виртуальным смещением (10^3 доли / 1 единица актива)
 *   против атаки инфляции цены первой доли
 * - totalAssets = свободный остаток в custody + стоимость стратегии
 * - после депозита излишек сверх буфера ликвидности уходит в стратегию
 * - вывод добирает недостающее из стратегии (ensureLiquidity)
 * - тик эпохи пересчитывает ставку по цене доли и перераспределяет резервы
 *
 * Все изменяющие операции идут под ReentrancyGuard. Изменения реестра
 * сохраняются в репозиторий до того, как становятся видимыми.
 */
class Vault : public ports::input::IVaultService {
public:
    Vault(
        std::shared_ptr<settings::IVaultSettings> settings,
        std::shared_ptr<ports::output::IAssetCustody> custody,
        std::shared_ptr<OracleGuard> oracle,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IVaultStateRepository> repository,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher
    );

    // =========================================================================
    // Пользовательские операции
    // =========================================================================

    domain::Amount deposit(const domain::CallContext& ctx, domain::Amount assets,
                           const std::string& receiver) override;
    domain::Amount mint(const domain::CallContext& ctx, domain::Amount shares,
                        const std::string& receiver) override;
    domain::Amount withdraw(const domain::CallContext& ctx, domain::Amount assets,
                            const std::string& receiver, const std::string& owner) override;
    domain::Amount redeem(const domain::CallContext& ctx, domain::Amount shares,
                          const std::string& receiver, const std::string& owner) override;
    void transfer(const domain::CallContext& ctx, const std::string& to, domain::Amount shares) override;

    // =========================================================================
    // Тик эпохи
    // =========================================================================

    /**
     * @brief Пересчитать ставку и перераспределить резервы
     *
     * Idle -> Computing -> Rebalancing -> Settled. lastEpochTimestamp
     * сдвигается ровно на epochDuration, поэтому пропущенные эпохи
     * догоняются по одной за тик.
     *
     * @throws StateError(EpochNotElapsed) если эпоха ещё не истекла
     */
    domain::EpochReport rebalanceYield(const domain::CallContext& ctx) override;

    // =========================================================================
    // Администрирование
    // =========================================================================

    void setDividendParams(const domain::CallContext& ctx, const domain::RateParams& params) override;
    void setTargetPrice(const domain::CallContext& ctx, domain::Price targetPrice) override;
    void setEpochDuration(const domain::CallContext& ctx, domain::UnixSeconds duration) override;
    void setDepositLimits(const domain::CallContext& ctx, const domain::DepositLimits& limits) override;
    void setLiquidityBuffer(const domain::CallContext& ctx, std::uint64_t bufferBps) override;
    void setMintingPaused(const domain::CallContext& ctx, bool paused) override;
    void setRedeemingPaused(const domain::CallContext& ctx, bool paused) override;
    void setStrategy(const domain::CallContext& ctx,
                     std::shared_ptr<ports::input::IReserveStrategy> strategy) override;
    domain::Amount emergencyWithdrawFromStrategy(const domain::CallContext& ctx,
                                                 bool liquidateVolatile) override;

    // =========================================================================
    // Представления
    // =========================================================================

    domain::Amount totalAssets() override;
    domain::Amount idleBalance() override;
    domain::Amount convertToShares(domain::Amount assets) override;
    domain::Amount convertToAssets(domain::Amount shares) override;
    domain::Amount previewDeposit(domain::Amount assets) override;
    domain::Amount previewMint(domain::Amount shares) override;
    domain::Amount previewWithdraw(domain::Amount assets) override;
    domain::Amount previewRedeem(domain::Amount shares) override;
    domain::Amount maxDeposit(const std::string& receiver) override;
    domain::Amount maxRedeem(const std::string& owner) override;

    domain::Amount balanceOf(const std::string& holder) const override;
    domain::Amount totalShares() const override;
    /// 6 знаков стабильного актива + 3 знака виртуального смещения
    int decimals() const override { return domain::SHARE_DECIMALS; }

    domain::Amount assetsPerShare() override;
    std::uint64_t collateralRatio() override;
    domain::Amount projectedAnnualDividend() override;

    /**
     * @brief IDLE до первого тика, COMPUTING/REBALANCING во время тика,
     *        SETTLED после успешного тика до начала следующего
     */
    domain::EpochPhase epochPhase() const override { return phase_.load(); }
    domain::UnixSeconds nextEpochAt() const override;
    domain::VaultState state() const override;

private:
    std::shared_ptr<ports::output::IAssetCustody> custody_;
    std::shared_ptr<OracleGuard> oracle_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::IVaultStateRepository> repository_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<ports::input::IReserveStrategy> strategy_;

    std::string account_;
    domain::CallContext orchestrator_;
    domain::VaultState state_;
    std::atomic<domain::EpochPhase> phase_{domain::EpochPhase::IDLE};
    ReentrancyGuard guard_;

    static domain::VaultState initialState(const settings::IVaultSettings& settings, domain::UnixSeconds now);

    // Конвертация с виртуальным смещением
    static domain::Amount toShares(domain::Amount assets, domain::Amount totalAssets,
                                   domain::Amount totalShares, bool roundUp);
    static domain::Amount toAssets(domain::Amount shares, domain::Amount totalAssets,
                                   domain::Amount totalShares, bool roundUp);
    static domain::Amount assetsPerShareOf(domain::Amount totalAssets, domain::Amount totalShares);

    /**
     * @brief Пауза, минимум, максимум и общий лимит депозитов
     */
    void validateDeposit(domain::Amount assets, domain::Amount totalAssets) const;

    domain::Amount mintShares(const domain::CallContext& ctx, domain::Amount assets,
                              domain::Amount shares, const std::string& receiver);
    void burnShares(const domain::CallContext& ctx, domain::Amount assets, domain::Amount shares,
                    const std::string& receiver, const std::string& owner);

    /**
     * @brief Добрать из стратегии недостающее до required на свободном остатке
     * @throws StateError(InsufficientLiquidity) если добрать не удалось
     */
    void ensureLiquidity(domain::Amount required);

    /**
     * @brief Оценка VOLATILE на счёте хранилища в STABLE по оракулу
     *
     * Ненулевой только после emergencyWithdraw без ликвидации.
     */
    domain::Amount heldVolatileValue();

    /**
     * @brief Отправить свободный остаток сверх буфера в стратегию
     *
     * Отказ стратегии не отменяет вызывающую операцию: неразмещённый остаток
     * возвращается со счёта стратегии в idle, публикуется strategy.deploy_deferred.
     *
     * @return Размещённая сумма
     */
    domain::Amount deployIdle();

    void commit(domain::VaultState next, const std::set<std::string>& touchedHolders);
    void publish(domain::DomainEvent& event);
    void publishParameters(const domain::CallContext& ctx, const std::string& parameter,
                           const nlohmann::json& values);
};

} // namespace treasury::application
