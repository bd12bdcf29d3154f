#pragma once

#include "DomainEvent.hpp"
#include "domain/RateParams.hpp"
#include "domain/DepositLimits.hpp"
#include <string>
#include <cstdint>

namespace treasury::domain {

/**
 * @brief Событие: депозит принят, доли выпущены
 */
struct DepositedEvent : public DomainEvent {
    std::string sender;
    std::string owner;
    Amount assets = 0;
    Amount shares = 0;

    DepositedEvent() : DomainEvent("vault.deposited") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<DepositedEvent>(*this);
    }
};

/**
 * @brief Событие: доли погашены, активы выведены
 */
struct WithdrawnEvent : public DomainEvent {
    std::string sender;
    std::string receiver;
    std::string owner;
    Amount assets = 0;
    Amount shares = 0;

    WithdrawnEvent() : DomainEvent("vault.withdrawn") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<WithdrawnEvent>(*this);
    }
};

/**
 * @brief Событие: перевод долей между держателями
 */
struct SharesTransferredEvent : public DomainEvent {
    std::string from;
    std::string to;
    Amount shares = 0;

    SharesTransferredEvent() : DomainEvent("vault.shares_transferred") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<SharesTransferredEvent>(*this);
    }
};

/**
 * @brief Событие: эпоха пересчитана
 */
struct YieldRebalancedEvent : public DomainEvent {
    std::uint64_t epoch = 0;
    std::uint64_t newRateBps = 0;
    Price marketPrice = 0;
    Price targetPrice = 0;
    Amount totalAssets = 0;
    Amount accumulatedYieldPerShare = 0;

    YieldRebalancedEvent() : DomainEvent("vault.yield_rebalanced") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<YieldRebalancedEvent>(*this);
    }
};

/**
 * @brief Событие: дивиденд эпохи обеспечен ликвидностью
 */
struct DividendDistributedEvent : public DomainEvent {
    std::uint64_t epoch = 0;
    Amount amount = 0;
    std::uint64_t rateBps = 0;

    DividendDistributedEvent() : DomainEvent("vault.dividend_distributed") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<DividendDistributedEvent>(*this);
    }
};

/**
 * @brief Событие: администратор изменил параметры хранилища
 */
struct ParametersUpdatedEvent : public DomainEvent {
    std::string changedBy;
    std::string parameter;      ///< dividend_params, target_price, pause, limits, epoch_duration
    nlohmann::json values;

    ParametersUpdatedEvent() : DomainEvent("vault.parameters_updated") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<ParametersUpdatedEvent>(*this);
    }
};

} // namespace treasury::domain
