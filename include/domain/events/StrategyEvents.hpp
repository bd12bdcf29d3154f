#pragma once

#include "DomainEvent.hpp"
#include <string>
#include <cstdint>

namespace treasury::domain {

/**
 * @brief Событие: капитал размещён (swap + supply)
 */
struct CapitalDeployedEvent : public DomainEvent {
    Amount amount = 0;
    Amount swappedStable = 0;
    Amount volatileReceived = 0;
    Amount cashSupplied = 0;

    CapitalDeployedEvent() : DomainEvent("strategy.capital_deployed") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<CapitalDeployedEvent>(*this);
    }
};

/**
 * @brief Событие: капитал выведен из резервов
 */
struct CapitalWithdrawnEvent : public DomainEvent {
    std::string recipient;
    Amount requested = 0;
    Amount delivered = 0;
    Amount fromCash = 0;
    Amount volatileSold = 0;
    bool emergency = false;

    CapitalWithdrawnEvent() : DomainEvent("strategy.capital_withdrawn") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<CapitalWithdrawnEvent>(*this);
    }
};

/**
 * @brief Событие: перераспределение между резервами
 */
struct ReserveRebalancedEvent : public DomainEvent {
    bool sellVolatile = false;
    Amount amount = 0;          ///< В единицах стабильного актива
    Amount volatileDelta = 0;
    Amount cashDelta = 0;

    ReserveRebalancedEvent() : DomainEvent("strategy.reserve_rebalanced") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<ReserveRebalancedEvent>(*this);
    }
};

/**
 * @brief Событие: накопленные проценты собраны
 */
struct YieldHarvestedEvent : public DomainEvent {
    std::string recipient;
    Amount amount = 0;

    YieldHarvestedEvent() : DomainEvent("strategy.yield_harvested") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<YieldHarvestedEvent>(*this);
    }
};

/**
 * @brief Событие: сработал предохранитель
 */
struct CircuitBreakerTrippedEvent : public DomainEvent {
    Price checkpointPrice = 0;
    Price currentPrice = 0;
    std::uint64_t dropBps = 0;

    CircuitBreakerTrippedEvent() : DomainEvent("strategy.circuit_breaker_tripped") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<CircuitBreakerTrippedEvent>(*this);
    }
};

/**
 * @brief Событие: предохранитель сброшен администратором
 */
struct CircuitBreakerResetEvent : public DomainEvent {
    std::string resetBy;
    Price checkpointPrice = 0;

    CircuitBreakerResetEvent() : DomainEvent("strategy.circuit_breaker_reset") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<CircuitBreakerResetEvent>(*this);
    }
};

/**
 * @brief Событие: размещение отложено, средства остались в хранилище
 */
struct DeployDeferredEvent : public DomainEvent {
    Amount amount = 0;
    std::string reason;

    DeployDeferredEvent() : DomainEvent("strategy.deploy_deferred") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<DeployDeferredEvent>(*this);
    }
};

} // namespace treasury::domain
