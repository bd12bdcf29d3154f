#include "domain/events/StrategyEvents.hpp"

namespace treasury::domain {

std::string CapitalDeployedEvent::toJson() const {
    auto j = envelope();
    j["amount"] = amount;
    j["swappedStable"] = swappedStable;
    j["volatileReceived"] = volatileReceived;
    j["cashSupplied"] = cashSupplied;
    return j.dump();
}

std::string CapitalWithdrawnEvent::toJson() const {
    auto j = envelope();
    j["recipient"] = recipient;
    j["requested"] = requested;
    j["delivered"] = delivered;
    j["fromCash"] = fromCash;
    j["volatileSold"] = volatileSold;
    j["emergency"] = emergency;
    return j.dump();
}

std::string ReserveRebalancedEvent::toJson() const {
    auto j = envelope();
    j["direction"] = sellVolatile ? "SELL_VOLATILE" : "BUY_VOLATILE";
    j["amount"] = amount;
    j["volatileDelta"] = volatileDelta;
    j["cashDelta"] = cashDelta;
    return j.dump();
}

std::string YieldHarvestedEvent::toJson() const {
    auto j = envelope();
    j["recipient"] = recipient;
    j["amount"] = amount;
    return j.dump();
}

std::string CircuitBreakerTrippedEvent::toJson() const {
    auto j = envelope();
    j["checkpointPrice"] = checkpointPrice;
    j["currentPrice"] = currentPrice;
    j["dropBps"] = dropBps;
    return j.dump();
}

std::string CircuitBreakerResetEvent::toJson() const {
    auto j = envelope();
    j["resetBy"] = resetBy;
    j["checkpointPrice"] = checkpointPrice;
    return j.dump();
}

std::string DeployDeferredEvent::toJson() const {
    auto j = envelope();
    j["amount"] = amount;
    j["reason"] = reason;
    return j.dump();
}

} // namespace treasury::domain
