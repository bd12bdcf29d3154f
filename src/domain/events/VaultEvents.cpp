#include "domain/events/VaultEvents.hpp"

namespace treasury::domain {

std::string DepositedEvent::toJson() const {
    auto j = envelope();
    j["sender"] = sender;
    j["owner"] = owner;
    j["assets"] = assets;
    j["shares"] = shares;
    return j.dump();
}

std::string WithdrawnEvent::toJson() const {
    auto j = envelope();
    j["sender"] = sender;
    j["receiver"] = receiver;
    j["owner"] = owner;
    j["assets"] = assets;
    j["shares"] = shares;
    return j.dump();
}

std::string SharesTransferredEvent::toJson() const {
    auto j = envelope();
    j["from"] = from;
    j["to"] = to;
    j["shares"] = shares;
    return j.dump();
}

std::string YieldRebalancedEvent::toJson() const {
    auto j = envelope();
    j["epoch"] = epoch;
    j["newRateBps"] = newRateBps;
    j["marketPrice"] = marketPrice;
    j["targetPrice"] = targetPrice;
    j["totalAssets"] = totalAssets;
    j["accumulatedYieldPerShare"] = accumulatedYieldPerShare;
    return j.dump();
}

std::string DividendDistributedEvent::toJson() const {
    auto j = envelope();
    j["epoch"] = epoch;
    j["amount"] = amount;
    j["rateBps"] = rateBps;
    return j.dump();
}

std::string ParametersUpdatedEvent::toJson() const {
    auto j = envelope();
    j["changedBy"] = changedBy;
    j["parameter"] = parameter;
    j["values"] = values;
    return j.dump();
}

} // namespace treasury::domain
