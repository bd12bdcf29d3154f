#include "domain/events/DomainEvent.hpp"
#include "domain/Timestamp.hpp"

namespace treasury::domain {

nlohmann::json DomainEvent::envelope() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["occurredAt"] = occurredAt;
    j["timestamp"] = Timestamp::fromUnixSeconds(occurredAt).toString();
    return j;
}

} // namespace treasury::domain
