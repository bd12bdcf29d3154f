#pragma once

#include "domain/Allocation.hpp"
#include "domain/Amount.hpp"
#include <string>

namespace treasury::settings {

class IStrategySettings {
public:
    virtual ~IStrategySettings() = default;

    virtual domain::Allocation getAllocation() const = 0;
    virtual std::uint64_t getMaxSlippageBps() const = 0;
    virtual std::uint64_t getBreakerThresholdBps() const = 0;
    virtual domain::UnixSeconds getBreakerWindowSeconds() const = 0;
    virtual domain::UnixSeconds getSwapDeadlineSeconds() const = 0;

    /// Счёт стратегии в custody
    virtual std::string getAccount() const = 0;
};

} // namespace treasury::settings
