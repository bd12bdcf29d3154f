#pragma once

#include "domain/Amount.hpp"
#include "domain/DepositLimits.hpp"
#include "domain/RateParams.hpp"
#include <string>

namespace treasury::settings {

class IVaultSettings {
public:
    virtual ~IVaultSettings() = default;

    virtual domain::Price getTargetPrice() const = 0;
    virtual domain::RateParams getRateParams() const = 0;
    virtual domain::UnixSeconds getEpochDuration() const = 0;
    virtual domain::DepositLimits getDepositLimits() const = 0;
    virtual std::uint64_t getLiquidityBufferBps() const = 0;

    /// Счёт хранилища в custody
    virtual std::string getAccount() const = 0;
};

} // namespace treasury::settings
