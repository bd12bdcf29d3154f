#pragma once

#include "domain/Amount.hpp"

namespace treasury::domain {

/**
 * @brief Лимиты депозитов (в единицах стабильного актива)
 */
struct DepositLimits {
    Amount minDeposit = 1 * STABLE_UNIT;                    ///< $1
    Amount maxSingleDeposit = 1000000 * STABLE_UNIT;        ///< $1M
    Amount maxTotalDeposits = 100000000 * STABLE_UNIT;      ///< $100M
};

} // namespace treasury::domain
