#pragma once

#include "domain/Amount.hpp"

namespace treasury::ports::output {

/**
 * @brief Источник времени (unix seconds)
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::UnixSeconds now() const = 0;
};

} // namespace treasury::ports::output
