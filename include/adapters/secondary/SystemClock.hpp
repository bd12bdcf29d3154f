// include/adapters/secondary/SystemClock.hpp
#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>

namespace treasury::adapters::secondary {

class SystemClock : public ports::output::IClock {
public:
    domain::UnixSeconds now() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

} // namespace treasury::adapters::secondary
