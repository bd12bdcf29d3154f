#pragma once

#include "ports/output/IClock.hpp"
#include <atomic>

namespace treasury::tests {

/**
 * @brief Часы, которые двигает тест
 */
class ManualClock : public ports::output::IClock {
public:
    explicit ManualClock(domain::UnixSeconds start = 1700000000) : now_(start) {}

    domain::UnixSeconds now() const override { return now_; }

    void set(domain::UnixSeconds value) { now_ = value; }
    void advance(domain::UnixSeconds seconds) { now_ += seconds; }

private:
    std::atomic<domain::UnixSeconds> now_;
};

} // namespace treasury::tests
