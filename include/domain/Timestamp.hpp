#pragma once

#include "domain/Amount.hpp"
#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace treasury::domain {

/**
 * @brief Момент времени в формате ISO 8601 (для событий аудита)
 *
 * Всё доменное время — UnixSeconds от IClock; Timestamp нужен только
 * для человекочитаемого представления.
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp fromUnixSeconds(UnixSeconds seconds) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::seconds(seconds)));
    }

    UnixSeconds toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(value.time_since_epoch()).count();
    }

    /**
     * @brief "2025-12-16T10:30:00Z"
     */
    std::string toString() const {
        auto timeValue = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&timeValue);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }
};

} // namespace treasury::domain
