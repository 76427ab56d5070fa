#pragma once

#include "core/core_export.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace lockbox::core {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Source of wall-clock time
 *
 * Every expiry decision goes through a Clock so that tests can move time
 * without sleeping.
 */
class LOCKBOX_CORE_EXPORT Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Current UTC time
     */
    virtual TimePoint now() const = 0;
};

/**
 * @brief Clock backed by std::chrono::system_clock
 */
class LOCKBOX_CORE_EXPORT SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

// Storage representation: milliseconds since the Unix epoch
LOCKBOX_CORE_EXPORT int64_t toEpochMillis(TimePoint tp);
LOCKBOX_CORE_EXPORT TimePoint fromEpochMillis(int64_t millis);

/**
 * @brief Format as ISO-8601 UTC with millisecond precision
 * @return e.g. "2024-05-01T12:30:00.250Z"
 */
LOCKBOX_CORE_EXPORT std::string formatIso8601(TimePoint tp);

} // namespace lockbox::core
