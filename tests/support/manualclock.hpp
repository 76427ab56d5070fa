#pragma once

#include "core/clock.hpp"
#include <chrono>
#include <mutex>

namespace lockbox::test {

/**
 * @brief Clock that only moves when told to
 */
class ManualClock : public core::Clock {
public:
    // 2024-05-01T12:00:00Z
    ManualClock() : now_(core::fromEpochMillis(1714564800000)) {}

    core::TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void set(core::TimePoint tp) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = tp;
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> by) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += std::chrono::duration_cast<core::TimePoint::duration>(by);
    }

private:
    mutable std::mutex mutex_;
    core::TimePoint now_;
};

} // namespace lockbox::test
