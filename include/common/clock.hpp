#pragma once

#include "common/types.hpp"
#include <atomic>
#include <memory>

namespace warden {
namespace common {

/**
 * Time source for TTL expiry and circuit breaker recovery.
 *
 * Components take a shared Clock so tests can drive time explicitly
 * instead of sleeping through recovery windows.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual timestamp_t now() const = 0;
};

class SteadyClock : public Clock {
public:
    timestamp_t now() const override { return std::chrono::steady_clock::now(); }
};

/**
 * Manually advanced clock. Starts at the real steady_clock reading taken on
 * construction and only moves when advance() is called.
 */
class ManualClock : public Clock {
public:
    ManualClock() : offset_ns_(0), base_(std::chrono::steady_clock::now()) {}

    timestamp_t now() const override {
        return base_ + std::chrono::nanoseconds(offset_ns_.load());
    }

    template<typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        offset_ns_.fetch_add(std::chrono::duration_cast<std::chrono::nanoseconds>(delta).count());
    }

private:
    std::atomic<i64> offset_ns_;
    const timestamp_t base_;
};

inline std::shared_ptr<Clock> default_clock() {
    static std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>();
    return clock;
}

} // namespace common
} // namespace warden
