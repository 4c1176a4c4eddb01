/**
 * Time source for the gates, arbiter and speaker.
 *
 * All cooldown logic reads "now" through a Clock so the same frame
 * sequence replays identically under a ManualClock in tests. Times are
 * double seconds, like rclcpp::Time::seconds().
 */

#pragma once

#include <chrono>
#include <mutex>

namespace walkguide {

class Clock {
public:
    virtual ~Clock() = default;
    virtual double now() const = 0;
};

/// Monotonic wall clock, seconds since an arbitrary epoch.
class SteadyClock : public Clock {
public:
    double now() const override {
        auto t = std::chrono::steady_clock::now().time_since_epoch();
        return std::chrono::duration<double>(t).count();
    }
};

/// Test clock: time only moves when told to.
class ManualClock : public Clock {
public:
    explicit ManualClock(double start = 0.0) : t_(start) {}

    double now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return t_;
    }

    void set(double t) {
        std::lock_guard<std::mutex> lock(mutex_);
        t_ = t;
    }

    void advance(double dt) {
        std::lock_guard<std::mutex> lock(mutex_);
        t_ += dt;
    }

private:
    mutable std::mutex mutex_;
    double t_;
};

}  // namespace walkguide
