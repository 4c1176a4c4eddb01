/**
 * Announcement Gate A: partition path.
 *
 * Decides whether a fresh NavigationDecision (or the path-clear state)
 * becomes speech, and records what was spoken. Check and record happen
 * under one lock, so two concurrent callers can never both pass the same
 * cooldown window.
 *
 * Obstacle decisions, evaluated in order:
 *   1. hard floor: less than min_inter_speech_s since any announcement -> skip
 *   2. label changed since last spoken -> speak
 *   3. elapsed >= repeat interval (urgent / non-urgent) AND
 *      (|d distance| >= distance_delta OR |d occupancy| >= occupancy_delta) -> speak
 *
 * Path clear: speak once on entering the clear state, then at most every
 * path_clear_repeat_s while clear; the hard floor still applies. Entering
 * the clear state forgets the spoken label; any obstacle decision re-arms
 * the immediate path-clear announcement.
 */

#pragma once

#include "guide_config.h"
#include "guide_types.h"

#include <mutex>
#include <optional>
#include <string>

namespace walkguide {

enum class GateReason : uint8_t {
    // spoken
    ObjectChanged,
    RepeatWithDelta,
    PathClearFirst,
    PathClearRepeat,
    // suppressed
    HardFloor,
    RepeatTooSoon,
    NoSignificantChange,
    PathClearWaiting,
};

const char* to_string(GateReason r);

struct GateVerdict {
    bool speak = false;
    GateReason reason = GateReason::NoSignificantChange;
};

/// Snapshot of the gate's state, for diagnostics and tests.
struct GateState {
    std::optional<double> last_speech_time;
    std::optional<DecisionCategory> last_category;
    std::optional<double> last_spoken_distance;
    std::optional<double> last_spoken_occupancy;
    std::optional<std::string> last_spoken_label;
    std::optional<double> last_path_clear_time;
};

class AnnouncementGate {
public:
    explicit AnnouncementGate(const GateConfig& cfg = GateConfig{}, bool debug_logging = false)
        : cfg_(cfg), debug_(debug_logging) {}

    /// Check an obstacle decision at time `now`; records state when it speaks.
    GateVerdict offer(const DecisionResult& decision, double now);

    /// Check the path-clear state at time `now`; records state when it speaks.
    GateVerdict offer_path_clear(double now);

    void reset();

    GateState state() const;
    const GateConfig& config() const { return cfg_; }

private:
    bool under_hard_floor(double now) const;

    GateConfig cfg_;
    bool debug_;

    mutable std::mutex mutex_;
    GateState st_;
};

}  // namespace walkguide
