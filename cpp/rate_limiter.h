/**
 * Announcement Gate B: label/direction keyed rate limiter for the legacy
 * scoring path.
 *
 * Rules, first failing one suppresses:
 *   1. global cooldown since any announcement
 *   2. FAR is never announced
 *   3. MEDIUM only when CENTER and priority > medium_priority_threshold
 *   4. box narrower than min_width
 *   5. x_center within edge_margin of either frame edge
 *   6. per-label cooldown
 *   7. per-label+direction cooldown
 *   8. a label with a recorded category must become strictly more dangerous
 *
 * A label that was never recorded has no per-label cooldown. Allowing
 * records the global, per-label and per-label+direction times and the
 * label's distance category.
 */

#pragma once

#include "guide_config.h"
#include "guide_types.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace walkguide {

enum class RateLimitVerdict : uint8_t {
    Allowed,
    GlobalCooldown,
    FarDistance,
    MediumNotCentral,
    TooSmall,
    AtFrameEdge,
    ObjectCooldown,
    DirectionalCooldown,
    NotMoreDangerous,
};

const char* to_string(RateLimitVerdict v);

class WarningRateLimiter {
public:
    explicit WarningRateLimiter(const RateLimitConfig& cfg = RateLimitConfig{},
                                bool debug_logging = false)
        : cfg_(cfg), debug_(debug_logging) {}

    /// Evaluate the rules without recording anything.
    RateLimitVerdict check(const Guidance& g, double now) const;
    bool should_announce(const Guidance& g, double now) const {
        return check(g, now) == RateLimitVerdict::Allowed;
    }

    void record_announcement(const Guidance& g, double now);

    /// check + record under one lock.
    RateLimitVerdict try_announce(const Guidance& g, double now);

    /// Seconds left on the per-label cooldown, 0 when none is active.
    double remaining_cooldown(const std::string& label, double now) const;

    std::string debug_info(double now) const;

    void reset();

private:
    RateLimitVerdict check_locked(const Guidance& g, double now) const;
    void record_locked(const Guidance& g, double now);

    RateLimitConfig cfg_;
    bool debug_;

    mutable std::mutex mutex_;
    std::optional<double> last_global_time_;
    std::map<std::string, double> label_time_;
    std::map<std::pair<std::string, Direction>, double> label_direction_time_;
    std::map<std::string, DistanceCategory> label_category_;
};

}  // namespace walkguide
