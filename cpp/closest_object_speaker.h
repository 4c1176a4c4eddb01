/**
 * Closest-Object Speaker: INFORMATION-tier narration of the single
 * nearest detection with a known distance.
 *
 *   "<label>, about 1.8 meters to your left"
 *
 * Distance is EMA-smoothed. Speaks when the label changes or the smoothed
 * distance moved more than distance_change_m since the last announcement,
 * at most once per cooldown_s. Stays silent while the arbiter mutes
 * INFORMATION.
 */

#pragma once

#include "exponential_smoother.h"
#include "guide_config.h"
#include "guide_types.h"
#include "speech_arbiter.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace walkguide {

class ClosestObjectSpeaker {
public:
    ClosestObjectSpeaker(SpeechArbiter& arbiter, const ClosestObjectConfig& cfg = ClosestObjectConfig{},
                         bool debug_logging = false)
        : arbiter_(arbiter), cfg_(cfg), debug_(debug_logging), smoother_(cfg.ema_alpha) {}

    /// Returns true if an announcement was forwarded.
    bool process(const std::vector<Detection>& detections, double now);

    void reset();

    std::optional<double> smoothed_distance() const;

private:
    SpeechArbiter& arbiter_;
    ClosestObjectConfig cfg_;
    bool debug_;

    mutable std::mutex mutex_;
    ExponentialSmoother smoother_;
    std::optional<std::string> last_label_;
    std::optional<double> last_distance_;
    std::optional<double> last_speech_time_;
};

}  // namespace walkguide
