/**
 * Navigation Pipeline: per-frame driver.
 *
 *   Normalizer -> strategy (decision + gate) -> SpeechArbiter -> sink
 *              -> ClosestObjectSpeaker (optional, INFORMATION tier)
 *
 * One mutex covers a whole frame pass, reset() and strategy swaps, so a
 * reset can never land between a gate check and its record. The arbiter
 * and clock are owned by the caller and must outlive the pipeline.
 */

#pragma once

#include "clock.h"
#include "closest_object_speaker.h"
#include "detection_normalizer.h"
#include "guidance_strategy.h"
#include "guide_config.h"
#include "speech_arbiter.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace walkguide {

struct FrameOutcome {
    size_t detections = 0;
    std::optional<SpeechRequest> guidance;   // what the gate let through
    bool guidance_spoken = false;            // accepted by the arbiter
    bool information_spoken = false;
};

class NavigationPipeline {
public:
    NavigationPipeline(SpeechArbiter& arbiter, const Clock& clock,
                       const GuideConfig& cfg = GuideConfig{});

    /// Run one frame. Detections may be unnormalized; frame_width is in
    /// any unit consistent with the partition analysis (<= 0 means 1).
    FrameOutcome process_frame(const std::vector<Detection>& detections, double frame_width);

    /// New navigation session: clears strategy, speaker and arbiter state.
    void reset();

    /// Swap to "partition" or "legacy". The new strategy starts fresh.
    /// Returns false (and keeps the current one) for an unknown kind.
    bool set_strategy(const std::string& kind);
    std::string strategy_name() const;

    /// Guidance on/off. Every change resets the session; while disabled
    /// frames are ignored. Returns true if the state changed.
    bool set_enabled(bool enabled);
    bool enabled() const;

    void set_closest_object_enabled(bool enabled);

    /// For inspection between frames; do not hold across process_frame.
    const GuidanceStrategy& strategy() const { return *strategy_; }

private:
    void reset_locked();

    SpeechArbiter& arbiter_;
    const Clock& clock_;
    GuideConfig cfg_;

    mutable std::mutex mutex_;
    DetectionNormalizer normalizer_;
    std::unique_ptr<GuidanceStrategy> strategy_;
    ClosestObjectSpeaker closest_;
    bool closest_enabled_;
    bool enabled_ = true;
};

}  // namespace walkguide
