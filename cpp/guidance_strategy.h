/**
 * Guidance strategies: one decision path plus its announcement gate
 * behind a common interface, so the pipeline can swap between them.
 *
 *   PartitionGuidance : PartitionDecisionEngine + AnnouncementGate (Gate A)
 *   LegacyGuidance    : LegacyScoringEngine     + WarningRateLimiter (Gate B)
 *
 * The two keep separate thresholds; neither reads the other's config.
 */

#pragma once

#include "announcement_gate.h"
#include "guide_config.h"
#include "guide_types.h"
#include "legacy_scoring.h"
#include "partition_decision.h"
#include "rate_limiter.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace walkguide {

class GuidanceStrategy {
public:
    virtual ~GuidanceStrategy() = default;

    /// Evaluate one normalized frame at time `now`. Returns the speech to
    /// request, or nullopt when the gate stays silent.
    virtual std::optional<SpeechRequest> process(const std::vector<Detection>& frame,
                                                 double frame_width, double now) = 0;

    virtual void reset() = 0;
    virtual const char* name() const = 0;
};

class PartitionGuidance : public GuidanceStrategy {
public:
    PartitionGuidance(const PartitionConfig& pcfg, const GateConfig& gcfg, bool debug_logging = false)
        : engine_(pcfg, debug_logging), gate_(gcfg, debug_logging) {}

    std::optional<SpeechRequest> process(const std::vector<Detection>& frame,
                                         double frame_width, double now) override;
    void reset() override;
    const char* name() const override { return "partition"; }

    /// Outcome of the most recent frame; last_decision() is empty on a clear frame.
    std::optional<DecisionResult> last_decision() const { return last_decision_; }
    std::optional<GateVerdict> last_verdict() const { return last_verdict_; }
    const AnnouncementGate& gate() const { return gate_; }

private:
    PartitionDecisionEngine engine_;
    AnnouncementGate gate_;
    std::optional<DecisionResult> last_decision_;
    std::optional<GateVerdict> last_verdict_;
};

class LegacyGuidance : public GuidanceStrategy {
public:
    LegacyGuidance(const LegacyConfig& lcfg, const RateLimitConfig& rcfg, bool debug_logging = false)
        : engine_(lcfg, debug_logging), limiter_(rcfg, debug_logging) {}

    std::optional<SpeechRequest> process(const std::vector<Detection>& frame,
                                         double frame_width, double now) override;
    void reset() override;
    const char* name() const override { return "legacy"; }

    /// Empty when no detection survived the filter on the last frame.
    std::optional<Guidance> last_guidance() const { return last_guidance_; }
    std::optional<RateLimitVerdict> last_verdict() const { return last_verdict_; }
    const WarningRateLimiter& limiter() const { return limiter_; }

private:
    LegacyScoringEngine engine_;
    WarningRateLimiter limiter_;
    std::optional<Guidance> last_guidance_;
    std::optional<RateLimitVerdict> last_verdict_;
};

/// "partition" or "legacy"; nullptr for anything else.
std::unique_ptr<GuidanceStrategy> make_strategy(const std::string& kind, const GuideConfig& cfg);

}  // namespace walkguide
