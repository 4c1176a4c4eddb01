#include "guidance_strategy.h"

namespace walkguide {

// =========================================================================
// PartitionGuidance
// =========================================================================

std::optional<SpeechRequest> PartitionGuidance::process(const std::vector<Detection>& frame,
                                                        double frame_width, double now)
{
    auto valid = engine_.filter_valid(frame);
    last_decision_ = engine_.decide(valid, frame_width);

    if (!last_decision_) {
        last_verdict_ = gate_.offer_path_clear(now);
        if (!last_verdict_->speak) return std::nullopt;
        return SpeechRequest{path_clear_text(), SpeechPriority::Navigation, false};
    }

    last_verdict_ = gate_.offer(*last_decision_, now);
    if (!last_verdict_->speak) return std::nullopt;

    bool urgent = is_urgent(last_decision_->decision);
    return SpeechRequest{
        decision_speech_text(last_decision_->decision, last_decision_->label),
        urgent ? SpeechPriority::Urgent : SpeechPriority::Navigation,
        urgent
    };
}

void PartitionGuidance::reset() {
    gate_.reset();
    last_decision_.reset();
    last_verdict_.reset();
}

// =========================================================================
// LegacyGuidance
// =========================================================================

std::optional<SpeechRequest> LegacyGuidance::process(const std::vector<Detection>& frame,
                                                     double /*frame_width*/, double now)
{
    last_guidance_ = engine_.analyze(frame);
    if (!last_guidance_) {
        last_verdict_.reset();
        return std::nullopt;
    }

    last_verdict_ = limiter_.try_announce(*last_guidance_, now);
    if (*last_verdict_ != RateLimitVerdict::Allowed) return std::nullopt;

    bool urgent = last_guidance_->distance == DistanceCategory::VeryClose;
    return SpeechRequest{
        guidance_speech_text(*last_guidance_),
        urgent ? SpeechPriority::Urgent : SpeechPriority::Navigation,
        urgent
    };
}

void LegacyGuidance::reset() {
    limiter_.reset();
    last_guidance_.reset();
    last_verdict_.reset();
}

std::unique_ptr<GuidanceStrategy> make_strategy(const std::string& kind, const GuideConfig& cfg) {
    if (kind == "partition") {
        return std::make_unique<PartitionGuidance>(cfg.partition, cfg.gate, cfg.debug_logging);
    }
    if (kind == "legacy") {
        return std::make_unique<LegacyGuidance>(cfg.legacy, cfg.rate_limit, cfg.debug_logging);
    }
    return nullptr;
}

}  // namespace walkguide
