#include "navigation_pipeline.h"

#include <cstdio>
#include <iostream>

namespace walkguide {

NavigationPipeline::NavigationPipeline(SpeechArbiter& arbiter, const Clock& clock,
                                       const GuideConfig& cfg)
    : arbiter_(arbiter), clock_(clock), cfg_(cfg),
      normalizer_(cfg.depth),
      closest_(arbiter, cfg.closest_object, cfg.debug_logging),
      closest_enabled_(cfg.closest_object.enabled)
{
    strategy_ = make_strategy(cfg_.strategy, cfg_);
    if (!strategy_) {
        std::cerr << "[NavigationPipeline] Unknown strategy '" << cfg_.strategy
                  << "', using partition" << std::endl;
        cfg_.strategy = "partition";
        strategy_ = make_strategy(cfg_.strategy, cfg_);
    }
    std::cout << "[NavigationPipeline] strategy=" << strategy_->name()
              << " closest_object=" << (closest_enabled_ ? "on" : "off") << std::endl;
}

FrameOutcome NavigationPipeline::process_frame(const std::vector<Detection>& detections,
                                               double frame_width)
{
    std::lock_guard<std::mutex> lock(mutex_);

    FrameOutcome out;
    if (!enabled_) return out;

    const double now = clock_.now();
    std::vector<Detection> frame = normalizer_.normalize_frame(detections);
    out.detections = frame.size();

    out.guidance = strategy_->process(frame, frame_width, now);
    if (out.guidance) {
        out.guidance_spoken = arbiter_.request(*out.guidance);
        if (!out.guidance_spoken) {
            std::cerr << "[NavigationPipeline] Guidance not spoken: \""
                      << out.guidance->text << "\"" << std::endl;
        }
    }

    if (closest_enabled_) {
        out.information_spoken = closest_.process(frame, now);
    }

    if (cfg_.debug_logging) {
        std::printf("[NavigationPipeline] t=%.2f n=%zu guidance=%s info=%d\n",
                    now, out.detections,
                    out.guidance ? out.guidance->text.c_str() : "-",
                    out.information_spoken ? 1 : 0);
    }
    return out;
}

void NavigationPipeline::reset_locked() {
    strategy_->reset();
    closest_.reset();
    arbiter_.reset();
}

void NavigationPipeline::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked();
    std::cout << "[NavigationPipeline] Session reset" << std::endl;
}

bool NavigationPipeline::set_strategy(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = make_strategy(kind, cfg_);
    if (!next) {
        std::cerr << "[NavigationPipeline] Unknown strategy '" << kind << "'" << std::endl;
        return false;
    }
    strategy_ = std::move(next);
    cfg_.strategy = kind;
    std::cout << "[NavigationPipeline] strategy=" << strategy_->name() << std::endl;
    return true;
}

std::string NavigationPipeline::strategy_name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return strategy_->name();
}

bool NavigationPipeline::set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (enabled == enabled_) return false;
    enabled_ = enabled;
    reset_locked();
    if (!enabled_) arbiter_.stop();
    std::cout << "[NavigationPipeline] Guidance " << (enabled_ ? "enabled" : "disabled")
              << std::endl;
    return true;
}

bool NavigationPipeline::enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

void NavigationPipeline::set_closest_object_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (enabled != closest_enabled_) closest_.reset();
    closest_enabled_ = enabled;
}

}  // namespace walkguide
