#include "rate_limiter.h"

#include <cstdio>
#include <sstream>

namespace walkguide {

const char* to_string(RateLimitVerdict v) {
    switch (v) {
        case RateLimitVerdict::Allowed: return "allowed";
        case RateLimitVerdict::GlobalCooldown: return "global_cooldown";
        case RateLimitVerdict::FarDistance: return "far_distance";
        case RateLimitVerdict::MediumNotCentral: return "medium_not_central";
        case RateLimitVerdict::TooSmall: return "too_small";
        case RateLimitVerdict::AtFrameEdge: return "at_frame_edge";
        case RateLimitVerdict::ObjectCooldown: return "object_cooldown";
        case RateLimitVerdict::DirectionalCooldown: return "directional_cooldown";
        case RateLimitVerdict::NotMoreDangerous: return "not_more_dangerous";
    }
    return "?";
}

RateLimitVerdict WarningRateLimiter::check_locked(const Guidance& g, double now) const {
    if (last_global_time_ && now - *last_global_time_ < cfg_.global_cooldown_s) {
        return RateLimitVerdict::GlobalCooldown;
    }

    if (g.distance == DistanceCategory::Far) {
        return RateLimitVerdict::FarDistance;
    }
    if (g.distance == DistanceCategory::Medium) {
        bool central_and_important = g.direction == Direction::Center &&
                                     g.priority > cfg_.medium_priority_threshold;
        if (!central_and_important) return RateLimitVerdict::MediumNotCentral;
    }
    if (g.width < cfg_.min_width) {
        return RateLimitVerdict::TooSmall;
    }
    if (g.x_center < cfg_.edge_margin || g.x_center > 1.0 - cfg_.edge_margin) {
        return RateLimitVerdict::AtFrameEdge;
    }

    auto it = label_time_.find(g.label);
    if (it != label_time_.end() && now - it->second < cfg_.per_object_cooldown_s) {
        return RateLimitVerdict::ObjectCooldown;
    }
    auto dit = label_direction_time_.find({g.label, g.direction});
    if (dit != label_direction_time_.end() && now - dit->second < cfg_.directional_cooldown_s) {
        return RateLimitVerdict::DirectionalCooldown;
    }

    // Moving away or holding steady never re-triggers the same label
    auto cit = label_category_.find(g.label);
    if (cit != label_category_.end() && !more_dangerous(g.distance, cit->second)) {
        return RateLimitVerdict::NotMoreDangerous;
    }
    return RateLimitVerdict::Allowed;
}

void WarningRateLimiter::record_locked(const Guidance& g, double now) {
    last_global_time_ = now;
    label_time_[g.label] = now;
    label_direction_time_[{g.label, g.direction}] = now;
    label_category_[g.label] = g.distance;
}

RateLimitVerdict WarningRateLimiter::check(const Guidance& g, double now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_locked(g, now);
}

void WarningRateLimiter::record_announcement(const Guidance& g, double now) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_locked(g, now);
}

RateLimitVerdict WarningRateLimiter::try_announce(const Guidance& g, double now) {
    std::lock_guard<std::mutex> lock(mutex_);
    RateLimitVerdict v = check_locked(g, now);
    if (v == RateLimitVerdict::Allowed) record_locked(g, now);

    if (debug_) {
        std::printf("[RateLimiter] t=%.2f %s %s %s p=%.2f -> %s\n",
                    now, g.label.c_str(), to_string(g.distance), to_string(g.direction),
                    g.priority, to_string(v));
    }
    return v;
}

double WarningRateLimiter::remaining_cooldown(const std::string& label, double now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = label_time_.find(label);
    if (it == label_time_.end()) return 0.0;
    double remaining = cfg_.per_object_cooldown_s - (now - it->second);
    return remaining > 0.0 ? remaining : 0.0;
}

std::string WarningRateLimiter::debug_info(double now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream ss;
    ss << "WarningRateLimiter:\n";

    double global_remaining = 0.0;
    if (last_global_time_) global_remaining = cfg_.global_cooldown_s - (now - *last_global_time_);
    ss << "  global cooldown: ";
    if (global_remaining > 0.0) ss << global_remaining << "s\n";
    else ss << "ready\n";

    ss << "  tracked labels: " << label_time_.size() << "\n";
    for (const auto& kv : label_time_) {
        double remaining = cfg_.per_object_cooldown_s - (now - kv.second);
        ss << "    " << kv.first << ": ";
        if (remaining > 0.0) ss << remaining << "s";
        else ss << "ready";
        auto cit = label_category_.find(kv.first);
        if (cit != label_category_.end()) ss << " (last " << to_string(cit->second) << ")";
        ss << "\n";
    }
    return ss.str();
}

void WarningRateLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_global_time_.reset();
    label_time_.clear();
    label_direction_time_.clear();
    label_category_.clear();
}

}  // namespace walkguide
