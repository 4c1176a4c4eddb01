#include "closest_object_speaker.h"

#include <cmath>
#include <cstdio>

namespace walkguide {

static Direction third_of(double x_center) {
    if (x_center < 1.0 / 3.0) return Direction::Left;
    if (x_center > 2.0 / 3.0) return Direction::Right;
    return Direction::Center;
}

bool ClosestObjectSpeaker::process(const std::vector<Detection>& detections, double now) {
    if (arbiter_.is_suppressed(SpeechPriority::Information)) return false;

    std::lock_guard<std::mutex> lock(mutex_);

    const Detection* closest = nullptr;
    for (const auto& d : detections) {
        if (d.confidence < cfg_.min_confidence || !d.distance_m) continue;
        if (!closest || *d.distance_m < *closest->distance_m) closest = &d;
    }
    if (!closest) return false;

    double smoothed = smoother_.update(*closest->distance_m);

    if (last_speech_time_ && now - *last_speech_time_ < cfg_.cooldown_s) return false;

    bool label_changed = !last_label_ || *last_label_ != closest->label;
    bool distance_changed = !last_distance_ ||
                            std::abs(smoothed - *last_distance_) > cfg_.distance_change_m;
    if (!label_changed && !distance_changed) {
        if (debug_) {
            std::printf("[ClosestObject] %s steady at %.2fm, skipping\n",
                        closest->label.c_str(), smoothed);
        }
        return false;
    }

    std::string text = closest_object_text(closest->label, smoothed, third_of(closest->x_center));
    if (!arbiter_.request(text, SpeechPriority::Information, true)) return false;

    last_label_ = closest->label;
    last_distance_ = smoothed;
    last_speech_time_ = now;

    if (debug_) {
        std::printf("[ClosestObject] \"%s\" raw=%.2fm smoothed=%.2fm\n",
                    text.c_str(), *closest->distance_m, smoothed);
    }
    return true;
}

void ClosestObjectSpeaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    smoother_.reset();
    last_label_.reset();
    last_distance_.reset();
    last_speech_time_.reset();
}

std::optional<double> ClosestObjectSpeaker::smoothed_distance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return smoother_.value();
}

}  // namespace walkguide
