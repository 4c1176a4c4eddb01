#include "announcement_gate.h"

#include <cmath>
#include <cstdio>

namespace walkguide {

const char* to_string(GateReason r) {
    switch (r) {
        case GateReason::ObjectChanged: return "object_changed";
        case GateReason::RepeatWithDelta: return "repeat_with_delta";
        case GateReason::PathClearFirst: return "path_clear_first";
        case GateReason::PathClearRepeat: return "path_clear_repeat";
        case GateReason::HardFloor: return "hard_floor";
        case GateReason::RepeatTooSoon: return "repeat_too_soon";
        case GateReason::NoSignificantChange: return "no_significant_change";
        case GateReason::PathClearWaiting: return "path_clear_waiting";
    }
    return "?";
}

bool AnnouncementGate::under_hard_floor(double now) const {
    return st_.last_speech_time && (now - *st_.last_speech_time) < cfg_.min_inter_speech_s;
}

GateVerdict AnnouncementGate::offer(const DecisionResult& d, double now) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Obstacles in view: the next clear state announces immediately
    st_.last_path_clear_time.reset();

    GateVerdict v;
    if (under_hard_floor(now)) {
        v.reason = GateReason::HardFloor;
    } else if (!st_.last_spoken_label || *st_.last_spoken_label != d.label) {
        v.speak = true;
        v.reason = GateReason::ObjectChanged;
    } else {
        double interval = is_urgent(d.decision) ? cfg_.urgent_repeat_s : cfg_.nonurgent_repeat_s;
        bool time_ok = !st_.last_speech_time || (now - *st_.last_speech_time) >= interval;

        // No previous value counts as an infinite delta
        bool dist_ok = !st_.last_spoken_distance ||
                       std::abs(d.distance_m - *st_.last_spoken_distance) >= cfg_.distance_delta_m;
        bool occ_ok = !st_.last_spoken_occupancy ||
                      std::abs(d.occupancy - *st_.last_spoken_occupancy) >= cfg_.occupancy_delta;

        if (!time_ok) {
            v.reason = GateReason::RepeatTooSoon;
        } else if (!dist_ok && !occ_ok) {
            v.reason = GateReason::NoSignificantChange;
        } else {
            v.speak = true;
            v.reason = GateReason::RepeatWithDelta;
        }
    }

    if (v.speak) {
        st_.last_speech_time = now;
        st_.last_category = decision_category(d.decision);
        st_.last_spoken_distance = d.distance_m;
        st_.last_spoken_occupancy = d.occupancy;
        st_.last_spoken_label = d.label;
    }

    if (debug_) {
        std::printf("[AnnouncementGate] t=%.2f %s %s d=%.2f occ=%.2f -> %s (%s)\n",
                    now, d.label.c_str(), to_string(d.decision), d.distance_m,
                    d.occupancy, v.speak ? "SPEAK" : "skip", to_string(v.reason));
    }
    return v;
}

GateVerdict AnnouncementGate::offer_path_clear(double now) {
    std::lock_guard<std::mutex> lock(mutex_);

    GateVerdict v;
    bool first = !st_.last_path_clear_time;
    if (under_hard_floor(now)) {
        v.reason = GateReason::HardFloor;
    } else if (first) {
        v.speak = true;
        v.reason = GateReason::PathClearFirst;
    } else if (now - *st_.last_path_clear_time >= cfg_.path_clear_repeat_s) {
        v.speak = true;
        v.reason = GateReason::PathClearRepeat;
    } else {
        v.reason = GateReason::PathClearWaiting;
    }

    if (v.speak) {
        st_.last_path_clear_time = now;
        st_.last_speech_time = now;
        st_.last_spoken_label.reset();
    }

    if (debug_) {
        std::printf("[AnnouncementGate] t=%.2f path clear -> %s (%s)\n",
                    now, v.speak ? "SPEAK" : "skip", to_string(v.reason));
    }
    return v;
}

void AnnouncementGate::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    st_ = GateState{};
}

GateState AnnouncementGate::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return st_;
}

}  // namespace walkguide
