#include "speech_arbiter.h"

#include <cstdio>
#include <iostream>

namespace walkguide {

void SpeechArbiter::open_window_locked(double until) {
    if (!suppressed_until_ || until > *suppressed_until_) suppressed_until_ = until;
}

bool SpeechArbiter::request(const std::string& text, SpeechPriority priority, bool interrupt) {
    std::lock_guard<std::mutex> lock(mutex_);
    const double now = clock_.now();

    if (text.empty()) {
        dropped_++;
        return false;
    }

    if (priority == SpeechPriority::Information &&
        suppressed_until_ && now < *suppressed_until_) {
        dropped_++;
        if (debug_) {
            std::printf("[SpeechArbiter] drop \"%s\" (information muted %.2fs)\n",
                        text.c_str(), *suppressed_until_ - now);
        }
        return false;
    }

    SpeechRequest req{text, priority, interrupt};
    if (!sink_.speak(req)) {
        dropped_++;
        std::cerr << "[SpeechArbiter] Sink rejected \"" << text << "\" ("
                  << to_string(priority) << ")" << std::endl;
        return false;
    }

    forwarded_++;
    in_flight_ = priority;
    if (priority != SpeechPriority::Information) {
        open_window_locked(now + cfg_.suppression_s);
    }

    if (debug_) {
        std::printf("[SpeechArbiter] speak \"%s\" [%s%s]\n", text.c_str(),
                    to_string(priority), interrupt ? ", interrupt" : "");
    }
    return true;
}

bool SpeechArbiter::is_suppressed(SpeechPriority tier) const {
    if (tier != SpeechPriority::Information) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return suppressed_until_ && clock_.now() < *suppressed_until_;
}

void SpeechArbiter::suppress_information(double duration_s) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_window_locked(clock_.now() + duration_s);
}

std::optional<SpeechPriority> SpeechArbiter::current_priority() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

void SpeechArbiter::notify_idle() {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.reset();
}

void SpeechArbiter::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_.stop();
    in_flight_.reset();
}

void SpeechArbiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    suppressed_until_.reset();
    in_flight_.reset();
}

size_t SpeechArbiter::forwarded_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return forwarded_;
}

size_t SpeechArbiter::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

}  // namespace walkguide
