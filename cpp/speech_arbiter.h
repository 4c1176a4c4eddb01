/**
 * Speech Arbiter: serializes speech from every producer onto one sink.
 *
 * Tiers: URGENT > NAVIGATION > INFORMATION. The arbiter never decides
 * content; it forwards, flushes and mutes:
 *   - interrupt = true flushes whatever the sink has queued or playing
 *   - a forwarded NAVIGATION or URGENT request opens a suppression window
 *     (suppression_s) during which INFORMATION requests are dropped
 *
 * All calls take the arbiter lock and the sink is invoked under it, so
 * requests reach the sink in the order the arbiter accepted them.
 */

#pragma once

#include "clock.h"
#include "guide_config.h"
#include "guide_types.h"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

namespace walkguide {

/// The text-to-speech collaborator. speak() must not block on playback.
class SpeechSink {
public:
    virtual ~SpeechSink() = default;

    /// Queue (or, with req.interrupt, flush then play) req.text.
    /// Returns false if the request could not be handed off.
    virtual bool speak(const SpeechRequest& req) = 0;

    /// Flush queued and playing speech.
    virtual void stop() {}
};

class SpeechArbiter {
public:
    SpeechArbiter(SpeechSink& sink, const Clock& clock,
                  const ArbiterConfig& cfg = ArbiterConfig{}, bool debug_logging = false)
        : sink_(sink), clock_(clock), cfg_(cfg), debug_(debug_logging) {}

    /// Returns true if the request was forwarded to the sink.
    bool request(const std::string& text, SpeechPriority priority, bool interrupt);
    bool request(const SpeechRequest& req) { return request(req.text, req.priority, req.interrupt); }

    /// True while requests of `tier` would be dropped.
    bool is_suppressed(SpeechPriority tier) const;

    /// Mute INFORMATION for duration_s from now; never shortens an open window.
    void suppress_information(double duration_s);

    /// Tier of the last forwarded request, until notify_idle() or stop().
    std::optional<SpeechPriority> current_priority() const;

    /// Called by the host when the sink finished speaking.
    void notify_idle();

    /// Flush the sink.
    void stop();

    /// Clear the suppression window and in-flight tier.
    void reset();

    size_t forwarded_count() const;
    size_t dropped_count() const;

private:
    void open_window_locked(double until);

    SpeechSink& sink_;
    const Clock& clock_;
    ArbiterConfig cfg_;
    bool debug_;

    mutable std::mutex mutex_;
    std::optional<double> suppressed_until_;
    std::optional<SpeechPriority> in_flight_;
    size_t forwarded_ = 0;
    size_t dropped_ = 0;
};

}  // namespace walkguide
