/**
 * Speech Arbiter + Closest-Object Speaker tests
 *
 * A RecordingSink stands in for TTS and a ManualClock drives the
 * suppression window, so every case is deterministic.
 *
 * Run:
 *   ./test_speech_arbiter
 */

#include "test_harness.h"

#include "clock.h"
#include "closest_object_speaker.h"
#include "speech_arbiter.h"

#include <vector>

using namespace walkguide;

/// Records every request; can be told to reject.
class RecordingSink : public SpeechSink {
public:
    bool speak(const SpeechRequest& req) override {
        if (fail) return false;
        requests.push_back(req);
        return true;
    }
    void stop() override { stops++; }

    std::vector<SpeechRequest> requests;
    bool fail = false;
    int stops = 0;
};

static Detection ranged(const std::string& label, double x, double dist, double conf = 0.8) {
    Detection d;
    d.label = label;
    d.confidence = conf;
    d.x_center = x;
    d.y_center = 0.7;
    d.width = 0.2;
    d.height = 0.4;
    d.distance_m = dist;
    return d;
}

// =========================================================================
// Arbiter
// =========================================================================

void test_navigation_opens_window() {
    TEST("arbiter: NAVIGATION mutes INFORMATION for 1.5 s");
    RecordingSink sink;
    ManualClock clock(10.0);
    SpeechArbiter arbiter(sink, clock);

    ASSERT_TRUE(arbiter.request("chair ahead of you, move left", SpeechPriority::Navigation, false), "nav");
    clock.advance(1.0);
    ASSERT_TRUE(arbiter.is_suppressed(SpeechPriority::Information), "muted at +1.0");
    ASSERT_FALSE(arbiter.request("door, about 3.0 meters ahead", SpeechPriority::Information, true), "dropped");
    clock.advance(0.6);
    ASSERT_FALSE(arbiter.is_suppressed(SpeechPriority::Information), "window closed at +1.6");
    ASSERT_TRUE(arbiter.request("door, about 3.0 meters ahead", SpeechPriority::Information, true), "forwarded");

    ASSERT_TRUE(sink.requests.size() == 2, "two reached the sink");
    ASSERT_TRUE(arbiter.forwarded_count() == 2, "forwarded count");
    ASSERT_TRUE(arbiter.dropped_count() == 1, "dropped count");
    PASS();
}

void test_higher_tiers_never_suppressed() {
    TEST("arbiter: URGENT and NAVIGATION pass inside the window");
    RecordingSink sink;
    ManualClock clock;
    SpeechArbiter arbiter(sink, clock);

    arbiter.request("a", SpeechPriority::Urgent, true);
    ASSERT_FALSE(arbiter.is_suppressed(SpeechPriority::Urgent), "urgent");
    ASSERT_FALSE(arbiter.is_suppressed(SpeechPriority::Navigation), "navigation");
    ASSERT_TRUE(arbiter.request("b", SpeechPriority::Navigation, false), "navigation forwarded");
    ASSERT_TRUE(arbiter.request("c", SpeechPriority::Urgent, true), "urgent forwarded");
    PASS();
}

void test_information_does_not_open_window() {
    TEST("arbiter: INFORMATION speech leaves INFORMATION unmuted");
    RecordingSink sink;
    ManualClock clock;
    SpeechArbiter arbiter(sink, clock);
    arbiter.request("cup, about 1.0 meters ahead", SpeechPriority::Information, true);
    ASSERT_FALSE(arbiter.is_suppressed(SpeechPriority::Information), "not muted");
    PASS();
}

void test_interrupt_passthrough() {
    TEST("arbiter: interrupt flag and tier reach the sink unchanged");
    RecordingSink sink;
    ManualClock clock;
    SpeechArbiter arbiter(sink, clock);
    arbiter.request("wall ahead of you, stop", SpeechPriority::Urgent, true);
    arbiter.request(SpeechRequest{"path clear, move straight", SpeechPriority::Navigation, false});
    ASSERT_TRUE(sink.requests[0].interrupt, "first interrupts");
    ASSERT_TRUE(sink.requests[0].priority == SpeechPriority::Urgent, "first urgent");
    ASSERT_FALSE(sink.requests[1].interrupt, "second queues");
    ASSERT_EQ_STR(sink.requests[1].text, "path clear, move straight", "text");
    PASS();
}

void test_sink_failure() {
    TEST("arbiter: sink failure reports false and opens no window");
    RecordingSink sink;
    sink.fail = true;
    ManualClock clock;
    SpeechArbiter arbiter(sink, clock);
    ASSERT_FALSE(arbiter.request("chair ahead of you, move left", SpeechPriority::Navigation, false), "rejected");
    ASSERT_FALSE(arbiter.is_suppressed(SpeechPriority::Information), "no window");
    ASSERT_FALSE(arbiter.current_priority().has_value(), "nothing in flight");
    ASSERT_TRUE(arbiter.dropped_count() == 1, "counted as dropped");
    PASS();
}

void test_explicit_suppression() {
    TEST("arbiter: suppress_information never shortens a window");
    RecordingSink sink;
    ManualClock clock;
    SpeechArbiter arbiter(sink, clock);
    arbiter.suppress_information(5.0);
    arbiter.request("a", SpeechPriority::Navigation, false);  // would end at 1.5
    clock.set(4.0);
    ASSERT_TRUE(arbiter.is_suppressed(SpeechPriority::Information), "5 s window kept");
    clock.set(5.0);
    ASSERT_FALSE(arbiter.is_suppressed(SpeechPriority::Information), "expired");
    PASS();
}

void test_current_priority_and_idle() {
    TEST("arbiter: current priority tracks in-flight tier");
    RecordingSink sink;
    ManualClock clock;
    SpeechArbiter arbiter(sink, clock);
    ASSERT_FALSE(arbiter.current_priority().has_value(), "idle at start");
    arbiter.request("a", SpeechPriority::Navigation, false);
    ASSERT_TRUE(*arbiter.current_priority() == SpeechPriority::Navigation, "navigation");
    arbiter.notify_idle();
    ASSERT_FALSE(arbiter.current_priority().has_value(), "idle again");
    PASS();
}

void test_stop_and_reset() {
    TEST("arbiter: stop flushes sink, reset clears the window");
    RecordingSink sink;
    ManualClock clock;
    SpeechArbiter arbiter(sink, clock);
    arbiter.request("a", SpeechPriority::Urgent, true);
    arbiter.stop();
    ASSERT_TRUE(sink.stops == 1, "sink stopped");
    ASSERT_FALSE(arbiter.current_priority().has_value(), "nothing in flight");
    ASSERT_TRUE(arbiter.is_suppressed(SpeechPriority::Information), "stop keeps the window");
    arbiter.reset();
    ASSERT_FALSE(arbiter.is_suppressed(SpeechPriority::Information), "reset clears it");
    PASS();
}

void test_empty_text_dropped() {
    TEST("arbiter: empty text never reaches the sink");
    RecordingSink sink;
    ManualClock clock;
    SpeechArbiter arbiter(sink, clock);
    ASSERT_FALSE(arbiter.request("", SpeechPriority::Urgent, true), "dropped");
    ASSERT_TRUE(sink.requests.empty(), "sink untouched");
    PASS();
}

// =========================================================================
// Closest-object speaker
// =========================================================================

void test_speaker_announces_closest() {
    TEST("speaker: nearest ranged detection, INFORMATION + interrupt");
    RecordingSink sink;
    ManualClock clock;
    SpeechArbiter arbiter(sink, clock);
    ClosestObjectSpeaker speaker(arbiter);

    Detection unranged = ranged("person", 0.5, 0.0);
    unranged.distance_m.reset();
    bool spoke = speaker.process({ranged("table", 0.8, 3.0), ranged("chair", 0.5, 1.5),
                                  ranged("lamp", 0.2, 0.5, 0.2), unranged}, 0.0);
    ASSERT_TRUE(spoke, "spoke");
    ASSERT_EQ_STR(sink.requests.back().text, "chair, about 1.5 meters ahead", "text");
    ASSERT_TRUE(sink.requests.back().priority == SpeechPriority::Information, "information");
    ASSERT_TRUE(sink.requests.back().interrupt, "interrupt");
    PASS();
}

void test_speaker_smoothing() {
    TEST("speaker: EMA 2.0 then 3.0 with alpha 0.35 -> 2.35");
    RecordingSink sink;
    ManualClock clock;
    SpeechArbiter arbiter(sink, clock);
    ClosestObjectSpeaker speaker(arbiter);
    speaker.process({ranged("chair", 0.5, 2.0)}, 0.0);
    speaker.process({ranged("chair", 0.5, 3.0)}, 0.5);
    ASSERT_NEAR(*speaker.smoothed_distance(), 2.35, 1e-9, "smoothed");
    PASS();
}

void test_speaker_cooldown_and_hysteresis() {
    TEST("speaker: cooldown then 0.3 m hysteresis");
    RecordingSink sink;
    ManualClock clock;
    SpeechArbiter arbiter(sink, clock);
    ClosestObjectSpeaker speaker(arbiter);

    ASSERT_TRUE(speaker.process({ranged("chair", 0.5, 2.0)}, 0.0), "first");
    ASSERT_FALSE(speaker.process({ranged("sofa", 0.5, 1.0)}, 1.0), "label change inside cooldown");
    // smoothed: 2.0 -> 1.65 -> 1.673, 0.33 m from the last announcement
    ASSERT_TRUE(speaker.process({ranged("chair", 0.5, 1.715)}, 2.0), "moved > 0.3 m");

    ManualClock clock2;
    SpeechArbiter arbiter2(sink, clock2);
    ClosestObjectSpeaker steady(arbiter2);
    steady.process({ranged("chair", 0.5, 2.0)}, 0.0);
    ASSERT_FALSE(steady.process({ranged("chair", 0.5, 2.2)}, 2.0), "0.07 m smoothed change");
    ASSERT_TRUE(steady.process({ranged("bench", 0.5, 2.2)}, 4.0), "label change");
    PASS();
}

void test_speaker_yields_to_navigation() {
    TEST("speaker: silent while navigation speech mutes INFORMATION");
    RecordingSink sink;
    ManualClock clock;
    SpeechArbiter arbiter(sink, clock);
    ClosestObjectSpeaker speaker(arbiter);

    arbiter.request("chair ahead of you, move left", SpeechPriority::Navigation, false);
    ASSERT_FALSE(speaker.process({ranged("chair", 0.5, 2.0)}, 0.5), "muted");
    ASSERT_FALSE(speaker.smoothed_distance().has_value(), "frame not consumed");
    clock.set(2.0);
    ASSERT_TRUE(speaker.process({ranged("chair", 0.5, 2.0)}, 2.0), "window over");
    PASS();
}

void test_speaker_reset() {
    TEST("speaker: reset forgets label, distance and cooldown");
    RecordingSink sink;
    ManualClock clock;
    SpeechArbiter arbiter(sink, clock);
    ClosestObjectSpeaker speaker(arbiter);
    speaker.process({ranged("chair", 0.5, 2.0)}, 0.0);
    speaker.reset();
    ASSERT_FALSE(speaker.smoothed_distance().has_value(), "smoother cleared");
    ASSERT_TRUE(speaker.process({ranged("chair", 0.5, 2.0)}, 0.1), "speaks again immediately");
    PASS();
}

// =========================================================================
// Main
// =========================================================================

int main() {
    std::printf("=== Speech Arbiter Tests ===\n");

    std::printf("\n[Arbiter]\n");
    test_navigation_opens_window();
    test_higher_tiers_never_suppressed();
    test_information_does_not_open_window();
    test_interrupt_passthrough();
    test_sink_failure();
    test_explicit_suppression();
    test_current_priority_and_idle();
    test_stop_and_reset();
    test_empty_text_dropped();

    std::printf("\n[Closest-Object Speaker]\n");
    test_speaker_announces_closest();
    test_speaker_smoothing();
    test_speaker_cooldown_and_hysteresis();
    test_speaker_yields_to_navigation();
    test_speaker_reset();

    return report_results();
}
