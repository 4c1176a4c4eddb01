/**
 * Partition Analyzer + partition Decision Engine tests
 *
 * 1. Zone overlap, center zone, occupancy and per-zone coverage
 * 2. STOP / lateral / GO_STRAIGHT rule order
 * 3. Lateral chooser: less-covered side wins, ties step right
 * 4. Valid-target filter and closest-target tie-break
 * 5. Walkthrough scenarios (table at 1.5 m, full-span obstacle)
 *
 * Run:
 *   ./test_partition_decision
 */

#include "test_harness.h"

#include "partition_analyzer.h"
#include "partition_decision.h"

#include <vector>

using namespace walkguide;

// Detection spanning [x0, x1] of the normalized frame
static Detection span(const std::string& label, double x0, double x1,
                      std::optional<double> dist, double conf = 0.9)
{
    Detection d;
    d.label = label;
    d.confidence = conf;
    d.x_center = (x0 + x1) / 2.0;
    d.width = x1 - x0;
    d.y_center = 0.6;
    d.height = 0.4;
    d.distance_m = dist;
    return d;
}

// =========================================================================
// Partition Analyzer
// =========================================================================

void test_analyzer_left_half_on_pixel_frame() {
    TEST("analyzer: [0, 500] on 1000px frame");
    auto pa = analyze_extent(0.0, 500.0, 1000.0);
    ASSERT_TRUE(pa.overlaps_left, "should overlap LEFT");
    ASSERT_TRUE(pa.overlaps_center, "should overlap CENTER");
    ASSERT_FALSE(pa.overlaps_right, "should not overlap RIGHT");
    ASSERT_TRUE(pa.center_zone == Zone::Left, "midpoint 250 is in LEFT");
    ASSERT_NEAR(pa.occupancy, 0.5, 1e-9, "occupancy");
    ASSERT_NEAR(pa.coverage.left, 1.0, 1e-9, "left zone fully covered");
    ASSERT_NEAR(pa.coverage.center, 0.5, 1e-9, "half the center zone");
    ASSERT_NEAR(pa.coverage.right, 0.0, 1e-9, "no right coverage");
    PASS();
}

void test_analyzer_normalized_matches_pixels() {
    TEST("analyzer: normalized detection == pixel extent");
    auto det = span("chair", 0.2, 0.7, 2.0);
    auto a = analyze_partitions(det, 640.0);
    auto b = analyze_partitions(det, 1.0);
    ASSERT_NEAR(a.occupancy, b.occupancy, 1e-9, "occupancy");
    ASSERT_NEAR(a.coverage.left, b.coverage.left, 1e-9, "left coverage");
    ASSERT_NEAR(a.coverage.center, b.coverage.center, 1e-9, "center coverage");
    ASSERT_NEAR(a.coverage.right, b.coverage.right, 1e-9, "right coverage");
    ASSERT_TRUE(a.center_zone == b.center_zone, "center zone");
    PASS();
}

void test_analyzer_right_zone_box() {
    TEST("analyzer: box inside RIGHT zone");
    auto pa = analyze_extent(0.8, 0.9, 1.0);
    ASSERT_FALSE(pa.overlaps_left, "no LEFT");
    ASSERT_FALSE(pa.overlaps_center, "no CENTER");
    ASSERT_TRUE(pa.overlaps_right, "RIGHT");
    ASSERT_TRUE(pa.center_zone == Zone::Right, "center zone RIGHT");
    ASSERT_NEAR(pa.coverage.right, 0.3, 1e-9, "0.1 of a 1/3 zone");
    PASS();
}

void test_analyzer_zero_width() {
    TEST("analyzer: zero-width box");
    auto pa = analyze_extent(0.5, 0.5, 1.0);
    ASSERT_NEAR(pa.occupancy, 0.0, 1e-12, "zero occupancy");
    ASSERT_TRUE(pa.center_zone == Zone::Center, "valid center zone");
    ASSERT_NEAR(pa.coverage.center, 0.0, 1e-12, "no coverage");
    PASS();
}

void test_analyzer_coverage_clamped() {
    TEST("analyzer: box past frame edge keeps coverage <= 1");
    auto pa = analyze_extent(-200.0, 300.0, 900.0);
    ASSERT_TRUE(pa.overlaps_left, "LEFT");
    ASSERT_NEAR(pa.coverage.left, 1.0, 1e-9, "clamped to 1");
    ASSERT_NEAR(pa.coverage.center, 0.0, 1e-9, "300 is exactly the boundary");
    PASS();
}

void test_analyzer_dominant_zone() {
    TEST("analyzer: dominant zone of coverage");
    auto pa = analyze_extent(0.3, 0.95, 1.0);
    ASSERT_TRUE(pa.coverage.dominant() == Zone::Center, "center fully covered");
    PASS();
}

// =========================================================================
// Decision rules
// =========================================================================

void test_stop_property() {
    TEST("decision: occ >= 0.60 and d <= 1.0 always STOP");
    PartitionDecisionEngine engine;
    const double widths[] = {0.65, 0.8, 1.0};
    const double centers[] = {0.35, 0.5, 0.65};
    const double dists[] = {0.3, 0.7, 1.0};
    for (double w : widths) {
        for (double c : centers) {
            for (double d : dists) {
                auto r = engine.decide({span("wall", c - w / 2, c + w / 2, d)}, 1000.0);
                ASSERT_TRUE(r.has_value(), "decision expected");
                ASSERT_TRUE(r->decision == NavigationDecision::Stop, "expected STOP");
            }
        }
    }
    PASS();
}

void test_side_objects_go_straight() {
    TEST("decision: small LEFT/RIGHT objects -> GO_STRAIGHT");
    PartitionDecisionEngine engine;
    auto l = engine.decide({span("bench", 0.05, 0.25, 2.0)}, 1.0);
    ASSERT_TRUE(l && l->decision == NavigationDecision::GoStraight, "left object");
    auto r = engine.decide({span("pole", 0.70, 0.98, 0.9)}, 1.0);
    ASSERT_TRUE(r && r->decision == NavigationDecision::GoStraight, "right object, close but small");
    PASS();
}

void test_debug_trace_same_decision() {
    TEST("decision: debug trace (with dominant coverage zone) leaves result unchanged");
    PartitionDecisionEngine quiet;
    PartitionDecisionEngine traced(PartitionConfig{}, true);
    auto det = span("table", 0.30, 0.95, 1.5);
    auto a = quiet.decide({det}, 1.0);
    auto b = traced.decide({det}, 1.0);
    ASSERT_TRUE(a && b, "both decide");
    ASSERT_TRUE(a->decision == b->decision, "same decision");
    ASSERT_TRUE(analyze_extent(0.30, 0.95, 1.0).coverage.dominant() == Zone::Center, "traced zone");
    PASS();
}

void test_center_object_lateral() {
    TEST("decision: small CENTER object -> lateral");
    PartitionDecisionEngine engine;
    auto r = engine.decide({span("person", 0.4, 0.6, 3.0)}, 1.0);
    ASSERT_TRUE(r.has_value(), "decision expected");
    ASSERT_TRUE(decision_category(r->decision) == DecisionCategory::Lateral, "lateral");
    ASSERT_TRUE(r->decision == NavigationDecision::StepRight, "no side coverage ties right");
    PASS();
}

void test_large_object_far_is_not_large() {
    TEST("decision: large LEFT object past alert distance -> GO_STRAIGHT");
    PartitionDecisionEngine engine;
    auto r = engine.decide({span("car", 0.0, 0.5, 3.0)}, 1.0);
    ASSERT_TRUE(r && r->decision == NavigationDecision::GoStraight, "3.0 m > 2.5 m alert");
    PASS();
}

void test_decision_metrics() {
    TEST("decision: result carries label, distance, occupancy");
    PartitionDecisionEngine engine;
    auto r = engine.decide({span("door", 0.2, 0.9, 0.8)}, 1.0);
    ASSERT_TRUE(r.has_value(), "decision expected");
    ASSERT_EQ_STR(r->label, "door", "label");
    ASSERT_NEAR(r->distance_m, 0.8, 1e-12, "distance");
    ASSERT_NEAR(r->occupancy, 0.7, 1e-9, "occupancy");
    ASSERT_TRUE(r->decision == NavigationDecision::Stop, "STOP");
    PASS();
}

// =========================================================================
// Lateral chooser
// =========================================================================

void test_lateral_prefers_clearer_side() {
    TEST("lateral: step toward the less covered side");
    PartitionDecisionEngine engine;
    // Closest is dead ahead; clutter on the left outweighs the right
    std::vector<Detection> frame = {
        span("person", 0.35, 0.65, 2.0),
        span("bin", 0.0, 0.2, 3.0),      // left coverage 0.6
        span("sign", 0.85, 0.95, 3.0),   // right coverage 0.3
    };
    auto r = engine.decide(frame, 1.0);
    ASSERT_TRUE(r && r->decision == NavigationDecision::StepRight, "right is clearer");

    frame[1] = span("bin", 0.1, 0.2, 3.0);    // left 0.3
    frame[2] = span("sign", 0.75, 0.95, 3.0); // right 0.6
    r = engine.decide(frame, 1.0);
    ASSERT_TRUE(r && r->decision == NavigationDecision::StepLeft, "left is clearer");
    PASS();
}

void test_lateral_sums_multiple_objects() {
    TEST("lateral: several small objects outweigh one larger");
    std::vector<PartitionAnalysis> analyses = {
        analyze_extent(0.00, 0.10, 1.0),  // left 0.3
        analyze_extent(0.15, 0.25, 1.0),  // left 0.3
        analyze_extent(0.75, 0.90, 1.0),  // right 0.45
    };
    auto d = PartitionDecisionEngine::choose_lateral(analyses);
    ASSERT_TRUE(d == NavigationDecision::StepRight, "0.6 left vs 0.45 right");
    PASS();
}

void test_lateral_tie_steps_right() {
    TEST("lateral: equal sums always STEP_RIGHT");
    PartitionAnalysis left, right;
    left.overlaps_left = true;
    left.coverage.left = 0.5;
    right.overlaps_right = true;
    right.coverage.right = 0.5;
    std::vector<PartitionAnalysis> analyses = {left, right};
    for (int i = 0; i < 5; i++) {
        ASSERT_TRUE(PartitionDecisionEngine::choose_lateral(analyses) == NavigationDecision::StepRight,
                    "tie -> right");
    }
    ASSERT_TRUE(PartitionDecisionEngine::choose_lateral({}) == NavigationDecision::StepRight,
                "empty -> right");
    PASS();
}

// =========================================================================
// Filter and target selection
// =========================================================================

void test_filter_valid() {
    TEST("filter: confidence, known distance, horizon");
    PartitionDecisionEngine engine;
    std::vector<Detection> frame = {
        span("low_conf", 0.4, 0.6, 1.0, 0.39),
        span("no_depth", 0.4, 0.6, std::nullopt),
        span("too_far", 0.4, 0.6, 3.6),
        span("at_horizon", 0.4, 0.6, 3.5),
        span("at_threshold", 0.4, 0.6, 2.0, 0.40),
    };
    auto valid = engine.filter_valid(frame);
    ASSERT_TRUE(valid.size() == 2, "two valid targets");
    ASSERT_EQ_STR(valid[0].label, "at_horizon", "horizon inclusive");
    ASSERT_EQ_STR(valid[1].label, "at_threshold", "confidence inclusive");
    PASS();
}

void test_empty_is_no_decision() {
    TEST("decision: empty input -> no decision");
    PartitionDecisionEngine engine;
    ASSERT_FALSE(engine.decide({}, 1000.0).has_value(), "nullopt expected");
    PASS();
}

void test_closest_tie_first_wins() {
    TEST("decision: equal distances pick the first detection");
    PartitionDecisionEngine engine;
    auto r = engine.decide({span("first", 0.05, 0.2, 1.5), span("second", 0.8, 0.95, 1.5)}, 1.0);
    ASSERT_TRUE(r.has_value(), "decision expected");
    ASSERT_EQ_STR(r->label, "first", "first encountered");
    PASS();
}

void test_closest_is_minimum_distance() {
    TEST("decision: closest detection drives the rules");
    PartitionDecisionEngine engine;
    auto r = engine.decide({span("far_wall", 0.0, 1.0, 3.0), span("cone", 0.05, 0.2, 1.2)}, 1.0);
    ASSERT_TRUE(r.has_value(), "decision expected");
    ASSERT_EQ_STR(r->label, "cone", "cone is closer");
    ASSERT_TRUE(r->decision == NavigationDecision::GoStraight, "cone sits on the left");
    PASS();
}

// =========================================================================
// Scenarios
// =========================================================================

void test_scenario_table() {
    TEST("scenario: table [0, 500] of 1000px at 1.5 m -> STEP_RIGHT");
    PartitionDecisionEngine engine;
    Detection table = span("table", 0.0, 0.5, 1.5);
    auto pa = analyze_partitions(table, 1000.0);
    ASSERT_TRUE(pa.center_zone == Zone::Left, "midpoint 250 < 333");
    ASSERT_NEAR(pa.occupancy, 0.5, 1e-9, "occupancy 50%");

    auto r = engine.decide({table}, 1000.0);
    ASSERT_TRUE(r.has_value(), "decision expected");
    ASSERT_TRUE(r->decision == NavigationDecision::StepRight, "large object, left blocked");
    ASSERT_EQ_STR(decision_speech_text(r->decision, r->label),
                  "table ahead of you, move right", "speech text");
    PASS();
}

void test_scenario_full_span() {
    TEST("scenario: full-span obstacle at 1.5 m -> lateral, not STOP");
    PartitionDecisionEngine engine;
    auto r = engine.decide({span("wall", 0.0, 1.0, 1.5)}, 1000.0);
    ASSERT_TRUE(r.has_value(), "decision expected");
    ASSERT_NEAR(r->occupancy, 1.0, 1e-9, "occupancy 100%");
    ASSERT_FALSE(r->decision == NavigationDecision::Stop, "1.5 m > stop distance");
    ASSERT_TRUE(decision_category(r->decision) == DecisionCategory::Lateral, "lateral");
    PASS();
}

void test_speech_texts() {
    TEST("text: decision phrases");
    ASSERT_EQ_STR(decision_speech_text(NavigationDecision::Stop, "car"), "car ahead of you, stop", "stop");
    ASSERT_EQ_STR(decision_speech_text(NavigationDecision::StepLeft, "car"), "car ahead of you, move left", "left");
    ASSERT_EQ_STR(decision_speech_text(NavigationDecision::GoStraight, "car"), "car ahead of you, move straight", "straight");
    ASSERT_EQ_STR(path_clear_text(), "path clear, move straight", "path clear");
    ASSERT_TRUE(is_urgent(NavigationDecision::Stop), "STOP urgent");
    ASSERT_FALSE(is_urgent(NavigationDecision::StepRight), "lateral not urgent");
    PASS();
}

// =========================================================================
// Main
// =========================================================================

int main() {
    std::printf("=== Partition Decision Tests ===\n");

    std::printf("\n[Partition Analyzer]\n");
    test_analyzer_left_half_on_pixel_frame();
    test_analyzer_normalized_matches_pixels();
    test_analyzer_right_zone_box();
    test_analyzer_zero_width();
    test_analyzer_coverage_clamped();
    test_analyzer_dominant_zone();

    std::printf("\n[Decision Rules]\n");
    test_stop_property();
    test_side_objects_go_straight();
    test_center_object_lateral();
    test_debug_trace_same_decision();
    test_large_object_far_is_not_large();
    test_decision_metrics();

    std::printf("\n[Lateral Chooser]\n");
    test_lateral_prefers_clearer_side();
    test_lateral_sums_multiple_objects();
    test_lateral_tie_steps_right();

    std::printf("\n[Target Selection]\n");
    test_filter_valid();
    test_empty_is_no_decision();
    test_closest_tie_first_wins();
    test_closest_is_minimum_distance();

    std::printf("\n[Scenarios]\n");
    test_scenario_table();
    test_scenario_full_span();
    test_speech_texts();

    return report_results();
}
