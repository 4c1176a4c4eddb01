#include "partition_decision.h"
#include "partition_analyzer.h"

#include <cstdio>

namespace walkguide {

std::vector<Detection> PartitionDecisionEngine::filter_valid(
    const std::vector<Detection>& detections) const
{
    std::vector<Detection> valid;
    for (const auto& d : detections) {
        if (d.confidence < cfg_.min_confidence) continue;
        if (!d.distance_m) continue;
        if (*d.distance_m > cfg_.navigation_distance_m) continue;
        valid.push_back(d);
    }
    return valid;
}

NavigationDecision PartitionDecisionEngine::choose_lateral(
    const std::vector<PartitionAnalysis>& analyses)
{
    double left_sum = 0.0;
    double right_sum = 0.0;
    for (const auto& pa : analyses) {
        if (pa.overlaps_left) left_sum += pa.coverage.left;
        if (pa.overlaps_right) right_sum += pa.coverage.right;
    }
    if (left_sum < right_sum) return NavigationDecision::StepLeft;
    return NavigationDecision::StepRight;
}

std::optional<DecisionResult> PartitionDecisionEngine::decide(
    const std::vector<Detection>& valid, double frame_width) const
{
    if (valid.empty()) return std::nullopt;

    std::vector<PartitionAnalysis> analyses;
    analyses.reserve(valid.size());
    for (const auto& d : valid) {
        analyses.push_back(analyze_partitions(d, frame_width));
    }

    // Closest target; strict < keeps the first one on ties
    size_t closest = valid.size();
    for (size_t i = 0; i < valid.size(); i++) {
        if (!valid[i].distance_m) continue;
        if (closest == valid.size() || *valid[i].distance_m < *valid[closest].distance_m) {
            closest = i;
        }
    }
    if (closest == valid.size()) return std::nullopt;

    const Detection& target = valid[closest];
    const PartitionAnalysis& pa = analyses[closest];
    const double dist = *target.distance_m;

    DecisionResult result;
    result.distance_m = dist;
    result.occupancy = pa.occupancy;
    result.coverage = pa.coverage;
    result.label = target.label;

    const char* reason;
    if (pa.occupancy >= cfg_.full_block_threshold && dist <= cfg_.stop_distance_m) {
        result.decision = NavigationDecision::Stop;
        reason = "full block";
    } else if (pa.occupancy >= cfg_.large_object_threshold && dist <= cfg_.alert_distance_m) {
        result.decision = choose_lateral(analyses);
        reason = "large object";
    } else if (pa.center_zone == Zone::Center) {
        result.decision = choose_lateral(analyses);
        reason = "center obstacle";
    } else {
        result.decision = NavigationDecision::GoStraight;
        reason = "off to the side";
    }

    if (debug_) {
        std::printf("[PartitionDecision] %s at %.2fm occ=%.2f zone=%s covers=%s -> %s (%s)\n",
                    target.label.c_str(), dist, pa.occupancy, to_string(pa.center_zone),
                    to_string(pa.coverage.dominant()), to_string(result.decision), reason);
    }
    return result;
}

}  // namespace walkguide
