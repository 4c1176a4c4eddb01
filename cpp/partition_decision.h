/**
 * Decision Engine: partition path.
 *
 * Pure function from the frame's valid detections to one NavigationDecision:
 *
 *   1. STOP     occupancy >= full_block  AND distance <= stop_distance
 *   2. lateral  occupancy >= large_object AND distance <= alert_distance
 *   3. by center zone of the closest detection:
 *        LEFT / RIGHT -> GO_STRAIGHT
 *        CENTER       -> lateral
 *
 * "lateral" steps toward the side with less summed zone coverage; equal
 * sums step right. The closest detection is the one with minimum distance,
 * first encountered on ties.
 */

#pragma once

#include "guide_config.h"
#include "guide_types.h"

#include <optional>
#include <vector>

namespace walkguide {

class PartitionDecisionEngine {
public:
    explicit PartitionDecisionEngine(const PartitionConfig& cfg = PartitionConfig{},
                                     bool debug_logging = false)
        : cfg_(cfg), debug_(debug_logging) {}

    /// Detections that take part in the decision: confidence above the
    /// threshold and a known distance within the navigation horizon.
    std::vector<Detection> filter_valid(const std::vector<Detection>& detections) const;

    /// nullopt when `valid` is empty (the path-clear state).
    std::optional<DecisionResult> decide(const std::vector<Detection>& valid,
                                         double frame_width) const;

    /// Lateral chooser over per-detection partition analyses.
    static NavigationDecision choose_lateral(const std::vector<PartitionAnalysis>& analyses);

    const PartitionConfig& config() const { return cfg_; }

private:
    PartitionConfig cfg_;
    bool debug_;
};

}  // namespace walkguide
