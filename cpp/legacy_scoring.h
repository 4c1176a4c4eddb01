/**
 * Decision Engine: legacy scoring path.
 *
 * Filters detections (confidence, lower half of the frame, minimum width,
 * label stoplist), assigns each survivor a Direction from its horizontal
 * third and a DistanceCategory, scores it, and returns the single
 * highest-priority Guidance:
 *
 *   priority = confidence * w_conf + distance_term * w_dist + direction_weight
 *   distance_term = 10 / clamp(d, 0.1, 10)   with meters
 *                 = 0.5                      without
 *
 * Without meters the category falls back to score = (1 - width)^4 when
 * width_fallback is enabled; otherwise FAR, which Gate B never announces.
 */

#pragma once

#include "guide_config.h"
#include "guide_types.h"

#include <optional>
#include <string>
#include <vector>

namespace walkguide {

class LegacyScoringEngine {
public:
    explicit LegacyScoringEngine(const LegacyConfig& cfg = LegacyConfig{},
                                 bool debug_logging = false);

    /// Highest-priority guidance, or nullopt when nothing survives the filter.
    /// The first candidate wins ties.
    std::optional<Guidance> analyze(const std::vector<Detection>& detections) const;

    bool should_include(const Detection& d) const;
    bool is_stoplisted(const std::string& label) const;

    Direction direction_of(double x_center) const;
    DistanceCategory distance_category(const Detection& d) const;
    DistanceCategory category_from_meters(double meters) const;
    double priority_of(const Detection& d, Direction dir) const;

    const LegacyConfig& config() const { return cfg_; }

private:
    LegacyConfig cfg_;
    std::vector<std::string> stoplist_;  // lower-cased
    bool debug_;
};

}  // namespace walkguide
