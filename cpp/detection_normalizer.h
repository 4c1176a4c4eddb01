/**
 * Detection Normalizer
 *
 * Boundary between the external detector / depth collaborators and the
 * decision logic. Everything downstream assumes the invariants established
 * here:
 *   - confidence and all geometry in [0, 1]
 *   - non-empty label
 *   - distance_m either absent or finite and inside [min_depth_m, max_depth_m]
 *
 * Also hosts the depth enrichment helpers: median relative depth over a box
 * region of a depth map and the relative-depth -> meters calibration.
 */

#pragma once

#include "guide_config.h"
#include "guide_types.h"

#include <Eigen/Dense>

#include <optional>
#include <string>
#include <vector>

namespace walkguide {

/// Relative depth map, rows = image height, cols = image width.
using DepthMap = Eigen::MatrixXf;

class DetectionNormalizer {
public:
    explicit DetectionNormalizer(const DepthConfig& cfg = DepthConfig{}) : cfg_(cfg) {}

    /// Clamp an already-normalized detection into the documented ranges.
    Detection normalize(const Detection& raw) const;

    /// Convert a pixel box on an image_width x image_height frame.
    Detection from_pixels(const PixelDetection& raw, int image_width, int image_height) const;

    std::vector<Detection> normalize_frame(const std::vector<Detection>& raw) const;

    const DepthConfig& config() const { return cfg_; }

private:
    std::optional<double> sanitize_distance(const std::optional<double>& d) const;

    DepthConfig cfg_;
};

// -------------------------------------------------------------------------
// Depth enrichment
// -------------------------------------------------------------------------

/// Median relative depth inside the detection's box. The box is mapped to
/// depth map indices and clamped to the map; bounds are inclusive. Returns
/// nullopt for an empty map.
std::optional<float> median_depth_for_region(const DepthMap& depth, const Detection& det);

/// relative / scale_factor, floored at 0.01 and clamped to the depth range.
double depth_to_meters(double relative_depth, const DepthConfig& cfg);

/// Fill distance_m for every detection from the depth map. Detections keep
/// their previous distance when the map yields nothing.
void enrich_with_depth(std::vector<Detection>& detections, const DepthMap& depth,
                       const DepthConfig& cfg, bool debug_logging = false);

}  // namespace walkguide
