#include "detection_normalizer.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace walkguide {

static double clamp01(double v) {
    if (!std::isfinite(v)) return 0.0;
    return std::clamp(v, 0.0, 1.0);
}

std::optional<double> DetectionNormalizer::sanitize_distance(
    const std::optional<double>& d) const
{
    if (!d || !std::isfinite(*d)) return std::nullopt;
    return std::clamp(*d, cfg_.min_depth_m, cfg_.max_depth_m);
}

Detection DetectionNormalizer::normalize(const Detection& raw) const {
    Detection out;
    out.label = raw.label.empty() ? "unknown" : raw.label;
    out.confidence = clamp01(raw.confidence);
    out.x_center = clamp01(raw.x_center);
    out.y_center = clamp01(raw.y_center);
    out.width = clamp01(raw.width);
    out.height = clamp01(raw.height);
    out.distance_m = sanitize_distance(raw.distance_m);
    return out;
}

Detection DetectionNormalizer::from_pixels(const PixelDetection& raw,
                                           int image_width, int image_height) const
{
    double w = std::max(image_width, 1);
    double h = std::max(image_height, 1);

    double x0 = std::min(raw.left, raw.right);
    double x1 = std::max(raw.left, raw.right);
    double y0 = std::min(raw.top, raw.bottom);
    double y1 = std::max(raw.top, raw.bottom);

    Detection d;
    d.label = raw.label;
    d.confidence = raw.score;
    d.x_center = (x0 + x1) / 2.0 / w;
    d.y_center = (y0 + y1) / 2.0 / h;
    d.width = (x1 - x0) / w;
    d.height = (y1 - y0) / h;
    d.distance_m = raw.distance_m;
    return normalize(d);
}

std::vector<Detection> DetectionNormalizer::normalize_frame(
    const std::vector<Detection>& raw) const
{
    std::vector<Detection> out;
    out.reserve(raw.size());
    for (const auto& d : raw) {
        out.push_back(normalize(d));
    }
    return out;
}

// =========================================================================
// Depth enrichment
// =========================================================================

std::optional<float> median_depth_for_region(const DepthMap& depth, const Detection& det) {
    const int cols = static_cast<int>(depth.cols());
    const int rows = static_cast<int>(depth.rows());
    if (cols == 0 || rows == 0) return std::nullopt;

    auto to_index = [](double frac, int n) {
        int i = static_cast<int>(clamp01(frac) * n);
        return std::clamp(i, 0, n - 1);
    };

    int left = to_index(det.x_center - det.width / 2.0, cols);
    int right = to_index(det.x_center + det.width / 2.0, cols);
    int top = to_index(det.y_center - det.height / 2.0, rows);
    int bottom = to_index(det.y_center + det.height / 2.0, rows);
    // Negative width/height flips the edges
    if (left > right) std::swap(left, right);
    if (top > bottom) std::swap(top, bottom);

    Eigen::MatrixXf region = depth.block(top, left, bottom - top + 1, right - left + 1);
    std::vector<float> values(region.data(), region.data() + region.size());

    auto mid = values.begin() + values.size() / 2;
    std::nth_element(values.begin(), mid, values.end());
    return *mid;
}

double depth_to_meters(double relative_depth, const DepthConfig& cfg) {
    double meters = std::max(relative_depth / cfg.scale_factor, 0.01);
    return std::clamp(meters, cfg.min_depth_m, cfg.max_depth_m);
}

void enrich_with_depth(std::vector<Detection>& detections, const DepthMap& depth,
                       const DepthConfig& cfg, bool debug_logging)
{
    int enriched = 0;
    for (auto& det : detections) {
        auto rel = median_depth_for_region(depth, det);
        if (!rel || !std::isfinite(*rel)) continue;
        det.distance_m = depth_to_meters(*rel, cfg);
        enriched++;
        if (debug_logging) {
            std::printf("[DepthEnrich] %s: depth=%.1f distance=%.2fm\n",
                        det.label.c_str(), *rel, *det.distance_m);
        }
    }
    if (debug_logging) {
        std::printf("[DepthEnrich] %d/%zu detections have depth\n",
                    enriched, detections.size());
    }
}

}  // namespace walkguide
