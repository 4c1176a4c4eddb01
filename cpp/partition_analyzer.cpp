#include "partition_analyzer.h"

#include <algorithm>

namespace walkguide {

// Fraction of [z0, z1] covered by [left, right], 0 when disjoint.
static double zone_coverage(double left, double right, double z0, double z1) {
    double overlap = std::min(right, z1) - std::max(left, z0);
    if (overlap <= 0.0) return 0.0;
    return std::clamp(overlap / (z1 - z0), 0.0, 1.0);
}

Zone zone_of(double x, double frame_width) {
    double w = frame_width > 0.0 ? frame_width : 1.0;
    if (x < w / 3.0) return Zone::Left;
    if (x < w * 2.0 / 3.0) return Zone::Center;
    return Zone::Right;
}

PartitionAnalysis analyze_extent(double left, double right, double frame_width) {
    const double w = frame_width > 0.0 ? frame_width : 1.0;
    const double b1 = w / 3.0;
    const double b2 = w * 2.0 / 3.0;

    if (right < left) std::swap(left, right);

    PartitionAnalysis pa;
    pa.overlaps_left = left < b1;
    pa.overlaps_center = right > b1 && left < b2;
    pa.overlaps_right = right > b2;
    pa.center_zone = zone_of((left + right) / 2.0, w);
    pa.occupancy = (right - left) / w;

    pa.coverage.left = pa.overlaps_left ? zone_coverage(left, right, 0.0, b1) : 0.0;
    pa.coverage.center = pa.overlaps_center ? zone_coverage(left, right, b1, b2) : 0.0;
    pa.coverage.right = pa.overlaps_right ? zone_coverage(left, right, b2, w) : 0.0;
    return pa;
}

PartitionAnalysis analyze_partitions(const Detection& det, double frame_width) {
    const double w = frame_width > 0.0 ? frame_width : 1.0;
    return analyze_extent(det.left() * w, det.right() * w, w);
}

}  // namespace walkguide
