/**
 * Partition Analyzer: three equal-width zones across the frame.
 *
 * Zone boundaries sit at W/3 and 2W/3. The frame width may be in pixels or
 * normalized (W = 1); only consistency matters. Stateless.
 */

#pragma once

#include "guide_types.h"

namespace walkguide {

/// Analyze a horizontal extent [left, right] on a frame of width frame_width.
/// Zero-width extents yield zero occupancy and a valid center zone. A
/// non-positive frame width is treated as the normalized frame (W = 1).
PartitionAnalysis analyze_extent(double left, double right, double frame_width);

/// Analyze a normalized detection against a frame of width frame_width.
PartitionAnalysis analyze_partitions(const Detection& det, double frame_width);

/// Zone containing horizontal position x on a frame of width frame_width.
Zone zone_of(double x, double frame_width);

}  // namespace walkguide
