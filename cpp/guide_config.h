/**
 * Walkguide configuration.
 *
 * One struct per component; GuideConfig aggregates them and is what the
 * YAML loader fills. Every field carries its tuned default so a missing
 * config file still yields a working pipeline.
 *
 * Times are in seconds, distances in meters, occupancy/coverage and
 * geometry are frame fractions.
 */

#pragma once

#include <string>
#include <vector>

namespace walkguide {

struct DepthConfig {
    // distance_m = relative_depth / scale_factor, clamped to [min, max]
    double scale_factor = 150.0;
    double min_depth_m = 0.1;
    double max_depth_m = 10.0;
};

struct PartitionConfig {
    double min_confidence = 0.40;
    double navigation_distance_m = 3.5;   // ignore anything farther

    double full_block_threshold = 0.60;   // occupancy for STOP
    double large_object_threshold = 0.40; // occupancy for lateral avoidance
    double stop_distance_m = 1.0;
    double alert_distance_m = 2.5;
};

/// Gate A (partition path)
struct GateConfig {
    double urgent_repeat_s = 1.2;
    double nonurgent_repeat_s = 5.0;
    double min_inter_speech_s = 2.0;     // hard floor between any two announcements
    double path_clear_repeat_s = 8.0;
    double distance_delta_m = 0.5;
    double occupancy_delta = 0.10;
};

struct LegacyConfig {
    double min_confidence = 0.40;
    double min_y_center = 0.5;           // lower half of the frame only
    double min_width = 0.05;

    double left_boundary = 0.33;
    double right_boundary = 0.66;

    double confidence_weight = 2.0;
    double distance_weight = 3.0;
    double center_direction_weight = 4.0;
    double side_direction_weight = 1.0;

    double very_close_m = 1.0;
    double close_m = 2.0;
    double medium_m = 4.0;

    // Without meters, categorize from score = (1 - width)^4
    bool width_fallback = true;
    double very_close_score = 0.05;
    double close_score = 0.20;
    double medium_score = 0.50;

    std::vector<std::string> stoplist = {
        "book", "bottle", "cup", "keyboard", "mouse",
        "laptop", "charger", "cell phone", "remote"
    };
};

/// Gate B (legacy rate limiter)
struct RateLimitConfig {
    double global_cooldown_s = 2.5;
    double per_object_cooldown_s = 5.0;
    double directional_cooldown_s = 3.0;
    double medium_priority_threshold = 10.0;  // MEDIUM+CENTER must beat this
    double min_width = 0.08;
    double edge_margin = 0.05;
};

struct ArbiterConfig {
    double suppression_s = 1.5;  // INFORMATION muted after NAVIGATION/URGENT speech
};

struct ClosestObjectConfig {
    bool enabled = false;
    double min_confidence = 0.40;
    double ema_alpha = 0.35;
    double distance_change_m = 0.3;
    double cooldown_s = 1.2;
};

struct GuideConfig {
    std::string strategy = "partition";  // "partition" or "legacy"
    bool debug_logging = false;

    DepthConfig depth;
    PartitionConfig partition;
    GateConfig gate;
    LegacyConfig legacy;
    RateLimitConfig rate_limit;
    ArbiterConfig arbiter;
    ClosestObjectConfig closest_object;
};

/// Load overrides from a YAML file into cfg. On failure cfg is left
/// untouched, the reason goes to stderr and false is returned.
bool load_guide_config(const std::string& path, GuideConfig& cfg);

/// Same as load_guide_config but from an in-memory YAML document.
bool parse_guide_config(const std::string& yaml_text, GuideConfig& cfg);

}  // namespace walkguide
