/**
 * YAML configuration loading for the guidance pipeline.
 *
 * Layout (every key optional):
 *
 *   strategy: partition        # or legacy
 *   debug_logging: false
 *   depth:          {scale_factor, min_depth_m, max_depth_m}
 *   partition:      {min_confidence, navigation_distance_m, ...}
 *   gate:           {urgent_repeat_s, nonurgent_repeat_s, ...}
 *   legacy:         {min_confidence, ..., stoplist: [..]}
 *   rate_limit:     {global_cooldown_s, ...}
 *   arbiter:        {suppression_s}
 *   closest_object: {enabled, ema_alpha, ...}
 */

#include "guide_config.h"
#include "yaml_config.h"

#include <iostream>

namespace walkguide {

static void apply_config(const YAML::Node& root, GuideConfig& cfg) {
    cfg.strategy = yaml_str(root, "strategy", cfg.strategy);
    cfg.debug_logging = yaml_bool(root, "debug_logging", cfg.debug_logging);

    if (root["depth"]) {
        auto n = root["depth"];
        auto& d = cfg.depth;
        d.scale_factor = yaml_double(n, "scale_factor", d.scale_factor);
        d.min_depth_m = yaml_double(n, "min_depth_m", d.min_depth_m);
        d.max_depth_m = yaml_double(n, "max_depth_m", d.max_depth_m);
    }

    if (root["partition"]) {
        auto n = root["partition"];
        auto& p = cfg.partition;
        p.min_confidence = yaml_double(n, "min_confidence", p.min_confidence);
        p.navigation_distance_m = yaml_double(n, "navigation_distance_m", p.navigation_distance_m);
        p.full_block_threshold = yaml_double(n, "full_block_threshold", p.full_block_threshold);
        p.large_object_threshold = yaml_double(n, "large_object_threshold", p.large_object_threshold);
        p.stop_distance_m = yaml_double(n, "stop_distance_m", p.stop_distance_m);
        p.alert_distance_m = yaml_double(n, "alert_distance_m", p.alert_distance_m);
    }

    if (root["gate"]) {
        auto n = root["gate"];
        auto& g = cfg.gate;
        g.urgent_repeat_s = yaml_double(n, "urgent_repeat_s", g.urgent_repeat_s);
        g.nonurgent_repeat_s = yaml_double(n, "nonurgent_repeat_s", g.nonurgent_repeat_s);
        g.min_inter_speech_s = yaml_double(n, "min_inter_speech_s", g.min_inter_speech_s);
        g.path_clear_repeat_s = yaml_double(n, "path_clear_repeat_s", g.path_clear_repeat_s);
        g.distance_delta_m = yaml_double(n, "distance_delta_m", g.distance_delta_m);
        g.occupancy_delta = yaml_double(n, "occupancy_delta", g.occupancy_delta);
    }

    if (root["legacy"]) {
        auto n = root["legacy"];
        auto& l = cfg.legacy;
        l.min_confidence = yaml_double(n, "min_confidence", l.min_confidence);
        l.min_y_center = yaml_double(n, "min_y_center", l.min_y_center);
        l.min_width = yaml_double(n, "min_width", l.min_width);
        l.left_boundary = yaml_double(n, "left_boundary", l.left_boundary);
        l.right_boundary = yaml_double(n, "right_boundary", l.right_boundary);
        l.confidence_weight = yaml_double(n, "confidence_weight", l.confidence_weight);
        l.distance_weight = yaml_double(n, "distance_weight", l.distance_weight);
        l.center_direction_weight = yaml_double(n, "center_direction_weight", l.center_direction_weight);
        l.side_direction_weight = yaml_double(n, "side_direction_weight", l.side_direction_weight);
        l.very_close_m = yaml_double(n, "very_close_m", l.very_close_m);
        l.close_m = yaml_double(n, "close_m", l.close_m);
        l.medium_m = yaml_double(n, "medium_m", l.medium_m);
        l.width_fallback = yaml_bool(n, "width_fallback", l.width_fallback);
        l.very_close_score = yaml_double(n, "very_close_score", l.very_close_score);
        l.close_score = yaml_double(n, "close_score", l.close_score);
        l.medium_score = yaml_double(n, "medium_score", l.medium_score);
        l.stoplist = yaml_str_list(n, "stoplist", l.stoplist);
    }

    if (root["rate_limit"]) {
        auto n = root["rate_limit"];
        auto& r = cfg.rate_limit;
        r.global_cooldown_s = yaml_double(n, "global_cooldown_s", r.global_cooldown_s);
        r.per_object_cooldown_s = yaml_double(n, "per_object_cooldown_s", r.per_object_cooldown_s);
        r.directional_cooldown_s = yaml_double(n, "directional_cooldown_s", r.directional_cooldown_s);
        r.medium_priority_threshold = yaml_double(n, "medium_priority_threshold", r.medium_priority_threshold);
        r.min_width = yaml_double(n, "min_width", r.min_width);
        r.edge_margin = yaml_double(n, "edge_margin", r.edge_margin);
    }

    if (root["arbiter"]) {
        cfg.arbiter.suppression_s =
            yaml_double(root["arbiter"], "suppression_s", cfg.arbiter.suppression_s);
    }

    if (root["closest_object"]) {
        auto n = root["closest_object"];
        auto& c = cfg.closest_object;
        c.enabled = yaml_bool(n, "enabled", c.enabled);
        c.min_confidence = yaml_double(n, "min_confidence", c.min_confidence);
        c.ema_alpha = yaml_double(n, "ema_alpha", c.ema_alpha);
        c.distance_change_m = yaml_double(n, "distance_change_m", c.distance_change_m);
        c.cooldown_s = yaml_double(n, "cooldown_s", c.cooldown_s);
    }
}

static bool validate(const GuideConfig& cfg) {
    if (cfg.strategy != "partition" && cfg.strategy != "legacy") {
        std::cerr << "[GuideConfig] Unknown strategy '" << cfg.strategy
                  << "' (expected partition or legacy)" << std::endl;
        return false;
    }
    if (cfg.depth.scale_factor <= 0.0 || cfg.depth.min_depth_m > cfg.depth.max_depth_m) {
        std::cerr << "[GuideConfig] Invalid depth calibration (scale="
                  << cfg.depth.scale_factor << ", range=[" << cfg.depth.min_depth_m
                  << ", " << cfg.depth.max_depth_m << "])" << std::endl;
        return false;
    }
    if (cfg.closest_object.ema_alpha <= 0.0 || cfg.closest_object.ema_alpha > 1.0) {
        std::cerr << "[GuideConfig] closest_object.ema_alpha must be in (0, 1]" << std::endl;
        return false;
    }
    return true;
}

static bool load_from_node(const YAML::Node& root, const std::string& source,
                           GuideConfig& cfg)
{
    GuideConfig candidate = cfg;
    try {
        apply_config(root, candidate);
    } catch (const std::exception& e) {
        std::cerr << "[GuideConfig] Bad value in " << source << " - " << e.what() << std::endl;
        return false;
    }
    if (!validate(candidate)) return false;

    cfg = candidate;
    std::cout << "[GuideConfig] Loaded " << source << " (strategy="
              << cfg.strategy << ")" << std::endl;
    return true;
}

bool load_guide_config(const std::string& path, GuideConfig& cfg) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const std::exception& e) {
        std::cerr << "[GuideConfig] Failed to load: " << path
                  << " - " << e.what() << std::endl;
        return false;
    }
    return load_from_node(root, path, cfg);
}

bool parse_guide_config(const std::string& yaml_text, GuideConfig& cfg) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const std::exception& e) {
        std::cerr << "[GuideConfig] Failed to parse inline config - " << e.what() << std::endl;
        return false;
    }
    return load_from_node(root, "<inline>", cfg);
}

}  // namespace walkguide
