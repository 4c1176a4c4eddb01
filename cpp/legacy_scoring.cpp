#include "legacy_scoring.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace walkguide {

static std::string lower_trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    std::string out = s.substr(b, e - b);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

LegacyScoringEngine::LegacyScoringEngine(const LegacyConfig& cfg, bool debug_logging)
    : cfg_(cfg), debug_(debug_logging)
{
    for (const auto& s : cfg_.stoplist) {
        std::string entry = lower_trim(s);
        if (!entry.empty()) stoplist_.push_back(entry);
    }
}

bool LegacyScoringEngine::is_stoplisted(const std::string& label) const {
    std::string norm = lower_trim(label);
    for (const auto& entry : stoplist_) {
        if (norm.find(entry) != std::string::npos) return true;
    }
    return false;
}

bool LegacyScoringEngine::should_include(const Detection& d) const {
    if (d.confidence < cfg_.min_confidence) return false;
    if (d.y_center < cfg_.min_y_center) return false;
    if (d.width < cfg_.min_width) return false;
    return !is_stoplisted(d.label);
}

Direction LegacyScoringEngine::direction_of(double x_center) const {
    if (x_center < cfg_.left_boundary) return Direction::Left;
    if (x_center > cfg_.right_boundary) return Direction::Right;
    return Direction::Center;
}

DistanceCategory LegacyScoringEngine::category_from_meters(double meters) const {
    if (meters < cfg_.very_close_m) return DistanceCategory::VeryClose;
    if (meters < cfg_.close_m) return DistanceCategory::Close;
    if (meters < cfg_.medium_m) return DistanceCategory::Medium;
    return DistanceCategory::Far;
}

DistanceCategory LegacyScoringEngine::distance_category(const Detection& d) const {
    if (d.distance_m) return category_from_meters(*d.distance_m);
    if (!cfg_.width_fallback) return DistanceCategory::Far;

    // Wider box = closer object
    double score = std::pow(1.0 - d.width, 4.0);
    if (score < cfg_.very_close_score) return DistanceCategory::VeryClose;
    if (score < cfg_.close_score) return DistanceCategory::Close;
    if (score < cfg_.medium_score) return DistanceCategory::Medium;
    return DistanceCategory::Far;
}

double LegacyScoringEngine::priority_of(const Detection& d, Direction dir) const {
    double priority = d.confidence * cfg_.confidence_weight;

    double distance_term = 0.5;
    if (d.distance_m) {
        distance_term = 10.0 / std::clamp(*d.distance_m, 0.1, 10.0);
    }
    priority += distance_term * cfg_.distance_weight;

    priority += (dir == Direction::Center) ? cfg_.center_direction_weight
                                           : cfg_.side_direction_weight;
    return priority;
}

std::optional<Guidance> LegacyScoringEngine::analyze(
    const std::vector<Detection>& detections) const
{
    std::optional<Guidance> best;
    for (const auto& d : detections) {
        if (!should_include(d)) continue;

        Guidance g;
        g.label = d.label;
        g.direction = direction_of(d.x_center);
        g.distance = distance_category(d);
        g.priority = priority_of(d, g.direction);
        g.width = d.width;
        g.x_center = d.x_center;

        if (debug_) {
            std::printf("[LegacyScoring] %s dir=%s dist=%s priority=%.2f\n",
                        g.label.c_str(), to_string(g.direction),
                        to_string(g.distance), g.priority);
        }
        if (!best || g.priority > best->priority) best = g;
    }
    return best;
}

}  // namespace walkguide
