/**
 * Walkguide Types: shared data structures for the guidance pipeline.
 *
 * Contains the canonical Detection record, partition/zone types, the two
 * decision vocabularies (NavigationDecision for the partition path, Guidance
 * for the legacy scoring path) and the speech request passed to the arbiter.
 *
 * All detection geometry is normalized to the frame: 0.0 = left/top,
 * 1.0 = right/bottom.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace walkguide {

// -------------------------------------------------------------------------
// Detection
// -------------------------------------------------------------------------

struct Detection {
    std::string label;
    double confidence = 0.0;
    double x_center = 0.5;
    double y_center = 0.5;
    double width = 0.0;
    double height = 0.0;
    std::optional<double> distance_m;  // median depth in meters, if known

    double left() const { return x_center - width / 2.0; }
    double right() const { return x_center + width / 2.0; }
};

/// Detector output in pixel coordinates, before normalization.
struct PixelDetection {
    std::string label;
    double score = 0.0;
    double left = 0.0;
    double top = 0.0;
    double right = 0.0;
    double bottom = 0.0;
    std::optional<double> distance_m;
};

// -------------------------------------------------------------------------
// Zones / directions
// -------------------------------------------------------------------------

/// Horizontal thirds of the frame. Direction is the user-facing name for
/// the same partition.
enum class Zone : uint8_t { Left, Center, Right };
using Direction = Zone;

/// Declared from least to most dangerous so operator< reads "safer than".
enum class DistanceCategory : uint8_t { Far, Medium, Close, VeryClose };

inline bool more_dangerous(DistanceCategory a, DistanceCategory b) {
    return static_cast<uint8_t>(a) > static_cast<uint8_t>(b);
}

struct ZoneCoverage {
    double left = 0.0;    // fraction of the left zone width covered
    double center = 0.0;
    double right = 0.0;

    Zone dominant() const;
};

struct PartitionAnalysis {
    bool overlaps_left = false;
    bool overlaps_center = false;
    bool overlaps_right = false;
    Zone center_zone = Zone::Center;
    double occupancy = 0.0;  // bbox width / frame width
    ZoneCoverage coverage;

    bool overlaps(Zone z) const {
        switch (z) {
            case Zone::Left: return overlaps_left;
            case Zone::Center: return overlaps_center;
            case Zone::Right: return overlaps_right;
        }
        return false;
    }
};

// -------------------------------------------------------------------------
// Partition path decision
// -------------------------------------------------------------------------

enum class NavigationDecision : uint8_t { Stop, StepLeft, StepRight, GoStraight };

/// StepLeft/StepRight collapse into Lateral for change detection.
enum class DecisionCategory : uint8_t { Stop, Lateral, Straight };

inline DecisionCategory decision_category(NavigationDecision d) {
    switch (d) {
        case NavigationDecision::Stop: return DecisionCategory::Stop;
        case NavigationDecision::StepLeft:
        case NavigationDecision::StepRight: return DecisionCategory::Lateral;
        case NavigationDecision::GoStraight: return DecisionCategory::Straight;
    }
    return DecisionCategory::Straight;
}

inline bool is_urgent(NavigationDecision d) { return d == NavigationDecision::Stop; }

struct DecisionResult {
    NavigationDecision decision = NavigationDecision::GoStraight;
    double distance_m = 0.0;
    double occupancy = 0.0;
    ZoneCoverage coverage;
    std::string label;
};

// -------------------------------------------------------------------------
// Legacy scoring path
// -------------------------------------------------------------------------

struct Guidance {
    std::string label;
    Direction direction = Direction::Center;
    DistanceCategory distance = DistanceCategory::Far;
    double priority = 0.0;

    // Geometry the guidance was scored from (size/edge suppression)
    double width = 0.1;
    double x_center = 0.5;
};

// -------------------------------------------------------------------------
// Speech
// -------------------------------------------------------------------------

enum class SpeechPriority : uint8_t { Urgent, Navigation, Information };

struct SpeechRequest {
    std::string text;
    SpeechPriority priority = SpeechPriority::Navigation;
    bool interrupt = false;
};

// -------------------------------------------------------------------------
// Text mapping (guide_types.cpp)
// -------------------------------------------------------------------------

const char* to_string(Zone z);
const char* to_string(DistanceCategory c);
const char* to_string(NavigationDecision d);
const char* to_string(DecisionCategory c);
const char* to_string(SpeechPriority p);

/// Parse "urgent" / "navigation" / "information" (case-sensitive).
std::optional<SpeechPriority> parse_speech_priority(const std::string& s);

/// "<label> ahead of you, move right" etc.
std::string decision_speech_text(NavigationDecision d, const std::string& label);

/// "<label> to your left, close, slow down" etc.
std::string guidance_speech_text(const Guidance& g);

std::string path_clear_text();

/// "<label>, about 1.8 meters ahead"
std::string closest_object_text(const std::string& label, double distance_m,
                                Direction direction);

}  // namespace walkguide
