/**
 * Text mapping for guidance types.
 */

#include "guide_types.h"

#include <algorithm>
#include <cstdio>

namespace walkguide {

Zone ZoneCoverage::dominant() const {
    double m = std::max({left, center, right});
    if (m == left) return Zone::Left;
    if (m == center) return Zone::Center;
    return Zone::Right;
}

const char* to_string(Zone z) {
    switch (z) {
        case Zone::Left: return "LEFT";
        case Zone::Center: return "CENTER";
        case Zone::Right: return "RIGHT";
    }
    return "?";
}

const char* to_string(DistanceCategory c) {
    switch (c) {
        case DistanceCategory::Far: return "FAR";
        case DistanceCategory::Medium: return "MEDIUM";
        case DistanceCategory::Close: return "CLOSE";
        case DistanceCategory::VeryClose: return "VERY_CLOSE";
    }
    return "?";
}

const char* to_string(NavigationDecision d) {
    switch (d) {
        case NavigationDecision::Stop: return "STOP";
        case NavigationDecision::StepLeft: return "STEP_LEFT";
        case NavigationDecision::StepRight: return "STEP_RIGHT";
        case NavigationDecision::GoStraight: return "GO_STRAIGHT";
    }
    return "?";
}

const char* to_string(DecisionCategory c) {
    switch (c) {
        case DecisionCategory::Stop: return "STOP";
        case DecisionCategory::Lateral: return "LATERAL";
        case DecisionCategory::Straight: return "STRAIGHT";
    }
    return "?";
}

const char* to_string(SpeechPriority p) {
    switch (p) {
        case SpeechPriority::Urgent: return "urgent";
        case SpeechPriority::Navigation: return "navigation";
        case SpeechPriority::Information: return "information";
    }
    return "?";
}

std::optional<SpeechPriority> parse_speech_priority(const std::string& s) {
    if (s == "urgent") return SpeechPriority::Urgent;
    if (s == "navigation") return SpeechPriority::Navigation;
    if (s == "information") return SpeechPriority::Information;
    return std::nullopt;
}

static const char* direction_phrase(Direction d) {
    switch (d) {
        case Direction::Left: return "to your left";
        case Direction::Right: return "to your right";
        case Direction::Center: return "ahead";
    }
    return "ahead";
}

std::string decision_speech_text(NavigationDecision d, const std::string& label) {
    std::string prefix = label + " ahead of you, ";
    switch (d) {
        case NavigationDecision::Stop: return prefix + "stop";
        case NavigationDecision::StepLeft: return prefix + "move left";
        case NavigationDecision::StepRight: return prefix + "move right";
        case NavigationDecision::GoStraight: return prefix + "move straight";
    }
    return label + " ahead of you";
}

std::string guidance_speech_text(const Guidance& g) {
    const char* distance_phrase = "in the distance";
    switch (g.distance) {
        case DistanceCategory::VeryClose: distance_phrase = "very close, stop"; break;
        case DistanceCategory::Close: distance_phrase = "close, slow down"; break;
        case DistanceCategory::Medium: distance_phrase = "approaching"; break;
        case DistanceCategory::Far: break;
    }
    return g.label + " " + direction_phrase(g.direction) + ", " + distance_phrase;
}

std::string path_clear_text() {
    return "path clear, move straight";
}

std::string closest_object_text(const std::string& label, double distance_m,
                                Direction direction)
{
    char buf[128];
    std::snprintf(buf, sizeof(buf), ", about %.1f meters %s",
                  distance_m, direction_phrase(direction));
    return label + buf;
}

}  // namespace walkguide
