/**
 * JSON payloads carried on std_msgs/String topics.
 *
 * Detections (in):
 *   {"image_width":640,"image_height":480,"detections":[
 *     {"label":"chair","confidence":0.8,"x_center":0.5,"y_center":0.7,
 *      "width":0.3,"height":0.4,"distance_m":1.6}]}
 *   distance_m may be absent or null. A detection may instead carry a
 *   pixel box, {"label":"door","confidence":0.9,"left":100,"top":200,
 *   "right":300,"bottom":400}; those land in pixel_detections and need
 *   image_width/image_height to be normalized.
 *
 * Speech request (out):
 *   {"text":"chair ahead of you, move right","priority":"navigation","interrupt":false}
 *
 * Flat key search, same approach as the other nodes' obstacle parsing: no
 * nesting inside detection objects.
 */

#pragma once

#include "guide_types.h"

#include <optional>
#include <string>
#include <vector>

namespace walkguide {

struct DetectionFrame {
    int image_width = 0;   // 0 when not given
    int image_height = 0;
    std::vector<Detection> detections;
    std::vector<PixelDetection> pixel_detections;  // objects keyed by "left"
};

/// nullopt when the payload has no "detections" array.
std::optional<DetectionFrame> parse_detection_frame(const std::string& json);

std::string format_speech_request(const SpeechRequest& req);

/// nullopt when "text" is missing or "priority" is not a known tier.
std::optional<SpeechRequest> parse_speech_request(const std::string& json);

// Low-level helpers. `key` is the bare key name, without quotes.
std::optional<double> json_number(const std::string& json, const std::string& key);
std::optional<std::string> json_string(const std::string& json, const std::string& key);
std::optional<bool> json_bool(const std::string& json, const std::string& key);
std::string json_escape(const std::string& s);

}  // namespace walkguide
