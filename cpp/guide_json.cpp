#include "guide_json.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <cstdlib>

namespace walkguide {

// Position of the first character of key's value, or npos. Only a string
// followed by ':' counts as a key, so a value spelling the key is skipped.
static size_t value_pos(const std::string& json, const std::string& key) {
    for (size_t i = 0; i < json.size(); i++) {
        if (json[i] != '"') continue;
        size_t end = i + 1;
        while (end < json.size() && json[end] != '"') {
            if (json[end] == '\\') end++;
            end++;
        }
        if (end >= json.size()) return std::string::npos;

        size_t colon = end + 1;
        while (colon < json.size() && std::isspace(static_cast<unsigned char>(json[colon]))) colon++;
        if (colon < json.size() && json[colon] == ':' &&
            json.compare(i + 1, end - i - 1, key) == 0)
        {
            size_t v = colon + 1;
            while (v < json.size() && std::isspace(static_cast<unsigned char>(json[v]))) v++;
            return v < json.size() ? v : std::string::npos;
        }
        i = end;
    }
    return std::string::npos;
}

// Index of the '}' closing the object opened at `start`, skipping strings.
static size_t object_end(const std::string& json, size_t start) {
    int depth = 0;
    bool in_string = false;
    for (size_t i = start; i < json.size(); i++) {
        char c = json[i];
        if (in_string) {
            if (c == '\\') i++;
            else if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') in_string = true;
        else if (c == '{') depth++;
        else if (c == '}' && --depth == 0) return i;
    }
    return std::string::npos;
}

std::optional<double> json_number(const std::string& json, const std::string& key) {
    size_t v = value_pos(json, key);
    if (v == std::string::npos) return std::nullopt;
    const char* begin = json.c_str() + v;
    char* end = nullptr;
    double d = std::strtod(begin, &end);
    if (end == begin) return std::nullopt;  // null, string, garbage
    return d;
}

std::optional<std::string> json_string(const std::string& json, const std::string& key) {
    size_t v = value_pos(json, key);
    if (v == std::string::npos || json[v] != '"') return std::nullopt;

    std::string out;
    for (size_t i = v + 1; i < json.size(); i++) {
        char c = json[i];
        if (c == '"') return out;
        if (c == '\\' && i + 1 < json.size()) {
            char e = json[++i];
            switch (e) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case 'r': out += '\r'; break;
                default: out += e; break;  // \" \\ \/
            }
            continue;
        }
        out += c;
    }
    return std::nullopt;  // unterminated
}

std::optional<bool> json_bool(const std::string& json, const std::string& key) {
    size_t v = value_pos(json, key);
    if (v == std::string::npos) return std::nullopt;
    if (json.compare(v, 4, "true") == 0) return true;
    if (json.compare(v, 5, "false") == 0) return false;
    return std::nullopt;
}

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default: out += c; break;
        }
    }
    return out;
}

// =========================================================================
// Detections
// =========================================================================

static Detection parse_detection(const std::string& obj) {
    Detection d;
    d.label = json_string(obj, "label").value_or("");
    d.confidence = json_number(obj, "confidence").value_or(0.0);
    d.x_center = json_number(obj, "x_center").value_or(d.x_center);
    d.y_center = json_number(obj, "y_center").value_or(d.y_center);
    d.width = json_number(obj, "width").value_or(0.0);
    d.height = json_number(obj, "height").value_or(0.0);
    d.distance_m = json_number(obj, "distance_m");
    return d;
}

static PixelDetection parse_pixel_detection(const std::string& obj) {
    PixelDetection px;
    px.label = json_string(obj, "label").value_or("");
    px.score = json_number(obj, "confidence").value_or(0.0);
    px.left = json_number(obj, "left").value_or(0.0);
    px.top = json_number(obj, "top").value_or(0.0);
    px.right = json_number(obj, "right").value_or(0.0);
    px.bottom = json_number(obj, "bottom").value_or(0.0);
    px.distance_m = json_number(obj, "distance_m");
    return px;
}

// Image size in pixels; garbage, negative or oversized values become 0 / INT_MAX.
static int to_dimension(const std::optional<double>& v) {
    if (!v || !std::isfinite(*v)) return 0;
    return static_cast<int>(std::clamp(*v, 0.0, static_cast<double>(INT_MAX)));
}

std::optional<DetectionFrame> parse_detection_frame(const std::string& json) {
    size_t arr = value_pos(json, "detections");
    if (arr == std::string::npos || json[arr] != '[') return std::nullopt;

    // Header fields live outside the array
    std::string header = json.substr(0, arr);
    auto close = json.find(']', arr);
    if (close != std::string::npos) header += json.substr(close + 1);

    DetectionFrame frame;
    frame.image_width = to_dimension(json_number(header, "image_width"));
    frame.image_height = to_dimension(json_number(header, "image_height"));

    size_t search = arr + 1;
    while (true) {
        size_t obj_start = json.find('{', search);
        if (obj_start == std::string::npos) break;
        size_t arr_end = json.find(']', search);
        if (arr_end != std::string::npos && arr_end < obj_start) break;

        size_t obj_end = object_end(json, obj_start);
        if (obj_end == std::string::npos) return std::nullopt;  // truncated

        std::string obj = json.substr(obj_start, obj_end - obj_start + 1);
        if (json_number(obj, "left")) {
            frame.pixel_detections.push_back(parse_pixel_detection(obj));
        } else {
            frame.detections.push_back(parse_detection(obj));
        }
        search = obj_end + 1;
    }
    return frame;
}

// =========================================================================
// Speech requests
// =========================================================================

std::string format_speech_request(const SpeechRequest& req) {
    std::string out = "{\"text\":\"";
    out += json_escape(req.text);
    out += "\",\"priority\":\"";
    out += to_string(req.priority);
    out += "\",\"interrupt\":";
    out += req.interrupt ? "true" : "false";
    out += "}";
    return out;
}

std::optional<SpeechRequest> parse_speech_request(const std::string& json) {
    auto text = json_string(json, "text");
    if (!text) return std::nullopt;

    SpeechRequest req;
    req.text = *text;
    if (auto p = json_string(json, "priority")) {
        auto tier = parse_speech_priority(*p);
        if (!tier) return std::nullopt;
        req.priority = *tier;
    }
    req.interrupt = json_bool(json, "interrupt").value_or(false);
    return req;
}

}  // namespace walkguide
