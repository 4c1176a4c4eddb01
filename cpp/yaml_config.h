/**
 * yaml-cpp accessors for the walkguide config file.
 *
 * A missing or null key keeps the supplied default, so a partial file only
 * overrides what it names. A key that is present but does not convert
 * throws YAML::BadConversion: a mistyped tunable fails the whole load
 * rather than running on a silent default.
 */

#pragma once

#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

namespace walkguide {

template <typename T>
inline T yaml_value(const YAML::Node& node, const std::string& key, const T& def) {
    const YAML::Node v = node[key];
    if (!v || v.IsNull()) return def;
    return v.as<T>();
}

inline double yaml_double(const YAML::Node& node, const std::string& key, double def) {
    return yaml_value<double>(node, key, def);
}

inline bool yaml_bool(const YAML::Node& node, const std::string& key, bool def) {
    return yaml_value<bool>(node, key, def);
}

inline std::string yaml_str(const YAML::Node& node, const std::string& key,
                            const std::string& def)
{
    return yaml_value<std::string>(node, key, def);
}

/// Sequence of strings. A lone scalar counts as a one-entry list.
inline std::vector<std::string> yaml_str_list(const YAML::Node& node, const std::string& key,
                                              const std::vector<std::string>& def)
{
    const YAML::Node v = node[key];
    if (!v || v.IsNull()) return def;
    if (v.IsScalar()) return {v.as<std::string>()};
    return v.as<std::vector<std::string>>();
}

}  // namespace walkguide
