#pragma once

#include <yaml-cpp/yaml.h>
#include <string>

namespace flatlock {

// Undefined when map is not a map or lacks the key. Const lookups on
// missing keys yield nodes that throw on Type(), so always test IsDefined().
inline YAML::Node yaml_child(const YAML::Node& map, const char* key) {
    if (!map.IsDefined() || !map.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
    return map[key];
}

inline std::string yaml_scalar(const YAML::Node& node) {
    return (node.IsDefined() && node.IsScalar()) ? node.Scalar() : "";
}

// 1-based line of an exception mark, 0 when unknown
inline int yaml_line(const YAML::Mark& mark) {
    return mark.line >= 0 ? mark.line + 1 : 0;
}

} // namespace flatlock
