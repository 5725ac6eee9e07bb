#ifndef AGENTFLOW_COMMON_UTILS_YAML_JSON_H
#define AGENTFLOW_COMMON_UTILS_YAML_JSON_H

#include "core/types/value.h"
#include <yaml-cpp/yaml.h>

namespace agentflow {

// 将 YAML::Node 转换为 JSON 值。
// Plain scalars are typed (bool, null, integer, float); quoted scalars stay strings.
Value yaml_to_json(const YAML::Node& node);

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_YAML_JSON_H
