#ifndef AGENTFLOW_CORE_TYPES_VALUE_H
#define AGENTFLOW_CORE_TYPES_VALUE_H

#include <nlohmann/json.hpp>
#include <string>

namespace agentflow {

// nlohmann::json is the single dynamic value type (context entries, updates, tool results)
using Value = nlohmann::json;

using NodeId = std::string;

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_VALUE_H
