#ifndef AGENTFLOW_COMMON_UTILS_STRING_UTILS_H
#define AGENTFLOW_COMMON_UTILS_STRING_UTILS_H

#include "core/types/value.h"
#include <string>
#include <string_view>
#include <vector>

namespace agentflow {

std::string trim(std::string_view text);
std::string to_lower(std::string_view text);

// "a, b,,c" -> {"a", "b", "c"}
std::vector<std::string> split_csv(std::string_view text);

// Strings as-is, null as "", everything else as compact JSON
std::string value_to_string(const Value& value);

// null, false, 0, "" and empty containers are falsy
bool is_truthy(const Value& value);

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_STRING_UTILS_H
