#ifndef AGENTFLOW_CORE_TYPES_ERRORS_H
#define AGENTFLOW_CORE_TYPES_ERRORS_H

#include <stdexcept>
#include <string>

namespace agentflow {

// Configuration-time errors: bad config file, unknown node type, etc.
struct ConfigError : public std::runtime_error {
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Raised while parsing a condition expression (clause without operator)
struct ConditionSyntaxError : public std::runtime_error {
    explicit ConditionSyntaxError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_ERRORS_H
