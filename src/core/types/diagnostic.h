#ifndef AGENTFLOW_CORE_TYPES_DIAGNOSTIC_H
#define AGENTFLOW_CORE_TYPES_DIAGNOSTIC_H

#include "value.h"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace agentflow {

enum class Severity : uint8_t {
    ERROR,
    WARNING,
    INFO
};

struct Diagnostic {
    std::string rule;
    Severity severity = Severity::ERROR;
    std::string message;
    std::optional<NodeId> node_id;
    std::optional<std::pair<NodeId, NodeId>> edge;

    bool is_error() const { return severity == Severity::ERROR; }
    // "ERROR [node=x] rule: message"
    std::string to_string() const;
};

// Raised by the pre-run check when any ERROR diagnostic exists
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(std::vector<Diagnostic> diagnostics);
    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

private:
    std::vector<Diagnostic> diagnostics_;
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_DIAGNOSTIC_H
