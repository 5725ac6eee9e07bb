// modules/validation/preflight.h
#ifndef AGENTFLOW_MODULES_VALIDATION_PREFLIGHT_H
#define AGENTFLOW_MODULES_VALIDATION_PREFLIGHT_H

#include "core/types/diagnostic.h"
#include "core/types/graph.h"
#include <functional>
#include <vector>

namespace agentflow {

using ValidationRule = std::function<std::vector<Diagnostic>(const Graph&)>;

// start_node, exit_node, edge_endpoints, condition_syntax
std::vector<ValidationRule> builtin_rules();

std::vector<Diagnostic> validate(const Graph& graph, const std::vector<ValidationRule>& extra_rules = {});

// Throws ValidationError when any ERROR diagnostic is produced; returns the warnings otherwise
std::vector<Diagnostic> validate_or_throw(const Graph& graph, const std::vector<ValidationRule>& extra_rules = {});

} // namespace agentflow

#endif // AGENTFLOW_MODULES_VALIDATION_PREFLIGHT_H
