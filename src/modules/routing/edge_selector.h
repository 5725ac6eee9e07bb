// modules/routing/edge_selector.h
#ifndef AGENTFLOW_MODULES_ROUTING_EDGE_SELECTOR_H
#define AGENTFLOW_MODULES_ROUTING_EDGE_SELECTOR_H

#include "core/types/graph.h"
#include "core/types/outcome.h"
#include "context/run_context.h"
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

// Lower-case, trim, strip one leading accelerator marker
std::string normalize_label(const std::string& label);

// Highest weight, ties broken by ascending to_node. `edges` must not be empty.
const Edge& best_by_weight_then_lexical(const std::vector<const Edge*>& edges);

// 五步优先级选边:
//   1. condition match  2. preferred label  3. suggested next ids
//   4. weight + lexical among unconditional edges  5. same rule over all edges
// Returns std::nullopt only when `edges` is empty.
std::optional<Edge> select_edge(const std::vector<Edge>& edges, const Outcome& outcome, const RunContext& context);

// Step 1 only: the best edge whose condition holds, if any
std::optional<Edge> select_condition_edge(const std::vector<Edge>& edges, const Outcome& outcome, const RunContext& context);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_ROUTING_EDGE_SELECTOR_H
