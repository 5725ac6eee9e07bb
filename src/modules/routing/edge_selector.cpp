// modules/routing/edge_selector.cpp
#include "routing/edge_selector.h"
#include "condition/condition_evaluator.h"
#include "interviewer/accelerators.h"
#include "common/utils/string_utils.h"
#include <stdexcept>

namespace agentflow {

std::string normalize_label(const std::string& label) {
    return parse_accelerator(to_lower(trim(label))).second;
}

const Edge& best_by_weight_then_lexical(const std::vector<const Edge*>& edges) {
    if (edges.empty()) {
        throw std::invalid_argument("best_by_weight_then_lexical called with no edges");
    }
    const Edge* best = edges.front();
    for (const Edge* e : edges) {
        if (e->weight > best->weight || (e->weight == best->weight && e->to_node < best->to_node)) {
            best = e;
        }
    }
    return *best;
}

std::optional<Edge> select_condition_edge(const std::vector<Edge>& edges, const Outcome& outcome, const RunContext& context) {
    std::vector<const Edge*> matched;
    for (const auto& e : edges) {
        if (e.has_condition() && evaluate_condition(e.condition, outcome, context)) {
            matched.push_back(&e);
        }
    }
    if (matched.empty()) {
        return std::nullopt;
    }
    return best_by_weight_then_lexical(matched);
}

std::optional<Edge> select_edge(const std::vector<Edge>& edges, const Outcome& outcome, const RunContext& context) {
    if (edges.empty()) {
        return std::nullopt;
    }

    // 1. 条件匹配
    if (auto matched = select_condition_edge(edges, outcome, context)) {
        return matched;
    }

    // 2. preferred label
    if (!outcome.preferred_label.empty()) {
        std::string wanted = normalize_label(outcome.preferred_label);
        for (const auto& e : edges) {
            if (normalize_label(e.label) == wanted) {
                return e;
            }
        }
    }

    // 3. suggested next ids, in the order the handler gave them
    for (const auto& id : outcome.suggested_next_ids) {
        for (const auto& e : edges) {
            if (e.to_node == id) {
                return e;
            }
        }
    }

    // 4. unconditional edges by weight, then lexical
    std::vector<const Edge*> unconditional;
    for (const auto& e : edges) {
        if (!e.has_condition()) unconditional.push_back(&e);
    }
    if (!unconditional.empty()) {
        return best_by_weight_then_lexical(unconditional);
    }

    // 5. fallback over everything
    std::vector<const Edge*> all;
    for (const auto& e : edges) all.push_back(&e);
    return best_by_weight_then_lexical(all);
}

} // namespace agentflow
