// modules/validation/preflight.cpp
#include "validation/preflight.h"
#include "condition/condition_evaluator.h"
#include "core/types/errors.h"
#include <algorithm>

namespace agentflow {

std::string Diagnostic::to_string() const {
    std::string out;
    switch (severity) {
        case Severity::ERROR: out = "ERROR"; break;
        case Severity::WARNING: out = "WARNING"; break;
        case Severity::INFO: out = "INFO"; break;
    }
    if (node_id) {
        out += " [node=" + *node_id + "]";
    }
    if (edge) {
        out += " [edge=" + edge->first + "->" + edge->second + "]";
    }
    return out + " " + rule + ": " + message;
}

namespace {

std::string summarize(const std::vector<Diagnostic>& diagnostics) {
    size_t errors = std::count_if(diagnostics.begin(), diagnostics.end(),
                                  [](const Diagnostic& d) { return d.is_error(); });
    std::string text = "Graph validation failed with " + std::to_string(errors) + " error(s)";
    for (const auto& d : diagnostics) {
        if (d.is_error()) {
            text += "\n  " + d.to_string();
        }
    }
    return text;
}

std::vector<Diagnostic> check_start_node(const Graph& graph) {
    if (graph.start_node()) return {};
    return {Diagnostic{"start_node", Severity::ERROR,
                       "Graph has no start node (shape=Mdiamond or id 'start')", std::nullopt, std::nullopt}};
}

std::vector<Diagnostic> check_exit_node(const Graph& graph) {
    if (graph.exit_node()) return {};
    return {Diagnostic{"exit_node", Severity::ERROR,
                       "Graph has no exit node (shape=Msquare or id 'exit'/'end')", std::nullopt, std::nullopt}};
}

std::vector<Diagnostic> check_edge_endpoints(const Graph& graph) {
    std::vector<Diagnostic> out;
    for (const auto& edge : graph.edges()) {
        for (const NodeId* id : {&edge.from_node, &edge.to_node}) {
            if (!graph.has_node(*id)) {
                out.push_back(Diagnostic{"edge_endpoints", Severity::ERROR,
                                         "Edge references unknown node '" + *id + "'",
                                         std::nullopt, std::make_pair(edge.from_node, edge.to_node)});
            }
        }
    }
    return out;
}

std::vector<Diagnostic> check_condition_syntax(const Graph& graph) {
    std::vector<Diagnostic> out;
    for (const auto& edge : graph.edges()) {
        if (!edge.has_condition()) continue;
        try {
            parse_condition(edge.condition);
        } catch (const ConditionSyntaxError& e) {
            out.push_back(Diagnostic{"condition_syntax", Severity::ERROR, e.what(),
                                     std::nullopt, std::make_pair(edge.from_node, edge.to_node)});
        }
    }
    return out;
}

} // namespace

ValidationError::ValidationError(std::vector<Diagnostic> diagnostics)
    : std::runtime_error(summarize(diagnostics)), diagnostics_(std::move(diagnostics)) {}

std::vector<ValidationRule> builtin_rules() {
    return {check_start_node, check_exit_node, check_edge_endpoints, check_condition_syntax};
}

std::vector<Diagnostic> validate(const Graph& graph, const std::vector<ValidationRule>& extra_rules) {
    std::vector<Diagnostic> diagnostics;
    auto run = [&](const ValidationRule& rule) {
        auto found = rule(graph);
        diagnostics.insert(diagnostics.end(), found.begin(), found.end());
    };
    for (const auto& rule : builtin_rules()) run(rule);
    for (const auto& rule : extra_rules) run(rule);
    return diagnostics;
}

std::vector<Diagnostic> validate_or_throw(const Graph& graph, const std::vector<ValidationRule>& extra_rules) {
    auto diagnostics = validate(graph, extra_rules);
    bool has_error = std::any_of(diagnostics.begin(), diagnostics.end(),
                                 [](const Diagnostic& d) { return d.is_error(); });
    if (has_error) {
        throw ValidationError(std::move(diagnostics));
    }
    return diagnostics;
}

} // namespace agentflow
