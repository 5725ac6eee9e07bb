// modules/handlers/basic_handlers.cpp
#include "handlers/handlers.h"
#include "condition/condition_evaluator.h"
#include "common/utils/string_utils.h"
#include "common/utils/time_format.h"
#include <algorithm>

namespace agentflow {

std::vector<const Node*> resolve_child_nodes(const Node& node, const Graph& graph, std::vector<NodeId>* missing) {
    const std::string& list = node.prompt.empty() ? node.label : node.prompt;
    std::vector<const Node*> children;
    for (const auto& id : split_csv(list)) {
        if (const Node* child = graph.find_node(id)) {
            children.push_back(child);
        } else if (missing) {
            missing->push_back(id);
        }
    }
    return children;
}

// ---------- StartHandler ----------

Outcome StartHandler::execute(const Node&, RunContext&, const Graph&, const std::filesystem::path&) {
    return Outcome::success(Value{{"started_at", iso8601_now()}});
}

// ---------- ExitHandler ----------

Outcome ExitHandler::execute(const Node&, RunContext&, const Graph&, const std::filesystem::path&) {
    return Outcome::success();
}

// ---------- ConditionalHandler ----------

namespace {

bool is_affirmative_label(const std::string& label) {
    return label == "yes" || label == "true" || label == "y";
}

bool is_negative_label(const std::string& label) {
    return label == "no" || label == "false" || label == "n";
}

Outcome branch_to(const Edge& edge) {
    Outcome outcome;
    outcome.preferred_label = edge.label;
    outcome.notes = "branch -> " + edge.to_node;
    return outcome;
}

} // namespace

Outcome ConditionalHandler::execute(const Node& node, RunContext& context, const Graph& graph,
                                    const std::filesystem::path&) {
    const std::string& prompt = node.prompt.empty() ? node.label : node.prompt;
    const auto outgoing = graph.outgoing_edges(node.id);
    const Outcome probe{}; // conditions see a SUCCESS outcome and the live context

    // 1. 出边自身的条件
    for (const auto& edge : outgoing) {
        if (edge.has_condition() && evaluate_condition(edge.condition, probe, context)) {
            return branch_to(edge);
        }
    }

    // 2. prompt 是条件表达式：结果映射到 yes/no 类标签
    if (prompt.find('=') != std::string::npos) {
        bool result = evaluate_condition(prompt, probe, context);
        for (const auto& edge : outgoing) {
            std::string label = to_lower(trim(edge.label));
            if ((result && is_affirmative_label(label)) || (!result && is_negative_label(label))) {
                return branch_to(edge);
            }
        }
    }

    // 3. prompt 是上下文键：值与标签不区分大小写匹配
    if (!prompt.empty()) {
        std::string value = to_lower(trim(value_to_string(context.get(trim(prompt)))));
        if (!value.empty()) {
            for (const auto& edge : outgoing) {
                if (to_lower(trim(edge.label)) == value) {
                    return branch_to(edge);
                }
            }
        }
    }

    return Outcome::success(Value::object(), "no branch matched");
}

// ---------- ToolHandler ----------

ToolHandler::ToolHandler(const ToolRegistry& tools) : tools_(tools) {}

Outcome ToolHandler::execute(const Node& node, RunContext& context, const Graph&, const std::filesystem::path&) {
    const ToolRegistry::Tool* tool = tools_.find_tool(node.id);
    if (!tool && !node.label.empty()) {
        tool = tools_.find_tool(node.label);
    }
    if (!tool) {
        return Outcome::fail("No tool registered for node '" + node.id + "' or label '" + node.label + "'");
    }

    Value result;
    try {
        result = (*tool)(context.snapshot());
    } catch (const std::exception& e) {
        return Outcome::fail("Tool '" + node.id + "' raised: " + e.what());
    }

    if (result.is_object()) {
        return Outcome::success(std::move(result));
    }
    if (result.is_null()) {
        return Outcome::success();
    }
    return Outcome::success(Value{{node.id + ".result", std::move(result)}});
}

// ---------- FanInHandler ----------

Outcome FanInHandler::execute(const Node& node, RunContext& context, const Graph& graph,
                              const std::filesystem::path&) {
    std::vector<NodeId> predecessors;
    for (const auto& edge : graph.incoming_edges(node.id)) {
        if (std::find(predecessors.begin(), predecessors.end(), edge.from_node) == predecessors.end()) {
            predecessors.push_back(edge.from_node);
        }
    }
    if (predecessors.empty()) {
        return Outcome::success(Value::object(), "No predecessors to wait for");
    }

    std::vector<NodeId> missing;
    for (const auto& pred : predecessors) {
        if (!is_truthy(context.get(pred + ".complete"))) {
            missing.push_back(pred);
        }
    }

    if (!missing.empty()) {
        std::string names;
        for (const auto& id : missing) {
            if (!names.empty()) names += ", ";
            names += id;
        }
        return Outcome::retry("Waiting for predecessors: " + names);
    }
    return Outcome::success(Value::object(),
                            "All " + std::to_string(predecessors.size()) + " predecessors completed");
}

} // namespace agentflow
