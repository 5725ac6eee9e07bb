// modules/transforms/variable_expansion.cpp
#include "transforms/variable_expansion.h"

namespace agentflow {

std::string expand_goal(const std::string& text, const std::string& goal) {
    static const std::string kToken = "$goal";
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (true) {
        size_t hit = text.find(kToken, pos);
        if (hit == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, hit - pos);
        out += goal;
        pos = hit + kToken.size();
    }
    return out;
}

Graph expand_goal_variables(const Graph& graph) {
    const std::string goal = graph.goal();
    Graph expanded(graph.name(), graph.attributes());
    for (Node node : graph.nodes()) {
        if (node.prompt.find("$goal") != std::string::npos) {
            node.prompt = expand_goal(node.prompt, goal);
        }
        expanded.add_node(std::move(node));
    }
    for (const auto& edge : graph.edges()) {
        expanded.add_edge(edge);
    }
    return expanded;
}

} // namespace agentflow
