#ifndef AGENTFLOW_CORE_TYPES_GRAPH_H
#define AGENTFLOW_CORE_TYPES_GRAPH_H

#include "value.h"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace agentflow {

using AttributeMap = std::unordered_map<std::string, std::string>;

// Shapes with engine meaning; other shapes only select a handler family
inline constexpr const char* kStartShape = "Mdiamond";
inline constexpr const char* kExitShape = "Msquare";

// 图节点：由图加载器创建，运行期间只读
struct Node {
    NodeId id;
    std::string label;
    std::string shape = "box";
    std::string type;   // explicit handler type, empty = resolve by shape
    std::string prompt; // LLM instruction, CSV child ids or condition, depending on handler

    int max_retries = 0;
    bool goal_gate = false;
    bool allow_partial = false;
    NodeId retry_target;
    NodeId fallback_retry_target;

    std::string llm_model;
    std::string llm_provider;
    std::string fidelity;
    std::string reasoning_effort = "high";

    AttributeMap attrs;

    Node() = default;
    explicit Node(NodeId node_id, std::string node_label = "", std::string node_shape = "box");

    const std::string& display_name() const { return label.empty() ? id : label; }
};

struct Edge {
    NodeId from_node;
    NodeId to_node;
    std::string label;
    std::string condition;
    int weight = 0;
    bool loop_restart = false;

    Edge() = default;
    Edge(NodeId from, NodeId to, std::string edge_label = "", std::string edge_condition = "", int edge_weight = 0);

    bool has_condition() const;
};

class Graph {
public:
    explicit Graph(std::string name = "", AttributeMap attributes = {});

    // Throws std::invalid_argument on duplicate id
    void add_node(Node node);
    void add_edge(Edge edge);
    void set_attribute(const std::string& key, std::string value);

    const std::string& name() const { return name_; }
    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }
    const AttributeMap& attributes() const { return attributes_; }

    std::string attribute(const std::string& key, const std::string& fallback = "") const;
    std::string goal() const { return attribute("goal"); }

    bool has_node(const NodeId& id) const;
    const Node* find_node(const NodeId& id) const;
    // Throws std::out_of_range if the node does not exist
    const Node& node(const NodeId& id) const;

    // First Mdiamond node, else "start"/"Start"
    const Node* start_node() const;
    // First Msquare node, else "exit"/"end"/"Exit"/"End"
    const Node* exit_node() const;
    bool is_exit(const Node& node) const;

    std::vector<Edge> outgoing_edges(const NodeId& id) const;
    std::vector<Edge> incoming_edges(const NodeId& id) const;
    std::unordered_set<NodeId> reachable_from(const NodeId& id) const;

private:
    std::string name_;
    std::vector<Node> nodes_;
    std::unordered_map<NodeId, size_t> index_;
    std::vector<Edge> edges_;
    AttributeMap attributes_;
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_GRAPH_H
