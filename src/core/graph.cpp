// src/core/graph.cpp
#include "core/types/graph.h"
#include "common/utils/string_utils.h"
#include <stdexcept>

namespace agentflow {

Node::Node(NodeId node_id, std::string node_label, std::string node_shape)
    : id(std::move(node_id)), label(std::move(node_label)), shape(std::move(node_shape)) {
    if (id.empty()) {
        throw std::invalid_argument("Node id must be a non-empty string");
    }
}

Edge::Edge(NodeId from, NodeId to, std::string edge_label, std::string edge_condition, int edge_weight)
    : from_node(std::move(from)),
      to_node(std::move(to)),
      label(std::move(edge_label)),
      condition(std::move(edge_condition)),
      weight(edge_weight) {
    if (from_node.empty() || to_node.empty()) {
        throw std::invalid_argument("Edge must have non-empty from_node and to_node");
    }
}

bool Edge::has_condition() const {
    return !trim(condition).empty();
}

Graph::Graph(std::string name, AttributeMap attributes)
    : name_(std::move(name)), attributes_(std::move(attributes)) {}

void Graph::add_node(Node node) {
    if (node.id.empty()) {
        throw std::invalid_argument("Node id must be a non-empty string");
    }
    if (index_.count(node.id) > 0) {
        throw std::invalid_argument("Duplicate node id: " + node.id);
    }
    index_[node.id] = nodes_.size();
    nodes_.push_back(std::move(node));
}

void Graph::add_edge(Edge edge) {
    edges_.push_back(std::move(edge));
}

void Graph::set_attribute(const std::string& key, std::string value) {
    attributes_[key] = std::move(value);
}

std::string Graph::attribute(const std::string& key, const std::string& fallback) const {
    auto it = attributes_.find(key);
    return it != attributes_.end() ? it->second : fallback;
}

bool Graph::has_node(const NodeId& id) const {
    return index_.count(id) > 0;
}

const Node* Graph::find_node(const NodeId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &nodes_[it->second];
}

const Node& Graph::node(const NodeId& id) const {
    const Node* found = find_node(id);
    if (!found) {
        throw std::out_of_range("Node not found in graph '" + name_ + "': " + id);
    }
    return *found;
}

const Node* Graph::start_node() const {
    for (const auto& n : nodes_) {
        if (n.shape == kStartShape) return &n;
    }
    for (const char* name : {"start", "Start"}) {
        if (const Node* n = find_node(name)) return n;
    }
    return nullptr;
}

const Node* Graph::exit_node() const {
    for (const auto& n : nodes_) {
        if (n.shape == kExitShape) return &n;
    }
    for (const char* name : {"exit", "end", "Exit", "End"}) {
        if (const Node* n = find_node(name)) return n;
    }
    return nullptr;
}

bool Graph::is_exit(const Node& node) const {
    if (node.shape == kExitShape) return true;
    const Node* exit = exit_node();
    return exit != nullptr && exit->id == node.id;
}

std::vector<Edge> Graph::outgoing_edges(const NodeId& id) const {
    std::vector<Edge> result;
    for (const auto& e : edges_) {
        if (e.from_node == id) result.push_back(e);
    }
    return result;
}

std::vector<Edge> Graph::incoming_edges(const NodeId& id) const {
    std::vector<Edge> result;
    for (const auto& e : edges_) {
        if (e.to_node == id) result.push_back(e);
    }
    return result;
}

std::unordered_set<NodeId> Graph::reachable_from(const NodeId& id) const {
    std::unordered_set<NodeId> visited;
    std::vector<NodeId> stack{id};
    while (!stack.empty()) {
        NodeId current = std::move(stack.back());
        stack.pop_back();
        if (!visited.insert(current).second) {
            continue;
        }
        for (const auto& e : edges_) {
            if (e.from_node == current) stack.push_back(e.to_node);
        }
    }
    return visited;
}

} // namespace agentflow
