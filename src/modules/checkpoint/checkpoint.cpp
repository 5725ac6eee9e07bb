// modules/checkpoint/checkpoint.cpp
#include "checkpoint/checkpoint.h"
#include "common/utils/time_format.h"
#include <fstream>
#include <stdexcept>

namespace agentflow {

Value Checkpoint::to_json() const {
    Value data;
    data["timestamp"] = timestamp;
    data["current_node"] = current_node;
    data["completed_nodes"] = completed_nodes;
    data["node_retries"] = Value::object();
    for (const auto& [id, count] : node_retries) {
        data["node_retries"][id] = count;
    }
    data["context_values"] = context_values.is_object() ? context_values : Value::object();
    data["logs"] = logs;
    return data;
}

Checkpoint Checkpoint::from_json(const Value& data) {
    if (!data.is_object() || !data.contains("timestamp") || !data.contains("current_node")) {
        throw std::runtime_error("Invalid checkpoint: 'timestamp' and 'current_node' are required");
    }

    Checkpoint cp;
    try {
        cp.timestamp = data.at("timestamp").get<std::string>();
        cp.current_node = data.at("current_node").get<std::string>();
        cp.completed_nodes = data.value("completed_nodes", std::vector<NodeId>{});
        if (data.contains("node_retries")) {
            for (const auto& [id, count] : data.at("node_retries").items()) {
                cp.node_retries[id] = count.get<int>();
            }
        }
        cp.context_values = data.value("context_values", Value::object());
        cp.logs = data.value("logs", std::vector<std::string>{});
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid checkpoint: ") + e.what());
    }
    return cp;
}

void Checkpoint::save(const std::filesystem::path& path) const {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write checkpoint: " + path.string());
    }
    file << to_json().dump(2);
    if (!file) {
        throw std::runtime_error("Failed writing checkpoint: " + path.string());
    }
}

Checkpoint Checkpoint::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open checkpoint: " + path.string());
    }
    Value data;
    try {
        file >> data;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed checkpoint " + path.string() + ": " + e.what());
    }
    return from_json(data);
}

Checkpoint Checkpoint::create_now(NodeId current_node,
                                  std::vector<NodeId> completed_nodes,
                                  std::map<NodeId, int> node_retries,
                                  Value context_values,
                                  std::vector<std::string> logs) {
    Checkpoint cp;
    cp.timestamp = iso8601_now();
    cp.current_node = std::move(current_node);
    cp.completed_nodes = std::move(completed_nodes);
    cp.node_retries = std::move(node_retries);
    cp.context_values = std::move(context_values);
    cp.logs = std::move(logs);
    return cp;
}

} // namespace agentflow
