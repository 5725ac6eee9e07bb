// modules/checkpoint/checkpoint.h
#ifndef AGENTFLOW_MODULES_CHECKPOINT_CHECKPOINT_H
#define AGENTFLOW_MODULES_CHECKPOINT_CHECKPOINT_H

#include "core/types/value.h"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace agentflow {

// 引擎进度快照，用于断点续跑
struct Checkpoint {
    std::string timestamp; // ISO-8601 UTC
    NodeId current_node;   // next node to execute on resume
    std::vector<NodeId> completed_nodes;
    std::map<NodeId, int> node_retries;
    Value context_values = Value::object();
    std::vector<std::string> logs;

    bool operator==(const Checkpoint&) const = default;

    Value to_json() const;
    // Missing optional fields default to empty; missing timestamp/current_node throws std::runtime_error
    static Checkpoint from_json(const Value& data);

    // Creates parent directories; throws std::runtime_error on I/O failure
    void save(const std::filesystem::path& path) const;
    static Checkpoint load(const std::filesystem::path& path);

    static Checkpoint create_now(NodeId current_node,
                                 std::vector<NodeId> completed_nodes = {},
                                 std::map<NodeId, int> node_retries = {},
                                 Value context_values = Value::object(),
                                 std::vector<std::string> logs = {});
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_CHECKPOINT_CHECKPOINT_H
