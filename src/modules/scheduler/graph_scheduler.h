// modules/scheduler/graph_scheduler.h
#ifndef AGENTFLOW_MODULES_SCHEDULER_GRAPH_SCHEDULER_H
#define AGENTFLOW_MODULES_SCHEDULER_GRAPH_SCHEDULER_H

#include "checkpoint/checkpoint.h"
#include "config/engine_config.h"
#include "core/types/budget.h"
#include "scheduler/execution_session.h"
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

enum class RunState : uint8_t {
    Running,
    Completed,
    Failed,
    Cancelled
};

std::string to_string(RunState state);

struct RunResult {
    RunState state = RunState::Running;
    Outcome outcome;   // last stage outcome before the exit node, or the failing one
    std::string error; // empty unless Failed / Cancelled
    std::vector<NodeId> completed_nodes;

    bool completed() const { return state == RunState::Completed; }
};

// 图遍历状态机：逐节点执行、选边、推进、写检查点。
// Single-threaded; one instance per run.
class GraphScheduler {
public:
    GraphScheduler(const Graph& graph,
                   const HandlerRegistry& registry,
                   const EventBus& bus,
                   RunContext& context,
                   CancellationToken& cancel,
                   const EngineConfig& config,
                   std::filesystem::path logs_root);

    // Restores completed nodes, retry counters, context values and logs
    void restore(const Checkpoint& checkpoint);

    // Walks from `start_at` until the exit node, a failure, cancellation or budget exhaustion.
    // Throws ConfigError / ConditionSyntaxError for configuration problems.
    RunResult run(const NodeId& start_at);

    const std::vector<NodeId>& completed_nodes() const { return completed_nodes_; }
    const std::map<NodeId, int>& node_retries() const { return node_retries_; }
    std::filesystem::path checkpoint_path() const;

private:
    const Graph& graph_;
    const EventBus& bus_;
    RunContext& context_;
    CancellationToken& cancel_; // carries the duration budget as its deadline during run()
    const EngineConfig& config_;
    std::filesystem::path logs_root_;
    ExecutionSession session_;
    ExecutionBudget budget_;

    std::vector<NodeId> completed_nodes_;
    std::map<NodeId, int> node_retries_;
    std::unordered_map<NodeId, StageStatus> node_outcomes_; // goal-gate bookkeeping

    // node retry_target -> node fallback -> graph retry_target -> graph fallback
    std::optional<NodeId> retry_target_for(const Node& node) const;
    // First goal-gate node whose latest outcome did not succeed
    const Node* unsatisfied_goal_gate() const;

    void record_stage(const Node& node, const ExecutionSession::StageResult& result);
    void save_checkpoint(const NodeId& next_node, const NodeId& after_node);

    RunResult finish_failed(std::string error, Outcome outcome);
    RunResult finish_cancelled(Outcome outcome);
    // A wait cut short by the token: explicit cancel, or the duration budget running out
    RunResult finish_interrupted(Outcome outcome);
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_SCHEDULER_GRAPH_SCHEDULER_H
