// modules/scheduler/graph_scheduler.cpp
#include "scheduler/graph_scheduler.h"
#include "routing/edge_selector.h"
#include <algorithm>
#include <iostream>

namespace agentflow {

std::string to_string(RunState state) {
    switch (state) {
        case RunState::Running: return "running";
        case RunState::Completed: return "completed";
        case RunState::Failed: return "failed";
        case RunState::Cancelled: return "cancelled";
    }
    return "running";
}

GraphScheduler::GraphScheduler(const Graph& graph,
                               const HandlerRegistry& registry,
                               const EventBus& bus,
                               RunContext& context,
                               CancellationToken& cancel,
                               const EngineConfig& config,
                               std::filesystem::path logs_root)
    : graph_(graph),
      bus_(bus),
      context_(context),
      cancel_(cancel),
      config_(config),
      logs_root_(std::move(logs_root)),
      session_(registry, bus, cancel,
               ExecutionSession::Settings{config.backoff, config.poll_interval_ms, config.max_polls}) {
    budget_.max_steps = config.max_steps;
    budget_.max_duration_sec = config.max_duration_sec;
}

std::filesystem::path GraphScheduler::checkpoint_path() const {
    return logs_root_ / config_.checkpoint_file;
}

void GraphScheduler::restore(const Checkpoint& checkpoint) {
    completed_nodes_ = checkpoint.completed_nodes;
    node_retries_ = checkpoint.node_retries;
    node_outcomes_.clear(); // outcomes of restored nodes are unknown; goal gates only see this process' stages
    context_.apply_updates(checkpoint.context_values);
    context_.restore_logs(checkpoint.logs);
}

std::optional<NodeId> GraphScheduler::retry_target_for(const Node& node) const {
    for (const std::string& candidate : {node.retry_target,
                                         node.fallback_retry_target,
                                         graph_.attribute("retry_target"),
                                         graph_.attribute("fallback_retry_target")}) {
        if (!candidate.empty() && graph_.has_node(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

const Node* GraphScheduler::unsatisfied_goal_gate() const {
    for (const auto& id : completed_nodes_) {
        const Node* node = graph_.find_node(id);
        if (!node || !node->goal_gate) continue;
        auto it = node_outcomes_.find(id);
        if (it == node_outcomes_.end()) continue;
        if (it->second != StageStatus::SUCCESS && it->second != StageStatus::PARTIAL_SUCCESS) {
            return node;
        }
    }
    return nullptr;
}

void GraphScheduler::record_stage(const Node& node, const ExecutionSession::StageResult& result) {
    const Outcome& outcome = result.outcome;
    completed_nodes_.push_back(node.id);
    node_outcomes_[node.id] = outcome.status;
    node_retries_[node.id] = result.retries;

    context_.apply_updates(outcome.context_updates);
    context_.set("outcome", to_string(outcome.status));
    if (!outcome.preferred_label.empty()) {
        context_.set("preferred_label", outcome.preferred_label);
    }
    context_.append_log(node.id + ": " + to_string(outcome.status) +
                        (outcome.failure_reason.empty() ? "" : " (" + outcome.failure_reason + ")"));

    bus_.emit(StageCompleted{node.id, outcome});
}

void GraphScheduler::save_checkpoint(const NodeId& next_node, const NodeId& after_node) {
    if (!config_.checkpoint_enabled) return;
    auto checkpoint = Checkpoint::create_now(next_node, completed_nodes_, node_retries_,
                                             context_.snapshot(), context_.logs());
    const auto path = checkpoint_path();
    try {
        checkpoint.save(path);
    } catch (const std::exception& e) {
        std::cerr << "[WARNING] Checkpoint not saved: " << e.what() << std::endl;
        return;
    }
    bus_.emit(CheckpointSaved{after_node, path.string()});
}

RunResult GraphScheduler::finish_failed(std::string error, Outcome outcome) {
    std::cerr << "[ERROR] Pipeline '" << graph_.name() << "' failed: " << error << std::endl;
    bus_.emit(PipelineFailed{graph_.name(), error});
    RunResult result;
    result.state = RunState::Failed;
    result.outcome = std::move(outcome);
    result.error = std::move(error);
    result.completed_nodes = completed_nodes_;
    return result;
}

RunResult GraphScheduler::finish_cancelled(Outcome outcome) {
    std::cerr << "[WARNING] Pipeline '" << graph_.name() << "' cancelled" << std::endl;
    bus_.emit(PipelineFailed{graph_.name(), "cancelled"});
    RunResult result;
    result.state = RunState::Cancelled;
    result.outcome = std::move(outcome);
    result.error = "cancelled";
    result.completed_nodes = completed_nodes_;
    return result;
}

RunResult GraphScheduler::finish_interrupted(Outcome outcome) {
    if (!cancel_.cancel_requested() && budget_.duration_exceeded()) {
        return finish_failed("execution time budget exceeded (" +
                             std::to_string(budget_.max_duration_sec) + "s)", std::move(outcome));
    }
    return finish_cancelled(std::move(outcome));
}

namespace {

// Drops the run deadline from the shared token when run() returns or throws
struct DeadlineScope {
    CancellationToken& token;
    ~DeadlineScope() { token.set_deadline(std::nullopt); }
};

} // namespace

RunResult GraphScheduler::run(const NodeId& start_at) {
    budget_.restart();
    // backoff and barrier waits wake up when the duration budget runs out
    cancel_.set_deadline(budget_.deadline());
    DeadlineScope deadline_scope{cancel_};

    bus_.emit(PipelineStarted{graph_.name()});

    NodeId current = start_at;
    Outcome last_outcome;

    while (true) {
        if (cancel_.is_cancelled()) {
            return finish_interrupted(last_outcome);
        }

        const Node* node = graph_.find_node(current);
        if (!node) {
            return finish_failed("Unknown node '" + current + "'", last_outcome);
        }
        if (!budget_.try_consume_step()) {
            return finish_failed("step budget exhausted after " + std::to_string(budget_.max_steps) +
                                 " steps", last_outcome);
        }

        // 到达出口：先检查 goal gate
        if (graph_.is_exit(*node)) {
            if (const Node* gate = unsatisfied_goal_gate()) {
                if (auto target = retry_target_for(*gate)) {
                    std::cout << "[INFO] Goal gate '" << gate->id << "' unsatisfied, retrying from '"
                              << *target << "'" << std::endl;
                    current = *target;
                    continue;
                }
                return finish_failed("Goal gate unsatisfied on '" + gate->id + "' and no retry target",
                                     last_outcome);
            }

            context_.set("current_node", node->id);
            auto exit_result = session_.run_stage(*node, context_, graph_, logs_root_ / node->id);
            if (exit_result.cancelled) {
                return finish_interrupted(last_outcome);
            }
            record_stage(*node, exit_result);

            bus_.emit(PipelineCompleted{graph_.name(), last_outcome});
            RunResult result;
            result.state = RunState::Completed;
            result.outcome = last_outcome;
            result.completed_nodes = completed_nodes_;
            return result;
        }

        context_.set("current_node", node->id);
        auto stage = session_.run_stage(*node, context_, graph_, logs_root_ / node->id);
        if (stage.cancelled) {
            return finish_interrupted(stage.outcome);
        }
        record_stage(*node, stage);
        last_outcome = stage.outcome;

        const auto outgoing = graph_.outgoing_edges(node->id);
        std::optional<Edge> next_edge;
        NodeId next;

        if (stage.outcome.failed()) {
            // 重试耗尽：retry target -> 匹配失败结果的条件边 -> 运行失败
            if (auto target = retry_target_for(*node)) {
                next = *target;
            } else if ((next_edge = select_condition_edge(outgoing, stage.outcome, context_))) {
                next = next_edge->to_node;
            } else {
                return finish_failed("Stage '" + node->id + "' failed: " + stage.outcome.failure_reason,
                                     stage.outcome);
            }
        } else {
            next_edge = select_edge(outgoing, stage.outcome, context_);
            if (!next_edge) {
                return finish_failed("Dead end at '" + node->id + "': no outgoing edge", stage.outcome);
            }
            next = next_edge->to_node;
        }

        if (next_edge && next_edge->loop_restart) {
            completed_nodes_.clear();
            node_retries_.clear();
            node_outcomes_.clear();
        }

        current = next;
        save_checkpoint(current, node->id);
    }
}

} // namespace agentflow
