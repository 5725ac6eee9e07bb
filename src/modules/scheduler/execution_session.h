// modules/scheduler/execution_session.h
#ifndef AGENTFLOW_MODULES_SCHEDULER_EXECUTION_SESSION_H
#define AGENTFLOW_MODULES_SCHEDULER_EXECUTION_SESSION_H

#include "core/types/cancellation.h"
#include "core/types/graph.h"
#include "core/types/outcome.h"
#include "context/run_context.h"
#include "events/event_bus.h"
#include "handlers/handler_registry.h"
#include "retry/retry_policy.h"
#include <filesystem>

namespace agentflow {

// ExecutionSession 负责单个节点的一次完整执行：重试、退避、fan-in 轮询、status.json
class ExecutionSession {
public:
    struct Settings {
        BackoffConfig backoff;
        int poll_interval_ms = 50;
        int max_polls = 600;
    };

    struct StageResult {
        Outcome outcome;
        int retries = 0;        // failed attempts that were retried
        bool cancelled = false; // cancellation interrupted the stage
    };

    ExecutionSession(const HandlerRegistry& registry,
                     const EventBus& bus,
                     const CancellationToken& cancel,
                     Settings settings);

    // Emits StageStarted / StageFailed / StageRetrying. FAIL and handler exceptions consume an
    // attempt; RETRY re-invokes the handler without consuming one, up to max_polls times.
    // Throws ConfigError when no handler resolves for the node.
    StageResult run_stage(const Node& node, RunContext& context, const Graph& graph,
                          const std::filesystem::path& stage_dir);

private:
    const HandlerRegistry& registry_;
    const EventBus& bus_;
    const CancellationToken& cancel_;
    Settings settings_;

    Outcome invoke(Handler& handler, const Node& node, RunContext& context, const Graph& graph,
                   const std::filesystem::path& stage_dir);
    void write_status(const std::filesystem::path& stage_dir, const Outcome& outcome) const;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_SCHEDULER_EXECUTION_SESSION_H
