// modules/scheduler/execution_session.cpp
#include "scheduler/execution_session.h"
#include "common/utils/file_io.h"
#include "core/types/errors.h"
#include <chrono>
#include <iostream>

namespace agentflow {

ExecutionSession::ExecutionSession(const HandlerRegistry& registry,
                                   const EventBus& bus,
                                   const CancellationToken& cancel,
                                   Settings settings)
    : registry_(registry), bus_(bus), cancel_(cancel), settings_(settings) {}

Outcome ExecutionSession::invoke(Handler& handler, const Node& node, RunContext& context, const Graph& graph,
                                 const std::filesystem::path& stage_dir) {
    try {
        return handler.execute(node, context, graph, stage_dir);
    } catch (const ConfigError&) {
        throw;
    } catch (const ConditionSyntaxError&) {
        throw;
    } catch (const std::exception& e) {
        return Outcome::fail(std::string("Handler raised: ") + e.what());
    }
}

void ExecutionSession::write_status(const std::filesystem::path& stage_dir, const Outcome& outcome) const {
    try {
        write_json_file(stage_dir / "status.json", outcome.to_json());
    } catch (const std::exception& e) {
        std::cerr << "[WARNING] Could not write stage status: " << e.what() << std::endl;
    }
}

ExecutionSession::StageResult ExecutionSession::run_stage(const Node& node, RunContext& context, const Graph& graph,
                                                          const std::filesystem::path& stage_dir) {
    Handler& handler = registry_.resolve(node);
    const RetryPolicy policy = build_retry_policy(node, graph, settings_.backoff);

    bus_.emit(StageStarted{node.id});

    StageResult result;
    int attempt = 1;
    int polls = 0;
    while (true) {
        if (cancel_.is_cancelled()) {
            result.outcome = Outcome::fail("cancelled");
            result.cancelled = true;
            return result;
        }

        Outcome outcome = invoke(handler, node, context, graph, stage_dir);

        // 轮询屏障：不消耗重试次数，但有上限
        if (outcome.status == StageStatus::RETRY) {
            if (++polls < settings_.max_polls) {
                if (!cancel_.wait_for(std::chrono::milliseconds(settings_.poll_interval_ms))) {
                    result.outcome = Outcome::fail("cancelled");
                    result.cancelled = true;
                    return result;
                }
                continue;
            }
            polls = 0;
            if (node.allow_partial) {
                outcome = Outcome{};
                outcome.status = StageStatus::PARTIAL_SUCCESS;
                outcome.notes = "barrier poll limit exceeded, partial accepted";
            } else {
                outcome = Outcome::fail("barrier poll limit exceeded");
            }
        }

        if (!outcome.failed()) {
            write_status(stage_dir, outcome);
            result.outcome = std::move(outcome);
            return result;
        }

        const bool will_retry = attempt < policy.max_attempts;
        bus_.emit(StageFailed{node.id, outcome.failure_reason, will_retry});
        if (!will_retry) {
            write_status(stage_dir, outcome);
            result.outcome = std::move(outcome);
            return result;
        }

        const double delay = policy.delay_for_attempt(attempt);
        bus_.emit(StageRetrying{node.id, attempt, delay});
        ++result.retries;
        if (!cancel_.wait_for(std::chrono::duration<double>(delay))) {
            result.outcome = Outcome::fail("cancelled");
            result.cancelled = true;
            return result;
        }
        ++attempt;
    }
}

} // namespace agentflow
