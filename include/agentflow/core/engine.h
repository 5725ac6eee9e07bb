// agentflow/core/engine.h
#ifndef AGENTFLOW_CORE_ENGINE_H
#define AGENTFLOW_CORE_ENGINE_H

#include "core/types/graph.h"
#include "checkpoint/checkpoint.h"
#include "common/llm/generation_backend.h"
#include "common/tools/registry.h"
#include "config/engine_config.h"
#include "events/event_bus.h"
#include "handlers/handler_registry.h"
#include "interviewer/interviewer.h"
#include "scheduler/graph_scheduler.h"
#include "trace/trace_exporter.h"
#include "validation/preflight.h"
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace agentflow {

// 流水线引擎门面：持有工具表、处理器、事件总线、运行上下文与配置
class PipelineEngine {
public:
    static std::unique_ptr<PipelineEngine> create(Graph graph, EngineConfig config = {});
    // Throws ConfigError for an unreadable or invalid config file
    static std::unique_ptr<PipelineEngine> from_config_file(Graph graph, const std::filesystem::path& config_path);

    PipelineEngine(Graph graph, EngineConfig config);
    PipelineEngine(const PipelineEngine&) = delete;
    PipelineEngine& operator=(const PipelineEngine&) = delete;

    template <typename Func>
    void register_tool(std::string_view name, Func&& func) {
        tool_registry_.register_tool(std::string(name), std::forward<Func>(func));
    }

    // Custom handlers take precedence over the built-in ones of the same type
    void register_handler(std::string type, std::shared_ptr<Handler> handler);
    void set_default_handler(std::shared_ptr<Handler> handler);
    void set_generation_backend(std::shared_ptr<GenerationBackend> backend);
    // Enables wait.human nodes; `interviewer` must outlive the engine
    void set_interviewer(Interviewer* interviewer);
    void add_validation_rule(ValidationRule rule);

    // Runs from the start node with `initial_context` seeded into a fresh RunContext
    // (references obtained from context() before the call are invalidated).
    // Throws ValidationError (preflight), ConfigError or ConditionSyntaxError; everything else
    // is reported through the RunResult.
    RunResult run(const Value& initial_context = Value::object());
    RunResult resume(const Checkpoint& checkpoint);
    RunResult resume_from_file(const std::filesystem::path& checkpoint_path);

    // Cooperative: takes effect at the next step boundary or wait
    void cancel();

    EventBus& event_bus() { return event_bus_; }
    RunContext& context() { return *context_; }
    const Graph& graph() const { return graph_; }
    const EngineConfig& config() const { return config_; }
    const std::filesystem::path& logs_root() const { return logs_root_; }
    std::filesystem::path checkpoint_path() const { return logs_root_ / config_.checkpoint_file; }

    std::vector<TraceRecord> get_last_traces() const { return trace_exporter_.get_traces(); }
    const TraceExporter& trace_exporter() const { return trace_exporter_; }

private:
    Graph graph_;
    EngineConfig config_;
    std::filesystem::path logs_root_;

    ToolRegistry tool_registry_;
    std::shared_ptr<GenerationBackend> backend_;
    Interviewer* interviewer_ = nullptr;
    std::vector<std::pair<std::string, std::shared_ptr<Handler>>> custom_handlers_;
    std::shared_ptr<Handler> default_handler_;
    std::vector<ValidationRule> extra_rules_;

    EventBus event_bus_;
    TraceExporter trace_exporter_;
    CancellationToken cancel_;
    std::unique_ptr<RunContext> context_;
    std::unique_ptr<HandlerRegistry> registry_;

    void prepare_run();
    void write_manifest() const;
    RunResult execute(const NodeId& start_at, const Checkpoint* checkpoint);
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_ENGINE_H
