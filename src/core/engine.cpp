// src/core/engine.cpp
#include "agentflow/core/engine.h"
#include "common/utils/file_io.h"
#include "common/utils/time_format.h"
#include "core/types/errors.h"
#include "transforms/variable_expansion.h"
#include <iostream>
#include <stdexcept>

namespace agentflow {

std::unique_ptr<PipelineEngine> PipelineEngine::create(Graph graph, EngineConfig config) {
    return std::make_unique<PipelineEngine>(std::move(graph), std::move(config));
}

std::unique_ptr<PipelineEngine> PipelineEngine::from_config_file(Graph graph, const std::filesystem::path& config_path) {
    return create(std::move(graph), EngineConfig::from_yaml_file(config_path));
}

PipelineEngine::PipelineEngine(Graph graph, EngineConfig config)
    : graph_(expand_goal_variables(graph)),
      config_(std::move(config)),
      logs_root_(config_.logs_root.empty()
                     ? std::filesystem::path("agentflow-runs") / compact_timestamp_now()
                     : config_.logs_root),
      backend_(std::make_shared<StubBackend>()),
      trace_exporter_(config_.trace_echo),
      context_(std::make_unique<RunContext>()) {
    trace_exporter_.attach(event_bus_);
}

void PipelineEngine::register_handler(std::string type, std::shared_ptr<Handler> handler) {
    if (type.empty() || !handler) {
        throw std::invalid_argument("register_handler requires a type name and a handler");
    }
    custom_handlers_.emplace_back(std::move(type), std::move(handler));
}

void PipelineEngine::set_default_handler(std::shared_ptr<Handler> handler) {
    default_handler_ = std::move(handler);
}

void PipelineEngine::set_generation_backend(std::shared_ptr<GenerationBackend> backend) {
    backend_ = backend ? std::move(backend) : std::make_shared<StubBackend>();
}

void PipelineEngine::set_interviewer(Interviewer* interviewer) {
    interviewer_ = interviewer;
}

void PipelineEngine::add_validation_rule(ValidationRule rule) {
    extra_rules_.push_back(std::move(rule));
}

void PipelineEngine::cancel() {
    cancel_.cancel();
}

void PipelineEngine::prepare_run() {
    if (config_.preflight) {
        for (const auto& warning : validate_or_throw(graph_, extra_rules_)) {
            std::cerr << "[WARNING] " << warning.to_string() << std::endl;
        }
    }

    registry_ = create_default_registry(backend_, interviewer_, tool_registry_, &cancel_);
    for (const auto& [type, handler] : custom_handlers_) {
        registry_->register_handler(type, handler);
    }
    if (default_handler_) {
        registry_->set_default(default_handler_);
    }

    std::filesystem::create_directories(logs_root_);
    trace_exporter_.clear_traces();
}

void PipelineEngine::write_manifest() const {
    Value manifest{
        {"name", graph_.name()},
        {"goal", graph_.goal()},
        {"started_at", iso8601_now()}
    };
    try {
        write_json_file(logs_root_ / "manifest.json", manifest);
    } catch (const std::exception& e) {
        std::cerr << "[WARNING] Could not write run manifest: " << e.what() << std::endl;
    }
}

RunResult PipelineEngine::execute(const NodeId& start_at, const Checkpoint* checkpoint) {
    GraphScheduler scheduler(graph_, *registry_, event_bus_, *context_, cancel_, config_, logs_root_);
    if (checkpoint) {
        scheduler.restore(*checkpoint);
    }
    context_->set("graph.goal", graph_.goal());
    write_manifest();

    std::cout << "[INFO] Running pipeline '" << graph_.name() << "' from '" << start_at
              << "', logs in " << logs_root_.string() << std::endl;
    RunResult result = scheduler.run(start_at);
    std::cout << "[INFO] Pipeline '" << graph_.name() << "' " << to_string(result.state) << std::endl;
    return result;
}

RunResult PipelineEngine::run(const Value& initial_context) {
    prepare_run();

    const Node* start = graph_.start_node();
    if (!start) {
        throw ConfigError("No start node found in graph '" + graph_.name() + "'");
    }

    context_ = std::make_unique<RunContext>();
    context_->apply_updates(initial_context);
    return execute(start->id, nullptr);
}

RunResult PipelineEngine::resume(const Checkpoint& checkpoint) {
    prepare_run();

    if (!graph_.has_node(checkpoint.current_node)) {
        throw ConfigError("Checkpoint resumes at unknown node '" + checkpoint.current_node + "'");
    }

    context_ = std::make_unique<RunContext>();
    return execute(checkpoint.current_node, &checkpoint);
}

RunResult PipelineEngine::resume_from_file(const std::filesystem::path& checkpoint_path) {
    return resume(Checkpoint::load(checkpoint_path));
}

} // namespace agentflow
