// modules/handlers/parallel_handler.cpp
#include "handlers/handlers.h"
#include "handlers/handler_registry.h"
#include "core/types/errors.h"
#include <exception>
#include <future>
#include <mutex>

namespace agentflow {

ParallelHandler::ParallelHandler(const HandlerRegistry& registry, const CancellationToken* cancel)
    : registry_(registry), cancel_(cancel) {}

Outcome ParallelHandler::execute(const Node& node, RunContext& context, const Graph& graph,
                                 const std::filesystem::path& log_dir) {
    std::vector<NodeId> missing;
    const auto children = resolve_child_nodes(node, graph, &missing);
    if (children.empty()) {
        if (missing.empty()) {
            return Outcome::success(Value{{node.id + ".complete", true}}, "No child nodes specified");
        }
        return Outcome::fail("No valid child nodes found for parallel node '" + node.id + "'");
    }

    // Resolve up front so an unknown child type is a configuration error on this thread
    std::vector<Handler*> handlers;
    handlers.reserve(children.size());
    for (const Node* child : children) {
        handlers.push_back(&registry_.resolve(*child));
    }

    std::mutex done_mutex;
    std::vector<Outcome> completed; // completion order

    auto run_child = [&](const Node* child, Handler* handler) {
        Outcome outcome;
        if (cancel_ && cancel_->is_cancelled()) {
            outcome = Outcome::fail("cancelled before start");
        } else {
            try {
                outcome = handler->execute(*child, context, graph, log_dir / child->id);
            } catch (const ConfigError&) {
                throw;
            } catch (const ConditionSyntaxError&) {
                throw;
            } catch (const std::exception& e) {
                outcome = Outcome::fail("Child '" + child->id + "' raised: " + e.what());
            }
        }
        std::lock_guard<std::mutex> lock(done_mutex);
        completed.push_back(std::move(outcome));
    };

    std::vector<std::future<void>> workers;
    workers.reserve(children.size());
    for (size_t i = 0; i < children.size(); ++i) {
        workers.push_back(std::async(std::launch::async, run_child, children[i], handlers[i]));
    }

    std::exception_ptr config_error;
    for (auto& worker : workers) {
        try {
            worker.get();
        } catch (...) {
            if (!config_error) config_error = std::current_exception();
        }
    }
    if (config_error) {
        std::rethrow_exception(config_error);
    }

    // 按完成顺序合并：后完成的子节点覆盖同名键
    Value merged = Value::object();
    size_t successes = 0;
    for (const auto& outcome : completed) {
        if (outcome.succeeded()) ++successes;
        if (outcome.context_updates.is_object()) {
            for (const auto& [key, value] : outcome.context_updates.items()) {
                merged[key] = value;
            }
        }
    }
    merged[node.id + ".complete"] = true;

    Outcome result;
    if (successes == completed.size()) {
        result.status = StageStatus::SUCCESS;
    } else if (successes > 0) {
        result.status = StageStatus::PARTIAL_SUCCESS;
    } else {
        result.status = StageStatus::FAIL;
        result.failure_reason = "All " + std::to_string(completed.size()) + " children failed";
    }
    result.context_updates = std::move(merged);
    result.notes = std::to_string(successes) + "/" + std::to_string(completed.size()) + " children succeeded";
    return result;
}

} // namespace agentflow
