// modules/handlers/stack_manager_handler.cpp
#include "handlers/handlers.h"
#include "handlers/handler_registry.h"
#include "common/utils/string_utils.h"

namespace agentflow {

StackManagerHandler::StackManagerHandler(const HandlerRegistry& registry, const CancellationToken* cancel)
    : registry_(registry), cancel_(cancel) {}

Outcome StackManagerHandler::execute(const Node& node, RunContext& context, const Graph& graph,
                                     const std::filesystem::path& log_dir) {
    std::vector<NodeId> missing;
    const auto body = resolve_child_nodes(node, graph, &missing);
    if (body.empty()) {
        if (missing.empty()) {
            return Outcome::success(Value::object(), "No child nodes specified");
        }
        return Outcome::fail("No valid child nodes found for loop node '" + node.id + "'");
    }

    auto done = [&context] { return is_truthy(context.get("stack_done")); };

    Value merged = Value::object();
    int iterations = 0;
    while (iterations < kMaxIterations) {
        if (done()) break;
        if (cancel_ && cancel_->is_cancelled()) {
            Outcome outcome = Outcome::fail("cancelled after " + std::to_string(iterations) + " iteration(s)");
            outcome.context_updates = std::move(merged);
            return outcome;
        }
        ++iterations;

        for (const Node* child : body) {
            Handler& handler = registry_.resolve(*child);
            auto child_dir = log_dir / (child->id + "_iter" + std::to_string(iterations));
            Outcome outcome = handler.execute(*child, context, graph, child_dir);

            // 立即写回，后续 body 节点在同一轮就能看到
            if (outcome.context_updates.is_object() && !outcome.context_updates.empty()) {
                context.apply_updates(outcome.context_updates);
                merged.update(outcome.context_updates);
            }

            if (outcome.failed()) {
                Outcome failure = Outcome::fail("Child " + child->id + " failed on iteration " +
                                                std::to_string(iterations) + ": " + outcome.failure_reason);
                failure.context_updates = std::move(merged);
                failure.context_updates[node.id + ".iterations"] = iterations;
                return failure;
            }
            if (done()) break;
        }
    }

    merged[node.id + ".iterations"] = iterations;
    return Outcome::success(std::move(merged),
                            "Loop completed after " + std::to_string(iterations) + " iteration(s)");
}

} // namespace agentflow
