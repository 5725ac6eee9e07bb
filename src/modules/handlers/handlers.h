// modules/handlers/handlers.h
#ifndef AGENTFLOW_MODULES_HANDLERS_HANDLERS_H
#define AGENTFLOW_MODULES_HANDLERS_HANDLERS_H

#include "handlers/handler.h"
#include "common/llm/generation_backend.h"
#include "common/tools/registry.h"
#include "core/types/cancellation.h"
#include "interviewer/interviewer.h"
#include <memory>
#include <vector>

namespace agentflow {

class HandlerRegistry;

// Records "started_at" (ISO-8601 UTC); always SUCCESS
class StartHandler : public Handler {
public:
    Outcome execute(const Node& node, RunContext& context, const Graph& graph,
                    const std::filesystem::path& log_dir) override;
};

// Always SUCCESS; the engine treats the exit node as run completion
class ExitHandler : public Handler {
public:
    Outcome execute(const Node& node, RunContext& context, const Graph& graph,
                    const std::filesystem::path& log_dir) override;
};

// 条件分支：先按出边条件匹配，再按 prompt 表达式 (yes/no 标签)，最后按上下文键值匹配标签
class ConditionalHandler : public Handler {
public:
    Outcome execute(const Node& node, RunContext& context, const Graph& graph,
                    const std::filesystem::path& log_dir) override;
};

// LLM 生成节点 (box)
class GenerationHandler : public Handler {
public:
    explicit GenerationHandler(std::shared_ptr<GenerationBackend> backend);

    Outcome execute(const Node& node, RunContext& context, const Graph& graph,
                    const std::filesystem::path& log_dir) override;

private:
    std::shared_ptr<GenerationBackend> backend_;
};

// 人工等待节点 (hexagon)。`interviewer` must outlive the handler.
class WaitHumanHandler : public Handler {
public:
    explicit WaitHumanHandler(Interviewer& interviewer);

    Outcome execute(const Node& node, RunContext& context, const Graph& graph,
                    const std::filesystem::path& log_dir) override;

private:
    Interviewer& interviewer_;
};

// Looks the tool up by node id, then by label. `tools` must outlive the handler.
class ToolHandler : public Handler {
public:
    explicit ToolHandler(const ToolRegistry& tools);

    Outcome execute(const Node& node, RunContext& context, const Graph& graph,
                    const std::filesystem::path& log_dir) override;

private:
    const ToolRegistry& tools_;
};

// 并行扇出：one worker thread per child, all sharing the same RunContext.
// Child updates are merged in completion order, so the last child to finish wins on a key collision.
class ParallelHandler : public Handler {
public:
    ParallelHandler(const HandlerRegistry& registry, const CancellationToken* cancel = nullptr);

    Outcome execute(const Node& node, RunContext& context, const Graph& graph,
                    const std::filesystem::path& log_dir) override;

private:
    const HandlerRegistry& registry_;
    const CancellationToken* cancel_;
};

// Barrier: RETRY until every predecessor has set "{pred}.complete"
class FanInHandler : public Handler {
public:
    Outcome execute(const Node& node, RunContext& context, const Graph& graph,
                    const std::filesystem::path& log_dir) override;
};

// 顺序子循环：重复执行 body 直到 "stack_done" 为真或达到 kMaxIterations
class StackManagerHandler : public Handler {
public:
    static constexpr int kMaxIterations = 100;

    StackManagerHandler(const HandlerRegistry& registry, const CancellationToken* cancel = nullptr);

    Outcome execute(const Node& node, RunContext& context, const Graph& graph,
                    const std::filesystem::path& log_dir) override;

private:
    const HandlerRegistry& registry_;
    const CancellationToken* cancel_;
};

// Children listed in the node prompt (falls back to the label), resolved against the graph
std::vector<const Node*> resolve_child_nodes(const Node& node, const Graph& graph, std::vector<NodeId>* missing = nullptr);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_HANDLERS_HANDLERS_H
