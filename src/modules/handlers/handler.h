// modules/handlers/handler.h
#ifndef AGENTFLOW_MODULES_HANDLERS_HANDLER_H
#define AGENTFLOW_MODULES_HANDLERS_HANDLER_H

#include "core/types/graph.h"
#include "core/types/outcome.h"
#include "context/run_context.h"
#include <filesystem>

namespace agentflow {

// 节点处理器接口。
// Expected domain failures are returned as Outcome{FAIL}; an escaping std::exception
// is treated by the engine as a failed attempt. ConfigError/ConditionSyntaxError propagate.
class Handler {
public:
    virtual ~Handler() = default;

    virtual Outcome execute(const Node& node,
                            RunContext& context,
                            const Graph& graph,
                            const std::filesystem::path& log_dir) = 0;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_HANDLERS_HANDLER_H
