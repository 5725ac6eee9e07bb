// modules/handlers/handler_registry.h
#ifndef AGENTFLOW_MODULES_HANDLERS_HANDLER_REGISTRY_H
#define AGENTFLOW_MODULES_HANDLERS_HANDLER_REGISTRY_H

#include "handlers/handler.h"
#include "common/llm/generation_backend.h"
#include "common/tools/registry.h"
#include "core/types/cancellation.h"
#include "interviewer/interviewer.h"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

// 节点类型 -> Handler。Populated during setup, read-only while a run is in progress.
// Parallel and loop handlers keep a reference to their registry, so it is neither copyable nor movable.
class HandlerRegistry {
public:
    HandlerRegistry() = default;
    HandlerRegistry(const HandlerRegistry&) = delete;
    HandlerRegistry& operator=(const HandlerRegistry&) = delete;

    void register_handler(std::string type, std::shared_ptr<Handler> handler);
    void set_default(std::shared_ptr<Handler> handler);

    bool has_handler(const std::string& type) const;
    std::vector<std::string> registered_types() const;

    // explicit type -> shape -> default handler; throws ConfigError when nothing matches
    Handler& resolve(const Node& node) const;

    // "" for shapes without a handler family
    static std::string type_for_shape(const std::string& shape);

private:
    std::unordered_map<std::string, std::shared_ptr<Handler>> handlers_;
    std::shared_ptr<Handler> default_handler_;
};

// Registers the nine built-in handlers. wait.human is registered only when `interviewer` is set;
// a null `backend` means StubBackend. `tools`, `interviewer` and `cancel` must outlive the registry.
std::unique_ptr<HandlerRegistry> create_default_registry(std::shared_ptr<GenerationBackend> backend,
                                                         Interviewer* interviewer,
                                                         const ToolRegistry& tools,
                                                         const CancellationToken* cancel = nullptr);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_HANDLERS_HANDLER_REGISTRY_H
