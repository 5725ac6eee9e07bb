// modules/handlers/handler_registry.cpp
#include "handlers/handler_registry.h"
#include "handlers/handlers.h"
#include "core/types/errors.h"
#include <algorithm>
#include <stdexcept>

namespace agentflow {

void HandlerRegistry::register_handler(std::string type, std::shared_ptr<Handler> handler) {
    if (type.empty() || !handler) {
        throw std::invalid_argument("register_handler requires a type name and a handler");
    }
    handlers_[std::move(type)] = std::move(handler);
}

void HandlerRegistry::set_default(std::shared_ptr<Handler> handler) {
    default_handler_ = std::move(handler);
}

bool HandlerRegistry::has_handler(const std::string& type) const {
    return handlers_.count(type) > 0;
}

std::vector<std::string> HandlerRegistry::registered_types() const {
    std::vector<std::string> types;
    types.reserve(handlers_.size());
    for (const auto& [type, _] : handlers_) {
        types.push_back(type);
    }
    std::sort(types.begin(), types.end());
    return types;
}

std::string HandlerRegistry::type_for_shape(const std::string& shape) {
    static const std::unordered_map<std::string, std::string> kShapeToType = {
        {"Mdiamond", "start"},
        {"Msquare", "exit"},
        {"box", "codergen"},
        {"hexagon", "wait.human"},
        {"diamond", "conditional"},
        {"component", "parallel"},
        {"tripleoctagon", "parallel.fan_in"},
        {"parallelogram", "tool"},
        {"house", "stack.manager_loop"},
    };
    auto it = kShapeToType.find(shape);
    return it != kShapeToType.end() ? it->second : "";
}

Handler& HandlerRegistry::resolve(const Node& node) const {
    if (!node.type.empty()) {
        auto it = handlers_.find(node.type);
        if (it != handlers_.end()) {
            return *it->second;
        }
    }

    std::string shape_type = type_for_shape(node.shape);
    if (!shape_type.empty()) {
        auto it = handlers_.find(shape_type);
        if (it != handlers_.end()) {
            return *it->second;
        }
    }

    if (default_handler_) {
        return *default_handler_;
    }

    throw ConfigError("No handler for node '" + node.id + "' (type='" + node.type +
                      "', shape='" + node.shape + "')");
}

std::unique_ptr<HandlerRegistry> create_default_registry(std::shared_ptr<GenerationBackend> backend,
                                                         Interviewer* interviewer,
                                                         const ToolRegistry& tools,
                                                         const CancellationToken* cancel) {
    auto registry = std::make_unique<HandlerRegistry>();
    if (!backend) {
        backend = std::make_shared<StubBackend>();
    }

    registry->register_handler("start", std::make_shared<StartHandler>());
    registry->register_handler("exit", std::make_shared<ExitHandler>());
    registry->register_handler("conditional", std::make_shared<ConditionalHandler>());
    registry->register_handler("codergen", std::make_shared<GenerationHandler>(std::move(backend)));
    if (interviewer) {
        registry->register_handler("wait.human", std::make_shared<WaitHumanHandler>(*interviewer));
    }
    registry->register_handler("parallel", std::make_shared<ParallelHandler>(*registry, cancel));
    registry->register_handler("parallel.fan_in", std::make_shared<FanInHandler>());
    registry->register_handler("tool", std::make_shared<ToolHandler>(tools));
    registry->register_handler("stack.manager_loop", std::make_shared<StackManagerHandler>(*registry, cancel));
    return registry;
}

} // namespace agentflow
