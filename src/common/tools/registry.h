#ifndef AGENTFLOW_COMMON_TOOLS_REGISTRY_H
#define AGENTFLOW_COMMON_TOOLS_REGISTRY_H

#include "core/types/value.h"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentflow {

// 工具表：名字 -> function(context snapshot)
// A tool returns an object (merged as context updates), null (no updates) or any other value.
class ToolRegistry {
public:
    using Tool = std::function<Value(const Value& snapshot)>;

    template <typename Func>
    void register_tool(std::string name, Func&& func) {
        tools_[std::move(name)] = Tool(std::forward<Func>(func));
    }

    bool has_tool(const std::string& name) const;
    // nullptr when no tool has that name
    const Tool* find_tool(const std::string& name) const;
    std::vector<std::string> list_tools() const;

private:
    std::unordered_map<std::string, Tool> tools_;
};

// Runs `command` through the shell; returns {"stdout": ..., "exit_code": 0}.
// Throws std::runtime_error when the command cannot start or exits non-zero.
ToolRegistry::Tool make_shell_tool(std::string command);

} // namespace agentflow

#endif // AGENTFLOW_COMMON_TOOLS_REGISTRY_H
