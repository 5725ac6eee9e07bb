// common/tools/registry.cpp
#include "common/tools/registry.h"
#include <algorithm>
#include <array>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <sys/wait.h>

namespace agentflow {

bool ToolRegistry::has_tool(const std::string& name) const {
    return tools_.count(name) > 0;
}

const ToolRegistry::Tool* ToolRegistry::find_tool(const std::string& name) const {
    auto it = tools_.find(name);
    return it != tools_.end() ? &it->second : nullptr;
}

std::vector<std::string> ToolRegistry::list_tools() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

ToolRegistry::Tool make_shell_tool(std::string command) {
    return [command = std::move(command)](const Value& /*snapshot*/) -> Value {
        FILE* pipe = popen(command.c_str(), "r");
        if (!pipe) {
            throw std::runtime_error("Failed to start command: " + command);
        }

        std::string output;
        std::array<char, 4096> buffer{};
        size_t n;
        while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
            output.append(buffer.data(), n);
        }

        int status = pclose(pipe);
        int exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
        if (exit_code != 0) {
            throw std::runtime_error("Command exited with code " + std::to_string(exit_code) + ": " + command);
        }
        return Value{{"stdout", output}, {"exit_code", exit_code}};
    };
}

} // namespace agentflow
