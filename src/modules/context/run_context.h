// modules/context/run_context.h
#ifndef AGENTFLOW_MODULES_CONTEXT_RUN_CONTEXT_H
#define AGENTFLOW_MODULES_CONTEXT_RUN_CONTEXT_H

#include "core/types/value.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agentflow {

// 运行上下文：整个运行期间共享的键值存储 + 追加式日志。
// Each call is atomic on its own; there is no multi-key transaction.
class RunContext {
public:
    RunContext();
    explicit RunContext(Value initial);

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    void set(const std::string& key, Value value);
    // Returns `fallback` when the key is absent
    Value get(const std::string& key, const Value& fallback = nullptr) const;
    std::string get_string(const std::string& key, const std::string& fallback = "") const;
    bool contains(const std::string& key) const;
    void erase(const std::string& key);

    // Copy of the whole key/value object
    Value snapshot() const;
    // Key-wise merge; non-object input is ignored
    void apply_updates(const Value& updates);
    // Deep copy with its own lock, for branch isolation
    std::unique_ptr<RunContext> clone() const;

    void append_log(std::string entry);
    std::vector<std::string> logs() const;
    void restore_logs(std::vector<std::string> entries);

private:
    mutable std::mutex mutex_;
    Value data_;
    std::vector<std::string> log_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_CONTEXT_RUN_CONTEXT_H
