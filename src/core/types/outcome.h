#ifndef AGENTFLOW_CORE_TYPES_OUTCOME_H
#define AGENTFLOW_CORE_TYPES_OUTCOME_H

#include "value.h"
#include <cstdint>
#include <string>
#include <vector>

namespace agentflow {

enum class StageStatus : uint8_t {
    SUCCESS,
    PARTIAL_SUCCESS,
    FAIL,
    RETRY,
    SKIPPED
};

// "success", "partial_success", "fail", "retry", "skipped"
std::string to_string(StageStatus status);
// Throws std::invalid_argument for unknown strings
StageStatus parse_stage_status(const std::string& text);

// 节点执行结果：每次 handler 调用新建，之后不再修改
struct Outcome {
    StageStatus status = StageStatus::SUCCESS;
    std::string preferred_label;
    std::vector<NodeId> suggested_next_ids;
    Value context_updates = Value::object();
    std::string notes;
    std::string failure_reason;

    bool succeeded() const {
        return status == StageStatus::SUCCESS || status == StageStatus::PARTIAL_SUCCESS;
    }
    bool failed() const { return status == StageStatus::FAIL; }

    static Outcome success(Value updates = Value::object(), std::string notes = "");
    static Outcome fail(std::string reason);
    static Outcome retry(std::string notes);

    // Serialized form used for status.json and trace export
    Value to_json() const;
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_OUTCOME_H
