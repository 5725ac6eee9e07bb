// src/core/outcome.cpp
#include "core/types/outcome.h"
#include <stdexcept>

namespace agentflow {

std::string to_string(StageStatus status) {
    switch (status) {
        case StageStatus::SUCCESS: return "success";
        case StageStatus::PARTIAL_SUCCESS: return "partial_success";
        case StageStatus::FAIL: return "fail";
        case StageStatus::RETRY: return "retry";
        case StageStatus::SKIPPED: return "skipped";
    }
    return "unknown";
}

StageStatus parse_stage_status(const std::string& text) {
    if (text == "success") return StageStatus::SUCCESS;
    if (text == "partial_success") return StageStatus::PARTIAL_SUCCESS;
    if (text == "fail") return StageStatus::FAIL;
    if (text == "retry") return StageStatus::RETRY;
    if (text == "skipped") return StageStatus::SKIPPED;
    throw std::invalid_argument("Unknown stage status '" + text + "'");
}

Outcome Outcome::success(Value updates, std::string notes) {
    Outcome outcome;
    outcome.status = StageStatus::SUCCESS;
    outcome.context_updates = updates.is_object() ? std::move(updates) : Value::object();
    outcome.notes = std::move(notes);
    return outcome;
}

Outcome Outcome::fail(std::string reason) {
    Outcome outcome;
    outcome.status = StageStatus::FAIL;
    outcome.failure_reason = std::move(reason);
    return outcome;
}

Outcome Outcome::retry(std::string notes) {
    Outcome outcome;
    outcome.status = StageStatus::RETRY;
    outcome.notes = std::move(notes);
    return outcome;
}

Value Outcome::to_json() const {
    return Value{
        {"outcome", to_string(status)},
        {"preferred_next_label", preferred_label},
        {"suggested_next_ids", suggested_next_ids},
        {"context_updates", context_updates},
        {"notes", notes},
        {"failure_reason", failure_reason}
    };
}

} // namespace agentflow
