#ifndef AGENTFLOW_CORE_TYPES_QUESTION_H
#define AGENTFLOW_CORE_TYPES_QUESTION_H

#include "value.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

enum class QuestionType : uint8_t {
    YES_NO,
    MULTIPLE_CHOICE,
    FREEFORM,
    CONFIRMATION
};

std::string to_string(QuestionType type);

// Canonical answer values; free-text answers use any other string
inline constexpr const char* kAnswerYes = "YES";
inline constexpr const char* kAnswerNo = "NO";
inline constexpr const char* kAnswerSkipped = "SKIPPED";
inline constexpr const char* kAnswerTimeout = "TIMEOUT";

struct Option {
    std::string key;
    std::string label;

    bool operator==(const Option&) const = default;
};

struct Question {
    std::string text;
    QuestionType type = QuestionType::FREEFORM;
    std::vector<Option> options;
    std::optional<std::string> default_answer;
    std::optional<double> timeout_seconds;
    std::string stage; // run-scoped stage identifier (the node id)
    Value metadata = Value::object();
};

struct Answer {
    std::string value;
    std::optional<Option> selected_option;
    std::string text;

    bool is_yes() const { return value == kAnswerYes; }
    bool is_no() const { return value == kAnswerNo; }
    bool was_skipped() const { return value == kAnswerSkipped; }
    bool timed_out() const { return value == kAnswerTimeout; }

    static Answer timeout() { return Answer{kAnswerTimeout, std::nullopt, ""}; }
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_QUESTION_H
