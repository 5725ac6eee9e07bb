// modules/condition/condition_evaluator.cpp
#include "condition/condition_evaluator.h"
#include "core/types/errors.h"
#include "common/utils/string_utils.h"

namespace agentflow {

namespace {

constexpr std::string_view kContextPrefix = "context.";

ConditionClause parse_clause(const std::string& raw) {
    std::string clause = trim(raw);
    ConditionClause parsed;

    // '!=' must be tried first, otherwise "a!=b" would split at '=' into key "a!"
    size_t pos = clause.find("!=");
    size_t op_len = 2;
    parsed.op = ConditionOperator::NOT_EQUALS;
    if (pos == std::string::npos) {
        pos = clause.find('=');
        op_len = 1;
        parsed.op = ConditionOperator::EQUALS;
    }
    if (pos == std::string::npos) {
        throw ConditionSyntaxError("Invalid clause (no operator found): '" + clause + "'");
    }

    parsed.key = trim(clause.substr(0, pos));
    parsed.literal = trim(clause.substr(pos + op_len));
    if (parsed.key.empty()) {
        throw ConditionSyntaxError("Invalid clause (empty key): '" + clause + "'");
    }
    return parsed;
}

} // namespace

std::vector<ConditionClause> parse_condition(const std::string& expr) {
    std::vector<ConditionClause> clauses;
    if (trim(expr).empty()) {
        return clauses;
    }

    size_t start = 0;
    while (true) {
        size_t sep = expr.find("&&", start);
        std::string part = expr.substr(start, sep == std::string::npos ? std::string::npos : sep - start);
        clauses.push_back(parse_clause(part));
        if (sep == std::string::npos) break;
        start = sep + 2;
    }
    return clauses;
}

std::string resolve_condition_key(const std::string& key, const Outcome& outcome, const RunContext& context) {
    if (key == "outcome") {
        return to_string(outcome.status);
    }
    if (key == "preferred_label") {
        return outcome.preferred_label;
    }
    if (key.starts_with(kContextPrefix)) {
        Value value = context.get(key);
        if (!value.is_null()) {
            return value_to_string(value);
        }
        value = context.get(key.substr(kContextPrefix.size()));
        return value_to_string(value);
    }
    return value_to_string(context.get(key));
}

bool evaluate_condition(const std::string& expr, const Outcome& outcome, const RunContext& context) {
    for (const auto& clause : parse_condition(expr)) {
        std::string resolved = resolve_condition_key(clause.key, outcome, context);
        bool equal = (resolved == clause.literal);
        if (clause.op == ConditionOperator::EQUALS ? !equal : equal) {
            return false;
        }
    }
    return true;
}

} // namespace agentflow
