// modules/condition/condition_evaluator.h
#ifndef AGENTFLOW_MODULES_CONDITION_CONDITION_EVALUATOR_H
#define AGENTFLOW_MODULES_CONDITION_CONDITION_EVALUATOR_H

#include "core/types/outcome.h"
#include "context/run_context.h"
#include <cstdint>
#include <string>
#include <vector>

namespace agentflow {

// Grammar:
//   Expr     = Clause ( '&&' Clause )*
//   Clause   = Key Operator Literal
//   Key      = 'outcome' | 'preferred_label' | 'context.' Path | bare_key
//   Operator = '=' | '!='
enum class ConditionOperator : uint8_t {
    EQUALS,
    NOT_EQUALS
};

struct ConditionClause {
    std::string key;
    ConditionOperator op = ConditionOperator::EQUALS;
    std::string literal;
};

// Throws ConditionSyntaxError for a clause without an operator or without a key.
// An empty / whitespace-only expression yields no clauses.
std::vector<ConditionClause> parse_condition(const std::string& expr);

std::string resolve_condition_key(const std::string& key, const Outcome& outcome, const RunContext& context);

// Empty expressions are unconditionally true; clauses are AND-combined and short-circuit.
bool evaluate_condition(const std::string& expr, const Outcome& outcome, const RunContext& context);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_CONDITION_CONDITION_EVALUATOR_H
