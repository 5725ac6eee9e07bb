// modules/transforms/variable_expansion.h
#ifndef AGENTFLOW_MODULES_TRANSFORMS_VARIABLE_EXPANSION_H
#define AGENTFLOW_MODULES_TRANSFORMS_VARIABLE_EXPANSION_H

#include "core/types/graph.h"
#include <string>

namespace agentflow {

// Replaces every "$goal" in `text` with `goal`
std::string expand_goal(const std::string& text, const std::string& goal);

// 返回一个新图：所有节点 prompt 中的 $goal 替换为图属性 "goal"
Graph expand_goal_variables(const Graph& graph);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_TRANSFORMS_VARIABLE_EXPANSION_H
