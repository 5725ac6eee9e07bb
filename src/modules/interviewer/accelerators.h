// modules/interviewer/accelerators.h
#ifndef AGENTFLOW_MODULES_INTERVIEWER_ACCELERATORS_H
#define AGENTFLOW_MODULES_INTERVIEWER_ACCELERATORS_H

#include <string>
#include <utility>

namespace agentflow {

// "[K] label" / "K) label" / "K - label" -> {"K", "label"}; no marker -> {"", label}
std::pair<std::string, std::string> parse_accelerator(const std::string& label);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_INTERVIEWER_ACCELERATORS_H
