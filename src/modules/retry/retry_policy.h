// modules/retry/retry_policy.h
#ifndef AGENTFLOW_MODULES_RETRY_RETRY_POLICY_H
#define AGENTFLOW_MODULES_RETRY_RETRY_POLICY_H

#include "core/types/graph.h"
#include <string>
#include <unordered_map>

namespace agentflow {

struct BackoffConfig {
    double initial_delay_ms = 200.0;
    double backoff_factor = 2.0;
    double max_delay_ms = 60000.0;
    bool jitter = true;
};

struct RetryPolicy {
    int max_attempts = 1; // 1 = no retries
    BackoffConfig backoff;

    // Seconds to wait after failed attempt `attempt` (1-indexed):
    // min(initial * factor^(attempt-1), max), then scaled by U[0.5, 1.5] when jitter is on
    double delay_for_attempt(int attempt) const;
};

// "none", "standard", "aggressive", "linear", "patient"
const std::unordered_map<std::string, RetryPolicy>& preset_retry_policies();
// Throws std::out_of_range for an unknown preset name
const RetryPolicy& preset_retry_policy(const std::string& name);

// max_attempts = node.max_retries + 1, or graph "default_max_retry" + 1 when the node sets none
RetryPolicy build_retry_policy(const Node& node, const Graph& graph, const BackoffConfig& backoff = {});

} // namespace agentflow

#endif // AGENTFLOW_MODULES_RETRY_RETRY_POLICY_H
