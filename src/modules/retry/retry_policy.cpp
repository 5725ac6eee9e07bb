// modules/retry/retry_policy.cpp
#include "retry/retry_policy.h"
#include "common/utils/string_utils.h"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <random>

namespace agentflow {

namespace {

double jitter_factor() {
    static std::mutex rng_mutex;
    static std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.5, 1.5);
    std::lock_guard<std::mutex> lock(rng_mutex);
    return dist(rng);
}

int parse_retry_count(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) return 0;
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) return 0;
        return std::max(parsed, 0);
    } catch (const std::exception&) {
        return 0;
    }
}

} // namespace

double RetryPolicy::delay_for_attempt(int attempt) const {
    int exponent = std::max(attempt, 1) - 1;
    double delay_ms = backoff.initial_delay_ms * std::pow(backoff.backoff_factor, exponent);
    delay_ms = std::min(delay_ms, backoff.max_delay_ms);
    if (backoff.jitter) {
        delay_ms *= jitter_factor();
    }
    return delay_ms / 1000.0;
}

const std::unordered_map<std::string, RetryPolicy>& preset_retry_policies() {
    static const std::unordered_map<std::string, RetryPolicy> presets = {
        {"none", RetryPolicy{1, BackoffConfig{}}},
        {"standard", RetryPolicy{5, BackoffConfig{200.0, 2.0, 60000.0, true}}},
        {"aggressive", RetryPolicy{5, BackoffConfig{500.0, 2.0, 60000.0, true}}},
        {"linear", RetryPolicy{3, BackoffConfig{500.0, 1.0, 60000.0, true}}},
        {"patient", RetryPolicy{3, BackoffConfig{2000.0, 3.0, 60000.0, true}}},
    };
    return presets;
}

const RetryPolicy& preset_retry_policy(const std::string& name) {
    return preset_retry_policies().at(name);
}

RetryPolicy build_retry_policy(const Node& node, const Graph& graph, const BackoffConfig& backoff) {
    int max_retries = node.max_retries;
    if (max_retries <= 0) {
        max_retries = parse_retry_count(graph.attribute("default_max_retry", "0"));
    }
    return RetryPolicy{max_retries + 1, backoff};
}

} // namespace agentflow
