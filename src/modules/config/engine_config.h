// modules/config/engine_config.h
#ifndef AGENTFLOW_MODULES_CONFIG_ENGINE_CONFIG_H
#define AGENTFLOW_MODULES_CONFIG_ENGINE_CONFIG_H

#include "core/types/value.h"
#include "retry/retry_policy.h"
#include <filesystem>
#include <string>

namespace agentflow {

// llama.cpp 生成后端参数
struct LlmConfig {
    std::string model_path;
    int n_ctx = 2048;
    int n_threads = 4;
    float temperature = 0.7f;
    float min_p = 0.05f;
    int n_predict = 512;
};

struct EngineConfig {
    std::filesystem::path logs_root; // empty = "agentflow-runs/<UTC timestamp>"

    bool checkpoint_enabled = true;
    std::string checkpoint_file = "checkpoint.json";

    int max_steps = 1000;      // -1 = unlimited
    int max_duration_sec = -1; // -1 = unlimited

    int poll_interval_ms = 50;
    int max_polls = 600;

    BackoffConfig backoff;

    bool preflight = true;
    bool trace_echo = false;

    LlmConfig llm;

    // Unknown keys are ignored; a key of the wrong type throws ConfigError
    static EngineConfig from_json(const Value& doc);
    static EngineConfig from_yaml_string(const std::string& yaml);
    static EngineConfig from_yaml_file(const std::filesystem::path& path);
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_CONFIG_ENGINE_CONFIG_H
