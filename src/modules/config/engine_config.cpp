// modules/config/engine_config.cpp
#include "config/engine_config.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include <yaml-cpp/yaml.h>
#include <string_view>

namespace agentflow {

namespace {

// Looks up a dotted path ("budget.max_steps"); nullptr when any segment is absent
const Value* find_path(const Value& doc, std::string_view path) {
    const Value* current = &doc;
    while (!path.empty()) {
        size_t dot = path.find('.');
        std::string segment(path.substr(0, dot));
        if (!current->is_object() || !current->contains(segment)) {
            return nullptr;
        }
        current = &(*current)[segment];
        path = (dot == std::string_view::npos) ? std::string_view{} : path.substr(dot + 1);
    }
    return current;
}

void read_bool(const Value& doc, const char* key, bool& out) {
    const Value* v = find_path(doc, key);
    if (!v || v->is_null()) return;
    if (!v->is_boolean()) {
        throw ConfigError(std::string("Config key '") + key + "' must be a boolean");
    }
    out = v->get<bool>();
}

void read_int(const Value& doc, const char* key, int& out) {
    const Value* v = find_path(doc, key);
    if (!v || v->is_null()) return;
    if (!v->is_number_integer()) {
        throw ConfigError(std::string("Config key '") + key + "' must be an integer");
    }
    out = v->get<int>();
}

template <typename T>
void read_number(const Value& doc, const char* key, T& out) {
    const Value* v = find_path(doc, key);
    if (!v || v->is_null()) return;
    if (!v->is_number()) {
        throw ConfigError(std::string("Config key '") + key + "' must be a number");
    }
    out = v->get<T>();
}

void read_string(const Value& doc, const char* key, std::string& out) {
    const Value* v = find_path(doc, key);
    if (!v || v->is_null()) return;
    if (!v->is_string()) {
        throw ConfigError(std::string("Config key '") + key + "' must be a string");
    }
    out = v->get<std::string>();
}

} // namespace

EngineConfig EngineConfig::from_json(const Value& doc) {
    EngineConfig config;
    if (doc.is_null()) {
        return config;
    }
    if (!doc.is_object()) {
        throw ConfigError("Engine config must be a mapping");
    }

    std::string logs_root;
    read_string(doc, "logs_root", logs_root);
    if (!logs_root.empty()) {
        config.logs_root = logs_root;
    }

    read_bool(doc, "checkpoint.enabled", config.checkpoint_enabled);
    read_string(doc, "checkpoint.file", config.checkpoint_file);

    read_int(doc, "budget.max_steps", config.max_steps);
    read_int(doc, "budget.max_duration_sec", config.max_duration_sec);

    read_int(doc, "fan_in.poll_interval_ms", config.poll_interval_ms);
    read_int(doc, "fan_in.max_polls", config.max_polls);
    if (config.poll_interval_ms < 0 || config.max_polls < 1) {
        throw ConfigError("fan_in.poll_interval_ms must be >= 0 and fan_in.max_polls >= 1");
    }

    read_bool(doc, "retry.jitter", config.backoff.jitter);
    read_number(doc, "retry.initial_delay_ms", config.backoff.initial_delay_ms);
    read_number(doc, "retry.backoff_factor", config.backoff.backoff_factor);
    read_number(doc, "retry.max_delay_ms", config.backoff.max_delay_ms);

    read_bool(doc, "preflight", config.preflight);
    read_bool(doc, "trace.echo", config.trace_echo);

    read_string(doc, "llm.model_path", config.llm.model_path);
    read_int(doc, "llm.n_ctx", config.llm.n_ctx);
    read_int(doc, "llm.n_threads", config.llm.n_threads);
    read_number(doc, "llm.temperature", config.llm.temperature);
    read_number(doc, "llm.min_p", config.llm.min_p);
    read_int(doc, "llm.n_predict", config.llm.n_predict);

    return config;
}

EngineConfig EngineConfig::from_yaml_string(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid engine config YAML: ") + e.what());
    }
    return from_json(yaml_to_json(root));
}

EngineConfig EngineConfig::from_yaml_file(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        throw ConfigError("Cannot open engine config: " + path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid engine config YAML in " + path.string() + ": " + e.what());
    }
    return from_json(yaml_to_json(root));
}

} // namespace agentflow
