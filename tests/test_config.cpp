// tests/test_config.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "config/engine_config.h"
#include "core/types/errors.h"
#include "test_helpers.h"
#include <fstream>

using namespace agentflow;
using Catch::Approx;

TEST_CASE("Defaults when the document is empty", "[config]") {
    EngineConfig config = EngineConfig::from_yaml_string("");
    CHECK(config.logs_root.empty());
    CHECK(config.checkpoint_enabled);
    CHECK(config.checkpoint_file == "checkpoint.json");
    CHECK(config.max_steps == 1000);
    CHECK(config.max_duration_sec == -1);
    CHECK(config.poll_interval_ms == 50);
    CHECK(config.max_polls == 600);
    CHECK(config.backoff.jitter);
    CHECK(config.preflight);
    CHECK_FALSE(config.trace_echo);
    CHECK(config.llm.n_ctx == 2048);
}

TEST_CASE("Nested keys override defaults", "[config]") {
    const char* yaml = R"(
logs_root: /tmp/agentflow-test
checkpoint:
  enabled: false
  file: state.json
budget:
  max_steps: 25
  max_duration_sec: 30
fan_in:
  poll_interval_ms: 5
  max_polls: 3
retry:
  jitter: false
  initial_delay_ms: 10
  backoff_factor: 1.5
  max_delay_ms: 100
preflight: false
trace:
  echo: true
llm:
  model_path: models/qwen.gguf
  temperature: 0.2
  n_predict: 64
unknown_section:
  ignored: 1
)";
    EngineConfig config = EngineConfig::from_yaml_string(yaml);
    CHECK(config.logs_root == "/tmp/agentflow-test");
    CHECK_FALSE(config.checkpoint_enabled);
    CHECK(config.checkpoint_file == "state.json");
    CHECK(config.max_steps == 25);
    CHECK(config.max_duration_sec == 30);
    CHECK(config.poll_interval_ms == 5);
    CHECK(config.max_polls == 3);
    CHECK_FALSE(config.backoff.jitter);
    CHECK(config.backoff.initial_delay_ms == Approx(10.0));
    CHECK(config.backoff.backoff_factor == Approx(1.5));
    CHECK(config.backoff.max_delay_ms == Approx(100.0));
    CHECK_FALSE(config.preflight);
    CHECK(config.trace_echo);
    CHECK(config.llm.model_path == "models/qwen.gguf");
    CHECK(config.llm.temperature == Approx(0.2f));
    CHECK(config.llm.n_predict == 64);
}

TEST_CASE("Wrongly typed keys raise ConfigError", "[config]") {
    CHECK_THROWS_AS(EngineConfig::from_yaml_string("budget:\n  max_steps: lots\n"), ConfigError);
    CHECK_THROWS_AS(EngineConfig::from_yaml_string("preflight: 3\n"), ConfigError);
    CHECK_THROWS_AS(EngineConfig::from_yaml_string("checkpoint:\n  file: 12\n"), ConfigError);
    CHECK_THROWS_AS(EngineConfig::from_yaml_string("fan_in:\n  max_polls: 0\n"), ConfigError);
    CHECK_THROWS_AS(EngineConfig::from_yaml_string("- just\n- a list\n"), ConfigError);
    CHECK_THROWS_AS(EngineConfig::from_yaml_string("key: [unclosed\n"), ConfigError);
}

TEST_CASE("Quoted scalars stay strings", "[config]") {
    EngineConfig config = EngineConfig::from_yaml_string("checkpoint:\n  file: \"123\"\n");
    CHECK(config.checkpoint_file == "123");
}

TEST_CASE("Config files are read from disk", "[config]") {
    test::TempDir dir("config");
    auto path = dir.path() / "engine.yaml";
    std::ofstream(path) << "budget:\n  max_steps: 7\n";
    CHECK(EngineConfig::from_yaml_file(path).max_steps == 7);
    CHECK_THROWS_AS(EngineConfig::from_yaml_file(dir.path() / "missing.yaml"), ConfigError);
}
