// main.cpp
#include <iostream>
#include <nlohmann/json.hpp>
#include "agentflow/core/engine.h"
#include "common/llm/llama_adapter.h"

using namespace agentflow;

// 示例流程：plan -> 并行检查 -> 汇合 -> 人工确认 -> 结束
static Graph build_release_graph() {
    Graph graph("release_check", {{"goal", "ship version 1.2 of the parser"}, {"default_max_retry", "1"}});

    graph.add_node(Node("start", "Start", "Mdiamond"));

    Node plan("plan", "Plan", "box");
    plan.prompt = "Write a short release plan to $goal. Previous notes: {{ notes }}";
    graph.add_node(plan);

    Node checks("checks", "Checks", "component");
    checks.prompt = "lint, unit_tests";
    graph.add_node(checks);

    graph.add_node(Node("lint", "lint", "parallelogram"));
    graph.add_node(Node("unit_tests", "unit_tests", "parallelogram"));

    graph.add_node(Node("join", "Join", "tripleoctagon"));

    Node approve("approve", "Ship it?", "hexagon");
    approve.goal_gate = true;
    approve.retry_target = "plan";
    graph.add_node(approve);

    graph.add_node(Node("exit", "Exit", "Msquare"));

    graph.add_edge(Edge("start", "plan"));
    graph.add_edge(Edge("plan", "checks"));
    graph.add_edge(Edge("checks", "join"));
    graph.add_edge(Edge("join", "approve"));
    graph.add_edge(Edge("approve", "exit", "[Y] Yes"));
    graph.add_edge(Edge("approve", "plan", "[N] No"));
    return graph;
}

int main(int argc, char* argv[]) {
    if (argc > 3) {
        std::cerr << "Usage: " << argv[0] << " [engine.yaml] [checkpoint.json]\n";
        return 1;
    }

    try {
        // 1. 创建引擎
        auto engine = argc >= 2
            ? PipelineEngine::from_config_file(build_release_graph(), argv[1])
            : PipelineEngine::create(build_release_graph());

        // 2. 可选：llama.cpp 后端
        if (!engine->config().llm.model_path.empty()) {
            engine->set_generation_backend(std::make_shared<LlamaBackend>(engine->config().llm));
        }

        // 3. 注册工具与交互
        engine->register_tool("lint", make_shell_tool("echo lint ok"));
        engine->register_tool("unit_tests", [](const Value& snapshot) {
            return Value{{"unit_tests.passed", 42}, {"unit_tests.plan_seen", snapshot.contains("plan.response")}};
        });
        AutoApproveInterviewer interviewer;
        engine->set_interviewer(&interviewer);

        // 4. 执行或续跑
        RunResult result = argc == 3
            ? engine->resume_from_file(argv[2])
            : engine->run(Value{{"notes", "none"}});

        // 5. 输出结果
        if (result.completed()) {
            std::cout << "[SUCCESS] " << result.completed_nodes.size() << " stages\n";
            std::cout << "Final context:\n" << engine->context().snapshot().dump(2) << "\n";
        } else {
            std::cerr << "[ERROR] " << to_string(result.state) << ": " << result.error << "\n";
        }

        // 6. 导出 Trace
        auto trace_path = engine->logs_root() / "trace.json";
        engine->trace_exporter().export_json(trace_path);
        std::cout << "Trace exported to " << trace_path.string()
                  << " (" << engine->get_last_traces().size() << " records)\n";

        return result.completed() ? 0 : 2;
    } catch (const ValidationError& e) {
        std::cerr << "[INVALID] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
