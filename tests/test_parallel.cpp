// tests/test_parallel.cpp
#include <catch2/catch_test_macros.hpp>
#include "handlers/handlers.h"
#include "handlers/handler_registry.h"
#include "core/types/errors.h"
#include "test_helpers.h"
#include <chrono>

using namespace agentflow;
using namespace agentflow::test;
using namespace std::chrono_literals;

namespace {

Graph fan_out_graph(const std::string& children_csv, const std::vector<std::pair<NodeId, std::string>>& children) {
    Graph graph("fan_out");
    Node fan = make_node("fan", "component");
    fan.prompt = children_csv;
    graph.add_node(fan);
    for (const auto& [id, type] : children) {
        graph.add_node(make_node(id, "box", type));
    }
    return graph;
}

} // namespace

TEST_CASE("Mixed child outcomes give partial success", "[parallel]") {
    HandlerRegistry registry;
    registry.register_handler("ok", std::make_shared<ScriptedHandler>(
        std::vector<Outcome>{outcome_with(StageStatus::SUCCESS, Value{{"ok.seen", true}})}));
    registry.register_handler("bad", std::make_shared<ScriptedHandler>(
        std::vector<Outcome>{outcome_with(StageStatus::FAIL)}));

    Graph graph = fan_out_graph("a, b, c", {{"a", "ok"}, {"b", "ok"}, {"c", "bad"}});
    ParallelHandler handler(registry);
    RunContext ctx;
    Outcome outcome = handler.execute(graph.node("fan"), ctx, graph, {});

    CHECK(outcome.status == StageStatus::PARTIAL_SUCCESS);
    CHECK(outcome.notes == "2/3 children succeeded");
    CHECK(outcome.context_updates["fan.complete"] == true);
    CHECK(outcome.context_updates["ok.seen"] == true);
}

TEST_CASE("All children failing fails the fan-out", "[parallel]") {
    HandlerRegistry registry;
    registry.register_handler("bad", std::make_shared<ScriptedHandler>(
        std::vector<Outcome>{outcome_with(StageStatus::FAIL)}));
    registry.register_handler("throws", std::make_shared<FlakyHandler>(10));

    Graph graph = fan_out_graph("a,b", {{"a", "bad"}, {"b", "throws"}});
    ParallelHandler handler(registry);
    RunContext ctx;
    Outcome outcome = handler.execute(graph.node("fan"), ctx, graph, {});

    CHECK(outcome.status == StageStatus::FAIL);
    CHECK(outcome.failure_reason == "All 2 children failed");
    // the marker is set even when nothing succeeded
    CHECK(outcome.context_updates["fan.complete"] == true);
}

TEST_CASE("Children share the parent context", "[parallel]") {
    HandlerRegistry registry;
    registry.register_handler("writer", std::make_shared<LambdaHandler>([](const Node& node, RunContext& ctx) {
        ctx.set(node.id + ".direct", ctx.get_string("seed"));
        return Outcome::success();
    }));

    Graph graph = fan_out_graph("x,y", {{"x", "writer"}, {"y", "writer"}});
    ParallelHandler handler(registry);
    RunContext ctx;
    ctx.set("seed", "shared");
    CHECK(handler.execute(graph.node("fan"), ctx, graph, {}).status == StageStatus::SUCCESS);
    CHECK(ctx.get_string("x.direct") == "shared");
    CHECK(ctx.get_string("y.direct") == "shared");
}

TEST_CASE("The last child to finish wins a key collision", "[parallel]") {
    HandlerRegistry registry;
    registry.register_handler("slow", std::make_shared<ScriptedHandler>(
        std::vector<Outcome>{outcome_with(StageStatus::SUCCESS, Value{{"winner", "slow"}})}, 150ms));
    registry.register_handler("fast", std::make_shared<ScriptedHandler>(
        std::vector<Outcome>{outcome_with(StageStatus::SUCCESS, Value{{"winner", "fast"}})}));

    // declaration order puts the slow child first
    Graph graph = fan_out_graph("slow_child, fast_child", {{"slow_child", "slow"}, {"fast_child", "fast"}});
    ParallelHandler handler(registry);
    RunContext ctx;
    Outcome outcome = handler.execute(graph.node("fan"), ctx, graph, {});
    CHECK(outcome.context_updates["winner"] == "slow");
}

TEST_CASE("Children run concurrently", "[parallel]") {
    HandlerRegistry registry;
    registry.register_handler("sleepy", std::make_shared<ScriptedHandler>(
        std::vector<Outcome>{Outcome::success()}, 200ms));

    Graph graph = fan_out_graph("a,b,c,d", {{"a", "sleepy"}, {"b", "sleepy"}, {"c", "sleepy"}, {"d", "sleepy"}});
    ParallelHandler handler(registry);
    RunContext ctx;

    auto begin = std::chrono::steady_clock::now();
    handler.execute(graph.node("fan"), ctx, graph, {});
    auto elapsed = std::chrono::steady_clock::now() - begin;
    CHECK(elapsed < 700ms);
}

TEST_CASE("Child lists without usable nodes", "[parallel]") {
    HandlerRegistry registry;
    ParallelHandler handler(registry);
    RunContext ctx;

    // no prompt and no label: nothing to run
    Graph unlabeled("fan_out");
    Node fan("fan", "", "component");
    unlabeled.add_node(fan);
    Outcome none = handler.execute(unlabeled.node("fan"), ctx, unlabeled, {});
    CHECK(none.status == StageStatus::SUCCESS);
    CHECK(none.context_updates["fan.complete"] == true);

    Graph ghosts = fan_out_graph("ghost1,ghost2", {});
    CHECK(handler.execute(ghosts.node("fan"), ctx, ghosts, {}).status == StageStatus::FAIL);
}

TEST_CASE("Unknown child types are configuration errors", "[parallel]") {
    HandlerRegistry registry;
    Graph graph = fan_out_graph("a", {{"a", "mystery"}});
    ParallelHandler handler(registry);
    RunContext ctx;
    CHECK_THROWS_AS(handler.execute(graph.node("fan"), ctx, graph, {}), ConfigError);
}
