// tests/test_handlers.cpp
#include <catch2/catch_test_macros.hpp>
#include "handlers/handlers.h"
#include "handlers/handler_registry.h"
#include "core/types/errors.h"
#include "test_helpers.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace agentflow;
using namespace agentflow::test;

namespace {

// Remembers the last prompt and answers with a fixed text, or throws
class EchoBackend : public GenerationBackend {
public:
    explicit EchoBackend(bool fail = false) : fail_(fail) {}

    std::string generate(const std::string& prompt, const Value&, const std::string& model,
                         const std::string&, const std::string&) override {
        last_prompt = prompt;
        last_model = model;
        if (fail_) {
            throw std::runtime_error("model unavailable");
        }
        return "generated";
    }

    std::string last_prompt;
    std::string last_model;

private:
    bool fail_;
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// start -> node; node has labeled edges to each target
Graph branching_graph(Node node, const std::vector<std::pair<std::string, std::string>>& labeled_targets) {
    Graph graph("branching");
    graph.add_node(Node("start", "Start", "Mdiamond"));
    NodeId id = node.id;
    graph.add_node(std::move(node));
    graph.add_edge(Edge("start", id));
    for (const auto& [label, target] : labeled_targets) {
        if (!graph.has_node(target)) {
            graph.add_node(make_node(target));
        }
        graph.add_edge(Edge(id, target, label));
    }
    return graph;
}

} // namespace

TEST_CASE("Start records a timestamp", "[handlers]") {
    Graph graph = linear_graph({});
    RunContext ctx;
    StartHandler handler;
    Outcome outcome = handler.execute(graph.node("start"), ctx, graph, {});
    CHECK(outcome.status == StageStatus::SUCCESS);
    REQUIRE(outcome.context_updates.contains("started_at"));
    CHECK(outcome.context_updates["started_at"].get<std::string>().find('T') != std::string::npos);
}

TEST_CASE("Conditional prefers edge conditions", "[handlers][conditional]") {
    Graph graph("cond");
    graph.add_node(make_node("check", "diamond"));
    graph.add_node(make_node("low"));
    graph.add_node(make_node("high"));
    graph.add_edge(Edge("check", "low", "Low", "tier=low"));
    graph.add_edge(Edge("check", "high", "High", "tier=high"));

    RunContext ctx;
    ctx.set("tier", "high");
    ConditionalHandler handler;
    Outcome outcome = handler.execute(graph.node("check"), ctx, graph, {});
    CHECK(outcome.status == StageStatus::SUCCESS);
    CHECK(outcome.preferred_label == "High");
}

TEST_CASE("Conditional maps an expression prompt onto yes/no labels", "[handlers][conditional]") {
    Node check = make_node("check", "diamond");
    check.prompt = "tests_passed=true";
    Graph graph = branching_graph(check, {{"Yes", "ship"}, {"No", "fix"}});

    ConditionalHandler handler;
    RunContext passing;
    passing.set("tests_passed", true);
    CHECK(handler.execute(graph.node("check"), passing, graph, {}).preferred_label == "Yes");

    RunContext failing;
    failing.set("tests_passed", false);
    CHECK(handler.execute(graph.node("check"), failing, graph, {}).preferred_label == "No");
}

TEST_CASE("Conditional matches a context value against labels", "[handlers][conditional]") {
    Node route = make_node("route", "diamond");
    route.prompt = "review.decision";
    Graph graph = branching_graph(route, {{"Approve", "deploy"}, {"Reject", "rework"}});

    ConditionalHandler handler;
    RunContext ctx;
    ctx.set("review.decision", "  REJECT ");
    CHECK(handler.execute(graph.node("route"), ctx, graph, {}).preferred_label == "Reject");

    RunContext unknown;
    unknown.set("review.decision", "maybe");
    Outcome outcome = handler.execute(graph.node("route"), unknown, graph, {});
    CHECK(outcome.status == StageStatus::SUCCESS);
    CHECK(outcome.preferred_label.empty());
    CHECK(outcome.notes == "no branch matched");
}

TEST_CASE("Generation stores the response and writes artifacts", "[handlers][generation]") {
    TempDir dir("gen");
    auto backend = std::make_shared<EchoBackend>();
    GenerationHandler handler(backend);

    Node plan = make_node("plan");
    plan.prompt = "Write a plan for {{ topic }}";
    plan.llm_model = "small-model";
    Graph graph = linear_graph({});
    graph.add_node(plan);

    RunContext ctx;
    ctx.set("topic", "caching");
    Outcome outcome = handler.execute(graph.node("plan"), ctx, graph, dir.path() / "plan");

    CHECK(outcome.status == StageStatus::SUCCESS);
    CHECK(outcome.context_updates["plan.response"] == "generated");
    CHECK(backend->last_prompt == "Write a plan for caching");
    CHECK(backend->last_model == "small-model");
    CHECK(read_file(dir.path() / "plan" / "prompt.md") == "Write a plan for caching");
    CHECK(read_file(dir.path() / "plan" / "response.md") == "generated");
}

TEST_CASE("Generation falls back to the label and reports backend errors", "[handlers][generation]") {
    Graph graph = linear_graph({"summarize"});
    RunContext ctx;

    auto echo = std::make_shared<EchoBackend>();
    GenerationHandler ok(echo);
    CHECK(ok.execute(graph.node("summarize"), ctx, graph, {}).succeeded());
    CHECK(echo->last_prompt == "summarize");

    GenerationHandler broken(std::make_shared<EchoBackend>(true));
    Outcome outcome = broken.execute(graph.node("summarize"), ctx, graph, {});
    CHECK(outcome.status == StageStatus::FAIL);
    CHECK(outcome.failure_reason.find("model unavailable") != std::string::npos);

    CHECK_THROWS_AS(GenerationHandler(nullptr), std::invalid_argument);
}

TEST_CASE("Stub backend echoes the start of the prompt", "[handlers][generation]") {
    StubBackend stub;
    std::string long_prompt(80, 'x');
    std::string response = stub.generate(long_prompt, Value::object(), "", "", "high");
    CHECK(response == "stub response: " + std::string(50, 'x'));
}

TEST_CASE("Tool results become context updates", "[handlers][tool]") {
    ToolRegistry tools;
    tools.register_tool("lint", [](const Value&) { return Value{{"lint.errors", 0}}; });
    tools.register_tool("count", [](const Value& snapshot) { return Value(snapshot.size()); });
    tools.register_tool("noop", [](const Value&) { return Value(); });
    tools.register_tool("boom", [](const Value&) -> Value { throw std::runtime_error("exploded"); });
    tools.register_tool("Run Lint", [](const Value&) { return Value{{"by_label", true}}; });

    Graph graph("tools");
    for (const char* id : {"lint", "count", "noop", "boom", "missing"}) {
        graph.add_node(make_node(id, "parallelogram"));
    }
    graph.add_node(Node("labelled", "Run Lint", "parallelogram"));

    ToolHandler handler(tools);
    RunContext ctx;
    ctx.set("a", 1);
    ctx.set("b", 2);

    CHECK(handler.execute(graph.node("lint"), ctx, graph, {}).context_updates["lint.errors"] == 0);
    CHECK(handler.execute(graph.node("count"), ctx, graph, {}).context_updates["count.result"] == 2);
    CHECK(handler.execute(graph.node("noop"), ctx, graph, {}).context_updates.empty());
    CHECK(handler.execute(graph.node("labelled"), ctx, graph, {}).context_updates["by_label"] == true);

    Outcome raised = handler.execute(graph.node("boom"), ctx, graph, {});
    CHECK(raised.status == StageStatus::FAIL);
    CHECK(raised.failure_reason.find("exploded") != std::string::npos);

    CHECK(handler.execute(graph.node("missing"), ctx, graph, {}).status == StageStatus::FAIL);
}

TEST_CASE("Shell tools capture stdout and reject non-zero exits", "[handlers][tool]") {
    auto echo = make_shell_tool("echo hello");
    Value result = echo(Value::object());
    CHECK(result["exit_code"] == 0);
    CHECK(result["stdout"].get<std::string>().find("hello") != std::string::npos);

    auto failing = make_shell_tool("exit 3");
    CHECK_THROWS_AS(failing(Value::object()), std::runtime_error);
}

TEST_CASE("Fan-in waits for exactly the missing predecessors", "[handlers][fan_in]") {
    Graph graph("join");
    for (const char* id : {"a", "b", "join"}) {
        graph.add_node(make_node(id));
    }
    graph.add_edge(Edge("a", "join"));
    graph.add_edge(Edge("b", "join"));
    graph.add_edge(Edge("b", "join", "again"));

    FanInHandler handler;
    RunContext ctx;
    ctx.set("a.complete", true);

    Outcome waiting = handler.execute(graph.node("join"), ctx, graph, {});
    CHECK(waiting.status == StageStatus::RETRY);
    CHECK(waiting.notes == "Waiting for predecessors: b");

    ctx.set("b.complete", true);
    Outcome ready = handler.execute(graph.node("join"), ctx, graph, {});
    CHECK(ready.status == StageStatus::SUCCESS);
    CHECK(ready.notes == "All 2 predecessors completed");

    CHECK(handler.execute(graph.node("a"), ctx, graph, {}).notes == "No predecessors to wait for");
}

TEST_CASE("Human gates build typed questions from edge labels", "[handlers][human]") {
    Node gate = make_node("approve", "hexagon");
    gate.prompt = "Ship it?";
    Graph yes_no = branching_graph(gate, {{"[Y] Yes", "ship"}, {"[N] No", "rework"}});

    std::vector<Question> asked;
    CallbackInterviewer interviewer([&asked](const Question& q) {
        asked.push_back(q);
        if (q.type == QuestionType::YES_NO) {
            return Answer{kAnswerNo, q.options[1], "No"};
        }
        if (q.options.empty()) {
            return Answer{"looks fine", std::nullopt, "looks fine"};
        }
        return Answer{q.options.back().key, q.options.back(), q.options.back().label};
    });
    WaitHumanHandler handler(interviewer);
    RunContext ctx;

    Outcome answered = handler.execute(yes_no.node("approve"), ctx, yes_no, {});
    REQUIRE(asked.size() == 1);
    CHECK(asked[0].type == QuestionType::YES_NO);
    CHECK(asked[0].text == "Ship it?");
    CHECK(asked[0].stage == "approve");
    REQUIRE(asked[0].options.size() == 2);
    CHECK(asked[0].options[0] == Option{"Y", "[Y] Yes"});
    CHECK(answered.preferred_label == "[N] No");
    CHECK(answered.context_updates["approve.answer"] == "[N] No");

    Graph choice = branching_graph(gate, {{"Fast", "a"}, {"Careful", "b"}, {"Skip", "c"}});
    Outcome picked = handler.execute(choice.node("approve"), ctx, choice, {});
    REQUIRE(asked.size() == 2);
    CHECK(asked[1].type == QuestionType::MULTIPLE_CHOICE);
    CHECK(asked[1].options[2].key == "2");
    CHECK(picked.preferred_label == "Skip");

    Graph open = branching_graph(gate, {{"", "next"}});
    Outcome typed = handler.execute(open.node("approve"), ctx, open, {});
    REQUIRE(asked.size() == 3);
    CHECK(typed.preferred_label == "looks fine");
    CHECK(asked[2].type == QuestionType::FREEFORM);
    CHECK(asked[2].options.empty());
}

TEST_CASE("Human gate timeouts fail and skips are reported", "[handlers][human]") {
    Node gate = make_node("approve", "hexagon");
    Graph graph = branching_graph(gate, {{"Yes", "ship"}, {"No", "rework"}});
    RunContext ctx;

    CallbackInterviewer silent([](const Question&) { return Answer::timeout(); });
    WaitHumanHandler timeout_handler(silent);
    CHECK(timeout_handler.execute(graph.node("approve"), ctx, graph, {}).status == StageStatus::FAIL);

    CallbackInterviewer skipper([](const Question&) { return Answer{kAnswerSkipped, std::nullopt, ""}; });
    WaitHumanHandler skip_handler(skipper);
    Outcome skipped = skip_handler.execute(graph.node("approve"), ctx, graph, {});
    CHECK(skipped.status == StageStatus::SKIPPED);
    CHECK(skipped.context_updates["approve.answer"] == kAnswerSkipped);
}

TEST_CASE("Stack manager loops until stack_done", "[handlers][loop]") {
    HandlerRegistry registry;
    auto counter = std::make_shared<LambdaHandler>([](const Node&, RunContext& ctx) {
        int n = ctx.get("count", 0).get<int>() + 1;
        Value updates{{"count", n}};
        if (n == 3) updates["stack_done"] = true;
        return Outcome::success(updates);
    });
    registry.register_handler("step", counter);

    Graph graph("loop");
    Node loop = make_node("loop", "house");
    loop.prompt = "body";
    graph.add_node(loop);
    graph.add_node(make_node("body", "box", "step"));

    StackManagerHandler handler(registry);
    RunContext ctx;
    Outcome outcome = handler.execute(graph.node("loop"), ctx, graph, {});
    CHECK(outcome.status == StageStatus::SUCCESS);
    CHECK(outcome.context_updates["loop.iterations"] == 3);
    CHECK(ctx.get("count") == 3);
    CHECK(outcome.notes == "Loop completed after 3 iteration(s)");
}

TEST_CASE("Stack manager stops at the iteration cap", "[handlers][loop]") {
    HandlerRegistry registry;
    auto body = std::make_shared<ScriptedHandler>(std::vector<Outcome>{Outcome::success()});
    registry.register_handler("step", body);

    Graph graph("loop");
    Node loop = make_node("loop", "house");
    loop.prompt = "body";
    graph.add_node(loop);
    graph.add_node(make_node("body", "box", "step"));

    StackManagerHandler handler(registry);
    RunContext ctx;
    Outcome outcome = handler.execute(graph.node("loop"), ctx, graph, {});
    CHECK(outcome.status == StageStatus::SUCCESS);
    CHECK(outcome.context_updates["loop.iterations"] == StackManagerHandler::kMaxIterations);
    CHECK(body->calls() == StackManagerHandler::kMaxIterations);
}

TEST_CASE("Stack manager aborts on a failing child", "[handlers][loop]") {
    HandlerRegistry registry;
    registry.register_handler("ok", std::make_shared<ScriptedHandler>(std::vector<Outcome>{Outcome::success()}));
    registry.register_handler("bad", std::make_shared<ScriptedHandler>(
        std::vector<Outcome>{Outcome::success(), Outcome::fail("disk full")}));

    Graph graph("loop");
    Node loop = make_node("loop", "house");
    loop.prompt = "first, second";
    graph.add_node(loop);
    graph.add_node(make_node("first", "box", "ok"));
    graph.add_node(make_node("second", "box", "bad"));

    StackManagerHandler handler(registry);
    RunContext ctx;
    Outcome outcome = handler.execute(graph.node("loop"), ctx, graph, {});
    CHECK(outcome.status == StageStatus::FAIL);
    CHECK(outcome.failure_reason == "Child second failed on iteration 2: disk full");
    CHECK(outcome.context_updates["loop.iterations"] == 2);
}

TEST_CASE("Registry resolves by type, then shape, then default", "[handlers][registry]") {
    ToolRegistry tools;
    auto registry = create_default_registry(nullptr, nullptr, tools);
    CHECK_FALSE(registry->has_handler("wait.human"));
    CHECK(registry->registered_types().size() == 8);

    Node gate = make_node("gate", "hexagon");
    CHECK_THROWS_AS(registry->resolve(gate), ConfigError);

    Node typed = make_node("t", "box", "tool");
    CHECK(dynamic_cast<ToolHandler*>(&registry->resolve(typed)) != nullptr);

    Node shaped = make_node("s", "diamond");
    CHECK(dynamic_cast<ConditionalHandler*>(&registry->resolve(shaped)) != nullptr);

    Node unknown_type = make_node("u", "box", "no.such.type");
    CHECK(dynamic_cast<GenerationHandler*>(&registry->resolve(unknown_type)) != nullptr);

    auto fallback = std::make_shared<ScriptedHandler>(std::vector<Outcome>{Outcome::success()});
    registry->set_default(fallback);
    CHECK(&registry->resolve(make_node("odd", "egg")) == fallback.get());

    AutoApproveInterviewer interviewer;
    auto with_human = create_default_registry(nullptr, &interviewer, tools);
    CHECK(with_human->has_handler("wait.human"));
    CHECK(HandlerRegistry::type_for_shape("house") == "stack.manager_loop");
    CHECK(HandlerRegistry::type_for_shape("egg").empty());

    CHECK_THROWS_AS(registry->register_handler("", fallback), std::invalid_argument);
}
