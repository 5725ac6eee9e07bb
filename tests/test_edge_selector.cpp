// tests/test_edge_selector.cpp
#include <catch2/catch_test_macros.hpp>
#include "routing/edge_selector.h"
#include <algorithm>

using namespace agentflow;

TEST_CASE("Satisfied conditions beat every other rule", "[edge_selector]") {
    RunContext ctx;
    Outcome outcome = Outcome::fail("x");
    outcome.preferred_label = "heavy";
    outcome.suggested_next_ids = {"heavy_target"};

    std::vector<Edge> edges = {
        Edge("n", "heavy_target", "heavy", "", 100),
        Edge("n", "on_fail", "", "outcome=fail"),
        Edge("n", "on_success", "", "outcome=success", 50),
    };

    auto chosen = select_edge(edges, outcome, ctx);
    REQUIRE(chosen);
    CHECK(chosen->to_node == "on_fail");
}

TEST_CASE("Several satisfied conditions tie-break by weight then target", "[edge_selector]") {
    RunContext ctx;
    ctx.set("mode", "fast");
    Outcome outcome;
    std::vector<Edge> edges = {
        Edge("n", "zeta", "", "mode=fast", 1),
        Edge("n", "alpha", "", "mode=fast", 1),
        Edge("n", "omega", "", "mode=slow", 9),
        Edge("n", "plain", "", "", 5),
    };
    auto chosen = select_edge(edges, outcome, ctx);
    REQUIRE(chosen);
    CHECK(chosen->to_node == "alpha");
}

TEST_CASE("Preferred label matches after normalization", "[edge_selector]") {
    RunContext ctx;
    Outcome outcome;
    outcome.preferred_label = "  APPROVE ";

    std::vector<Edge> edges = {
        Edge("n", "reject", "[R] Reject"),
        Edge("n", "approve", "[A] Approve"),
        Edge("n", "again", "a) approve"),
    };
    auto chosen = select_edge(edges, outcome, ctx);
    REQUIRE(chosen);
    CHECK(chosen->to_node == "approve");
    CHECK(normalize_label("K - Ship It") == "ship it");
}

TEST_CASE("Suggested ids are tried in order", "[edge_selector]") {
    RunContext ctx;
    Outcome outcome;
    outcome.preferred_label = "nothing matches";
    outcome.suggested_next_ids = {"ghost", "second", "first"};

    std::vector<Edge> edges = {Edge("n", "first", "", "", 10), Edge("n", "second")};
    auto chosen = select_edge(edges, outcome, ctx);
    REQUIRE(chosen);
    CHECK(chosen->to_node == "second");
}

TEST_CASE("Unconditional weight tie-break is order independent", "[edge_selector]") {
    RunContext ctx;
    Outcome outcome;
    std::vector<Edge> edges = {
        Edge("n", "mango", "", "", 3),
        Edge("n", "apple", "", "", 3),
        Edge("n", "kiwi", "", "", 3),
        Edge("n", "banana", "", "", 1),
        Edge("n", "aardvark", "", "never=true", 99),
    };

    std::sort(edges.begin(), edges.end(), [](const Edge& a, const Edge& b) { return a.to_node < b.to_node; });
    do {
        auto chosen = select_edge(edges, outcome, ctx);
        REQUIRE(chosen);
        CHECK(chosen->to_node == "apple");
    } while (std::next_permutation(edges.begin(), edges.end(),
                                   [](const Edge& a, const Edge& b) { return a.to_node < b.to_node; }));
}

TEST_CASE("Falls back to all edges when every edge is conditional", "[edge_selector]") {
    RunContext ctx;
    Outcome outcome;
    std::vector<Edge> edges = {
        Edge("n", "b", "", "x=1", 2),
        Edge("n", "a", "", "x=2", 2),
        Edge("n", "c", "", "x=3", 1),
    };
    auto chosen = select_edge(edges, outcome, ctx);
    REQUIRE(chosen);
    CHECK(chosen->to_node == "a");
}

TEST_CASE("No edges means no selection", "[edge_selector]") {
    RunContext ctx;
    CHECK_FALSE(select_edge({}, Outcome{}, ctx).has_value());
    CHECK_FALSE(select_condition_edge({Edge("n", "m")}, Outcome{}, ctx).has_value());
}
