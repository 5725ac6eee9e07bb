// tests/test_budget.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/types/budget.h"
#include "core/types/cancellation.h"
#include <chrono>
#include <thread>

using namespace agentflow;
using namespace std::chrono_literals;

TEST_CASE("Step budget counts down to its limit", "[budget]") {
    ExecutionBudget budget;
    budget.max_steps = 2;
    CHECK(budget.try_consume_step());
    CHECK(budget.try_consume_step());
    CHECK_FALSE(budget.try_consume_step());
    CHECK(budget.steps_used == 2);

    budget.restart();
    CHECK(budget.steps_used == 0);
    CHECK(budget.try_consume_step());

    ExecutionBudget unlimited;
    unlimited.max_steps = -1;
    for (int i = 0; i < 5000; ++i) {
        REQUIRE(unlimited.try_consume_step());
    }
}

TEST_CASE("Duration budget exposes its deadline", "[budget]") {
    ExecutionBudget budget;
    CHECK_FALSE(budget.deadline().has_value());
    CHECK_FALSE(budget.duration_exceeded());

    budget.max_duration_sec = 0;
    budget.restart();
    REQUIRE(budget.deadline().has_value());
    CHECK(budget.duration_exceeded());

    budget.max_duration_sec = 60;
    budget.restart();
    CHECK(*budget.deadline() - budget.start_time == std::chrono::seconds(60));
    CHECK_FALSE(budget.duration_exceeded());
}

TEST_CASE("A deadline cuts waits short without counting as a cancel request", "[budget][cancel]") {
    CancellationToken token;
    token.set_deadline(CancellationToken::Clock::now() + 50ms);

    auto begin = std::chrono::steady_clock::now();
    CHECK_FALSE(token.wait_for(10s));
    CHECK(std::chrono::steady_clock::now() - begin < 5s);
    CHECK(token.is_cancelled());
    CHECK_FALSE(token.cancel_requested());

    token.set_deadline(std::nullopt);
    CHECK_FALSE(token.is_cancelled());
    CHECK(token.wait_for(1ms));

    token.cancel();
    CHECK(token.cancel_requested());
    CHECK(token.is_cancelled());
}
