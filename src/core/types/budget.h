#ifndef AGENTFLOW_CORE_TYPES_BUDGET_H
#define AGENTFLOW_CORE_TYPES_BUDGET_H

#include <chrono>
#include <optional>

namespace agentflow {

// 执行预算：限制引擎总步数与运行时长，-1 表示无限制。
// Owned by the single-threaded engine loop.
struct ExecutionBudget {
    using Clock = std::chrono::steady_clock;

    int max_steps = 1000;
    int max_duration_sec = -1;

    int steps_used = 0;
    Clock::time_point start_time = Clock::now();

    void restart() {
        steps_used = 0;
        start_time = Clock::now();
    }

    // Wall-clock point at which the run must stop; none when unlimited
    std::optional<Clock::time_point> deadline() const {
        if (max_duration_sec < 0) return std::nullopt;
        return start_time + std::chrono::seconds(max_duration_sec);
    }

    bool duration_exceeded() const {
        auto limit = deadline();
        return limit && Clock::now() >= *limit;
    }

    bool try_consume_step() {
        if (max_steps >= 0 && steps_used >= max_steps) return false;
        ++steps_used;
        return true;
    }
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_BUDGET_H
