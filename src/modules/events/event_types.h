// modules/events/event_types.h
#ifndef AGENTFLOW_MODULES_EVENTS_EVENT_TYPES_H
#define AGENTFLOW_MODULES_EVENTS_EVENT_TYPES_H

#include "core/types/outcome.h"
#include <cstddef>
#include <string>
#include <type_traits>
#include <variant>

namespace agentflow {

struct PipelineStarted {
    std::string graph_name;
};

struct PipelineCompleted {
    std::string graph_name;
    Outcome outcome;
};

struct PipelineFailed {
    std::string graph_name;
    std::string error;
};

struct StageStarted {
    NodeId node_id;
};

struct StageCompleted {
    NodeId node_id;
    Outcome outcome;
};

struct StageFailed {
    NodeId node_id;
    std::string error;
    bool will_retry = false;
};

struct StageRetrying {
    NodeId node_id;
    int attempt = 0;
    double delay_sec = 0.0;
};

struct CheckpointSaved {
    NodeId node_id;
    std::string path;
};

using PipelineEvent = std::variant<
    PipelineStarted,
    PipelineCompleted,
    PipelineFailed,
    StageStarted,
    StageCompleted,
    StageFailed,
    StageRetrying,
    CheckpointSaved>;

template <typename T, typename... Ts>
constexpr size_t index_in_pack() {
    constexpr bool matches[] = {std::is_same_v<T, Ts>...};
    for (size_t i = 0; i < sizeof...(Ts); ++i) {
        if (matches[i]) return i;
    }
    return sizeof...(Ts);
}

template <typename T, typename Variant>
struct event_index;

template <typename T, typename... Ts>
struct event_index<T, std::variant<Ts...>> {
    static constexpr size_t value = index_in_pack<T, Ts...>();
    static_assert(value < sizeof...(Ts), "not a pipeline event type");
};

// "pipeline_started", "stage_completed", ...
std::string event_name(const PipelineEvent& event);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_EVENTS_EVENT_TYPES_H
