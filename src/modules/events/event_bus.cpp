// modules/events/event_bus.cpp
#include "events/event_bus.h"
#include <type_traits>

namespace agentflow {

std::string event_name(const PipelineEvent& event) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PipelineStarted>) return "pipeline_started";
        else if constexpr (std::is_same_v<T, PipelineCompleted>) return "pipeline_completed";
        else if constexpr (std::is_same_v<T, PipelineFailed>) return "pipeline_failed";
        else if constexpr (std::is_same_v<T, StageStarted>) return "stage_started";
        else if constexpr (std::is_same_v<T, StageCompleted>) return "stage_completed";
        else if constexpr (std::is_same_v<T, StageFailed>) return "stage_failed";
        else if constexpr (std::is_same_v<T, StageRetrying>) return "stage_retrying";
        else return "checkpoint_saved";
    }, event);
}

void EventBus::on_all(Listener callback) {
    global_listeners_.push_back(std::move(callback));
}

void EventBus::emit(const PipelineEvent& event) const {
    for (const auto& cb : global_listeners_) {
        cb(event);
    }
    auto it = listeners_.find(event.index());
    if (it == listeners_.end()) {
        return;
    }
    for (const auto& cb : it->second) {
        cb(event);
    }
}

size_t EventBus::listener_count() const {
    size_t count = global_listeners_.size();
    for (const auto& [kind, list] : listeners_) {
        count += list.size();
    }
    return count;
}

} // namespace agentflow
