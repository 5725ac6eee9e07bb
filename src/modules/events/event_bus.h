// modules/events/event_bus.h
#ifndef AGENTFLOW_MODULES_EVENTS_EVENT_BUS_H
#define AGENTFLOW_MODULES_EVENTS_EVENT_BUS_H

#include "events/event_types.h"
#include <functional>
#include <unordered_map>
#include <vector>

namespace agentflow {

// 同步事件总线：emit 在所有订阅者返回后才返回，按订阅顺序分发。
// Catch-all listeners run first, then listeners of the event's own kind.
class EventBus {
public:
    using Listener = std::function<void(const PipelineEvent&)>;

    template <typename Event>
    void subscribe(std::function<void(const Event&)> callback) {
        constexpr size_t kind = event_index<Event, PipelineEvent>::value;
        listeners_[kind].push_back([cb = std::move(callback)](const PipelineEvent& event) {
            cb(std::get<Event>(event));
        });
    }

    void on_all(Listener callback);
    void emit(const PipelineEvent& event) const;

    size_t listener_count() const;

private:
    std::unordered_map<size_t, std::vector<Listener>> listeners_;
    std::vector<Listener> global_listeners_;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_EVENTS_EVENT_BUS_H
