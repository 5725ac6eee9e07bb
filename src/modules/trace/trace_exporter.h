// modules/trace/trace_exporter.h
#ifndef AGENTFLOW_MODULES_TRACE_TRACE_EXPORTER_H
#define AGENTFLOW_MODULES_TRACE_TRACE_EXPORTER_H

#include "events/event_bus.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentflow {

struct TraceRecord {
    NodeId node_id;
    std::chrono::system_clock::time_point start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;
    std::string status = "running"; // "running", or the outcome status string
    int retries = 0;
    std::vector<double> retry_delays_sec;
    std::optional<std::string> error;
    std::string notes;
    nlohmann::json context_updates = nlohmann::json::object();
};

// 订阅事件总线，按阶段记录 trace；可选回显到 stdout
class TraceExporter {
public:
    explicit TraceExporter(bool echo = false);

    // Registers a catch-all listener; the exporter must outlive the bus' use
    void attach(EventBus& bus);
    void on_event(const PipelineEvent& event);

    std::vector<TraceRecord> get_traces() const;
    std::optional<std::string> pipeline_error() const;
    void clear_traces();

    nlohmann::json to_json() const;
    // Throws std::runtime_error if the file cannot be written
    void export_json(const std::filesystem::path& path) const;

private:
    bool echo_;
    mutable std::mutex mutex_;
    std::vector<TraceRecord> traces_;
    std::optional<std::string> pipeline_error_;

    TraceRecord* find_latest(const NodeId& node_id);
    void echo_event(const PipelineEvent& event) const;
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_TRACE_TRACE_EXPORTER_H
