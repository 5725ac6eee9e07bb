// modules/trace/trace_exporter.cpp
#include "trace/trace_exporter.h"
#include "common/utils/time_format.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <type_traits>

namespace agentflow {

TraceExporter::TraceExporter(bool echo) : echo_(echo) {}

void TraceExporter::attach(EventBus& bus) {
    bus.on_all([this](const PipelineEvent& event) { on_event(event); });
}

// StageStarted always opens a new record, so the latest one belongs to the current invocation
TraceRecord* TraceExporter::find_latest(const NodeId& node_id) {
    auto it = std::find_if(traces_.rbegin(), traces_.rend(),
                           [&node_id](const TraceRecord& r) { return r.node_id == node_id; });
    return it != traces_.rend() ? &*it : nullptr;
}

void TraceExporter::on_event(const PipelineEvent& event) {
    if (echo_) {
        echo_event(event);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, StageStarted>) {
            TraceRecord record;
            record.node_id = e.node_id;
            record.start_time = std::chrono::system_clock::now();
            traces_.push_back(std::move(record));
        } else if constexpr (std::is_same_v<T, StageRetrying>) {
            if (TraceRecord* record = find_latest(e.node_id)) {
                record->retries = std::max(record->retries, e.attempt);
                record->retry_delays_sec.push_back(e.delay_sec);
            }
        } else if constexpr (std::is_same_v<T, StageFailed>) {
            if (TraceRecord* record = find_latest(e.node_id)) {
                record->error = e.error;
                if (!e.will_retry) {
                    record->status = to_string(StageStatus::FAIL);
                    record->end_time = std::chrono::system_clock::now();
                }
            }
        } else if constexpr (std::is_same_v<T, StageCompleted>) {
            if (TraceRecord* record = find_latest(e.node_id)) {
                record->status = to_string(e.outcome.status);
                record->end_time = std::chrono::system_clock::now();
                record->notes = e.outcome.notes;
                record->context_updates = e.outcome.context_updates;
                if (!e.outcome.failure_reason.empty()) {
                    record->error = e.outcome.failure_reason;
                }
            }
        } else if constexpr (std::is_same_v<T, PipelineFailed>) {
            pipeline_error_ = e.error;
        }
    }, event);
}

void TraceExporter::echo_event(const PipelineEvent& event) const {
    std::visit([](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PipelineStarted>) {
            std::cout << "[INFO] Pipeline started: " << e.graph_name << std::endl;
        } else if constexpr (std::is_same_v<T, PipelineCompleted>) {
            std::cout << "[INFO] Pipeline completed: " << e.graph_name
                      << " (" << to_string(e.outcome.status) << ")" << std::endl;
        } else if constexpr (std::is_same_v<T, PipelineFailed>) {
            std::cerr << "[ERROR] Pipeline failed: " << e.graph_name << ": " << e.error << std::endl;
        } else if constexpr (std::is_same_v<T, StageStarted>) {
            std::cout << "[INFO] Stage started: " << e.node_id << std::endl;
        } else if constexpr (std::is_same_v<T, StageCompleted>) {
            std::cout << "[INFO] Stage completed: " << e.node_id
                      << " (" << to_string(e.outcome.status) << ")" << std::endl;
        } else if constexpr (std::is_same_v<T, StageFailed>) {
            std::cerr << "[WARNING] Stage failed: " << e.node_id << ": " << e.error
                      << (e.will_retry ? " (will retry)" : "") << std::endl;
        } else if constexpr (std::is_same_v<T, StageRetrying>) {
            std::cout << "[INFO] Stage retrying: " << e.node_id << " attempt " << e.attempt
                      << " in " << e.delay_sec << "s" << std::endl;
        } else {
            std::cout << "[DEBUG] Checkpoint saved after " << e.node_id << ": " << e.path << std::endl;
        }
    }, event);
}

std::vector<TraceRecord> TraceExporter::get_traces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_;
}

std::optional<std::string> TraceExporter::pipeline_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pipeline_error_;
}

void TraceExporter::clear_traces() {
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.clear();
    pipeline_error_.reset();
}

nlohmann::json TraceExporter::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : traces_) {
        nlohmann::json tj;
        tj["node_id"] = r.node_id;
        tj["status"] = r.status;
        tj["start_time"] = to_iso8601(r.start_time);
        if (r.end_time) {
            tj["end_time"] = to_iso8601(*r.end_time);
            tj["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(*r.end_time - r.start_time).count();
        }
        tj["retries"] = r.retries;
        tj["retry_delays_sec"] = r.retry_delays_sec;
        if (r.error) {
            tj["error"] = *r.error;
        }
        tj["notes"] = r.notes;
        tj["context_updates"] = r.context_updates;
        arr.push_back(std::move(tj));
    }
    return arr;
}

void TraceExporter::export_json(const std::filesystem::path& path) const {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write trace file: " + path.string());
    }
    file << to_json().dump(2) << std::endl;
}

} // namespace agentflow
