#ifndef AGENTFLOW_COMMON_UTILS_TIME_FORMAT_H
#define AGENTFLOW_COMMON_UTILS_TIME_FORMAT_H

#include <chrono>
#include <string>

namespace agentflow {

// ISO-8601 UTC with microseconds, e.g. "2024-05-01T12:00:00.123456+00:00"
std::string to_iso8601(std::chrono::system_clock::time_point tp);
std::string iso8601_now();

// Compact UTC stamp for directory names, e.g. "20240501T120000"
std::string compact_timestamp_now();

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_TIME_FORMAT_H
