// common/utils/time_format.cpp
#include "common/utils/time_format.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace agentflow {

namespace {

std::tm utc_tm(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

} // namespace

std::string to_iso8601(std::chrono::system_clock::time_point tp) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count() % 1000000;
    if (micros < 0) micros += 1000000;
    std::tm tm = utc_tm(std::chrono::system_clock::to_time_t(tp));

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros << "+00:00";
    return oss.str();
}

std::string iso8601_now() {
    return to_iso8601(std::chrono::system_clock::now());
}

std::string compact_timestamp_now() {
    std::tm tm = utc_tm(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%S");
    return oss.str();
}

} // namespace agentflow
