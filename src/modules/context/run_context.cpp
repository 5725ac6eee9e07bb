// modules/context/run_context.cpp
#include "context/run_context.h"
#include "common/utils/string_utils.h"

namespace agentflow {

RunContext::RunContext() : data_(Value::object()) {}

RunContext::RunContext(Value initial)
    : data_(initial.is_object() ? std::move(initial) : Value::object()) {}

void RunContext::set(const std::string& key, Value value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key] = std::move(value);
}

Value RunContext::get(const std::string& key, const Value& fallback) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) {
        return fallback;
    }
    return *it;
}

std::string RunContext::get_string(const std::string& key, const std::string& fallback) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end() || it->is_null()) {
        return fallback;
    }
    return value_to_string(*it);
}

bool RunContext::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.contains(key);
}

void RunContext::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key);
}

Value RunContext::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

void RunContext::apply_updates(const Value& updates) {
    if (!updates.is_object()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = updates.begin(); it != updates.end(); ++it) {
        data_[it.key()] = it.value();
    }
}

std::unique_ptr<RunContext> RunContext::clone() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto copy = std::make_unique<RunContext>(data_);
    copy->log_ = log_;
    return copy;
}

void RunContext::append_log(std::string entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_.push_back(std::move(entry));
}

std::vector<std::string> RunContext::logs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

void RunContext::restore_logs(std::vector<std::string> entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_ = std::move(entries);
}

} // namespace agentflow
