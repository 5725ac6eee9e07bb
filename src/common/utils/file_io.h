#ifndef AGENTFLOW_COMMON_UTILS_FILE_IO_H
#define AGENTFLOW_COMMON_UTILS_FILE_IO_H

#include "core/types/value.h"
#include <filesystem>
#include <string>

namespace agentflow {

// Creates parent directories; throws std::runtime_error on failure
void write_text_file(const std::filesystem::path& path, const std::string& content);
void write_json_file(const std::filesystem::path& path, const Value& data);

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_FILE_IO_H
