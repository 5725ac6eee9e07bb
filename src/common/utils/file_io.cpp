// common/utils/file_io.cpp
#include "common/utils/file_io.h"
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace agentflow {

void write_text_file(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path.string());
    }
    file << content;
    if (!file) {
        throw std::runtime_error("Failed writing file: " + path.string());
    }
}

void write_json_file(const std::filesystem::path& path, const Value& data) {
    write_text_file(path, data.dump(2));
}

} // namespace agentflow
