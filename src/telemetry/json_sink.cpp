/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 * @author Dimitris Kafetzis
 */

#include "telemetry/json_sink.hpp"

#include <iostream>
#include <system_error>

namespace thermal_guard {

namespace fs = std::filesystem;

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const fs::path& log_dir,
                           const std::string& prefix,
                           uint32_t max_file_size_mb,
                           uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(max_files == 0 ? 1 : max_files) {
    std::error_code ec;
    fs::create_directories(log_dir_, ec);
    const auto path = active_path();
    if (auto size = fs::file_size(path, ec); !ec) current_size_ = size;
    current_file_.open(path, std::ios::app);
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

fs::path JsonFileSink::active_path() const {
    return log_dir_ / (prefix_ + ".ndjson");
}

fs::path JsonFileSink::rotated_path(uint32_t generation) const {
    return log_dir_ / (prefix_ + "." + std::to_string(generation) + ".ndjson");
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed();
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void JsonFileSink::rotate_if_needed() {
    if (max_file_size_bytes_ == 0 || current_size_ < max_file_size_bytes_) return;

    current_file_.close();
    std::error_code ec;
    if (max_files_ == 1) {
        fs::remove(active_path(), ec);
    } else {
        fs::remove(rotated_path(max_files_ - 1), ec);
        for (uint32_t gen = max_files_ - 1; gen > 1; --gen) {
            if (fs::exists(rotated_path(gen - 1), ec)) {
                fs::rename(rotated_path(gen - 1), rotated_path(gen), ec);
            }
        }
        fs::rename(active_path(), rotated_path(1), ec);
    }
    current_file_.open(active_path(), std::ios::app);
    current_size_ = 0;
}

// ── StderrSink ───────────────────────────────

void StderrSink::write(std::string_view json_line) {
    std::cerr << json_line << '\n';
}

void StderrSink::flush() {
    std::cerr.flush();
}

}  // namespace thermal_guard
