/**
 * @file sysfs.cpp
 * @brief Pseudo-filesystem helpers.
 * @author Dimitris Kafetzis
 */

#include "platform/sysfs.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <fstream>

namespace thermal_guard {

namespace fs = std::filesystem;

std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(first, last - first + 1)};
}

bool path_exists(const fs::path& path) noexcept {
    std::error_code ec;
    return fs::exists(path, ec);
}

std::optional<std::string> read_first_line(const fs::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) return std::nullopt;
    std::string line;
    std::getline(ifs, line);
    if (ifs.bad()) return std::nullopt;
    return trim(line);
}

std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

std::optional<long long> read_integer(const fs::path& path) {
    auto line = read_first_line(path);
    if (!line || line->empty()) return std::nullopt;

    std::string_view text{*line};
    int base = 10;
    bool negative = false;
    if (text.starts_with('-')) {
        negative = true;
        text.remove_prefix(1);
    }
    if (text.starts_with("0x") || text.starts_with("0X")) {
        base = 16;
        text.remove_prefix(2);
    }

    long long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
    if (ec != std::errc{} || ptr == text.data()) return std::nullopt;
    return negative ? -value : value;
}

Result<void> write_text(const fs::path& path, std::string_view value) {
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs.is_open()) {
        return Error{ErrorCode::Io, "Cannot open " + path.string() + ": "
                     + std::string(std::strerror(errno))};
    }
    ofs << value;
    ofs.flush();
    if (!ofs) {
        return Error{ErrorCode::Io, "Write to " + path.string() + " failed: "
                     + std::string(std::strerror(errno))};
    }
    return {};
}

std::optional<uint32_t> trailing_index(std::string_view name) noexcept {
    size_t pos = name.size();
    while (pos > 0 && name[pos - 1] >= '0' && name[pos - 1] <= '9') --pos;
    if (pos == name.size()) return std::nullopt;

    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(name.data() + pos, name.data() + name.size(), value);
    if (ec != std::errc{}) return std::nullopt;
    return value;
}

std::vector<fs::path> list_entries(const fs::path& dir, std::string_view prefix) {
    std::vector<fs::path> out;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return out;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        auto name = entry.path().filename().string();
        if (name.starts_with(prefix)) out.push_back(entry.path());
    }

    auto digits_start = [](const std::string& name) {
        size_t pos = name.size();
        while (pos > 0 && name[pos - 1] >= '0' && name[pos - 1] <= '9') --pos;
        return pos;
    };

    std::sort(out.begin(), out.end(), [&](const fs::path& a, const fs::path& b) {
        auto an = a.filename().string();
        auto bn = b.filename().string();
        auto ap = digits_start(an);
        auto bp = digits_start(bn);
        if (an.compare(0, ap, bn, 0, bp) != 0 || ap == an.size() || bp == bn.size()) {
            return an < bn;
        }
        auto ai = trailing_index(an);
        auto bi = trailing_index(bn);
        if (!ai || !bi || *ai == *bi) return an < bn;
        return *ai < *bi;
    });
    return out;
}

}  // namespace thermal_guard
