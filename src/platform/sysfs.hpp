/**
 * @file sysfs.hpp
 * @brief Small helpers for reading and writing Linux pseudo-filesystems.
 * @author Dimitris Kafetzis
 *
 * Every reader returns std::nullopt rather than a sentinel when the node is
 * missing, unreadable or malformed. Roots are always passed in by the
 * caller so tests can point them at a fake tree.
 */

#pragma once

#include "core/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace thermal_guard {

/// Strip leading and trailing whitespace.
[[nodiscard]] std::string trim(std::string_view text);

[[nodiscard]] bool path_exists(const std::filesystem::path& path) noexcept;

/// First line of a file, trimmed. Empty files yield an empty string.
[[nodiscard]] std::optional<std::string> read_first_line(const std::filesystem::path& path);

/// All lines of a file. Missing file yields an empty vector.
[[nodiscard]] std::vector<std::string> read_lines(const std::filesystem::path& path);

/// Parse the first line as a base-10 (or 0x-prefixed) integer.
[[nodiscard]] std::optional<long long> read_integer(const std::filesystem::path& path);

/// Overwrite a sysfs attribute. Fails with ErrorCode::Io.
Result<void> write_text(const std::filesystem::path& path, std::string_view value);

/**
 * @brief Entries of `dir` whose names start with `prefix`, in natural order.
 *
 * Natural order puts "hwmon2" before "hwmon10". A missing directory yields
 * an empty vector.
 */
[[nodiscard]] std::vector<std::filesystem::path> list_entries(
    const std::filesystem::path& dir, std::string_view prefix);

/// Trailing decimal index of a name such as "pwm3" or "thermal_zone12".
[[nodiscard]] std::optional<uint32_t> trailing_index(std::string_view name) noexcept;

}  // namespace thermal_guard
