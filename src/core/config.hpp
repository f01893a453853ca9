/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace thermal_guard {

struct DaemonConfig {
    uint32_t poll_interval_ms = 5000;
    uint32_t cycle_budget_ms = 10000;    ///< Ceiling for one full cycle
    bool auto_fan_control = true;
};

struct SensorsConfig {
    uint32_t backend_timeout_ms = 3000;  ///< Clamped to 3000
    uint32_t worker_threads = 0;         ///< 0 = one per enabled backend
    bool enable_nvidia_smi = true;
    bool enable_hwmon = true;
    bool enable_lm_sensors = true;
    bool enable_acpi = true;
    bool enable_thermal_zone = true;
    std::filesystem::path sysfs_root = "/sys";
    std::filesystem::path procfs_root = "/proc";
    std::filesystem::path dev_root = "/dev";
};

struct ThermalConfig {
    double hysteresis_margin_c = 3.0;
    uint32_t escalation_bound = 12;
    std::optional<double> tjmax_override_c;
    std::optional<double> comfort_c;
    std::optional<double> warning_c;
    std::optional<double> critical_c;
    std::optional<double> emergency_c;
    double gpu_warning_c = 75.0;
    double gpu_critical_c = 85.0;
    double gpu_emergency_c = 95.0;
};

struct FanConfig {
    uint32_t min_percent = 20;
};

struct FrequencyConfig {
    bool enable_direct_register = true;
    bool enable_vendor_tool = true;
    std::filesystem::path boot_fallback_path;    ///< Empty disables the boot-parameter fallback
};

/**
 * @brief Per-profile override. Unset fields keep the built-in defaults.
 */
struct ProfileOverride {
    std::optional<double> freq_percent;
    std::optional<uint32_t> freq_khz;
    std::optional<std::string> gpu_token;
    std::optional<FanDirective> fan;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    std::string snapshot_file = "power_monitoring";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    DaemonConfig daemon;
    SensorsConfig sensors;
    ThermalConfig thermal;
    FanConfig fan;
    FrequencyConfig frequency;
    std::map<PowerProfile, ProfileOverride> profiles;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Every key is optional. Returns ConfigInvalid for parse errors and for
 * values outside their legal range.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Parse a profile name ("performance", "balanced", "powersave", "emergency").
 */
std::optional<PowerProfile> parse_power_profile(std::string_view name) noexcept;

/**
 * @brief Poll interval in milliseconds for a `--interval` value in seconds.
 *
 * Truncates to whole milliseconds, at least 1. Non-finite, non-positive
 * and oversized values return ConfigInvalid.
 */
Result<uint32_t> poll_interval_from_seconds(double seconds);

}  // namespace thermal_guard
