/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace thermal_guard {

namespace {

constexpr uint32_t kMaxBackendTimeoutMs = 3000;

template <typename T>
void read_optional(const toml::node_view<toml::node>& node, std::optional<T>& out) {
    if (auto v = node.value<T>()) out = *v;
}

constexpr int64_t kMaxU32 = std::numeric_limits<uint32_t>::max();

/// Unsigned 32-bit setting. Leaves `out` unchanged when the key is absent.
Result<void> read_u32(const toml::node_view<toml::node>& node, std::string_view key,
                      uint32_t& out) {
    auto v = node.value<int64_t>();
    if (!v) return {};
    if (*v < 0 || *v > kMaxU32) {
        return Error{ErrorCode::ConfigInvalid,
                     std::string{key} + " out of range: " + std::to_string(*v)};
    }
    out = static_cast<uint32_t>(*v);
    return {};
}

Result<ProfileOverride> parse_profile_override(toml::table& tbl) {
    ProfileOverride po;
    read_optional(tbl["freq_percent"], po.freq_percent);
    if (auto khz = tbl["freq_khz"].value<int64_t>()) {
        if (*khz <= 0) {
            return Error{ErrorCode::ConfigInvalid, "freq_khz must be positive"};
        }
        if (*khz > kMaxU32) {
            return Error{ErrorCode::ConfigInvalid,
                         "freq_khz out of range: " + std::to_string(*khz)};
        }
        po.freq_khz = static_cast<uint32_t>(*khz);
    }
    read_optional(tbl["gpu_token"], po.gpu_token);

    auto fan = tbl["fan"];
    if (fan.is_string()) {
        if (fan.value_or(std::string{}) != "auto") {
            return Error{ErrorCode::ConfigInvalid, "fan must be \"auto\" or a percentage"};
        }
        po.fan = FanDirective::auto_mode();
    } else if (auto pct = fan.value<int64_t>()) {
        if (*pct < 0 || *pct > 100) {
            return Error{ErrorCode::ConfigInvalid, "fan percentage out of range: "
                         + std::to_string(*pct)};
        }
        po.fan = FanDirective::manual(static_cast<uint8_t>(*pct));
    }

    if (po.freq_percent && (*po.freq_percent <= 0.0 || *po.freq_percent > 100.0)) {
        return Error{ErrorCode::ConfigInvalid, "freq_percent must be in (0, 100]"};
    }
    return po;
}

}  // namespace

std::optional<PowerProfile> parse_power_profile(std::string_view name) noexcept {
    if (name == "performance") return PowerProfile::Performance;
    if (name == "balanced") return PowerProfile::Balanced;
    if (name == "powersave" || name == "power-saver" || name == "power_save") {
        return PowerProfile::PowerSave;
    }
    if (name == "emergency") return PowerProfile::Emergency;
    return std::nullopt;
}

Result<uint32_t> poll_interval_from_seconds(double seconds) {
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        return Error{ErrorCode::ConfigInvalid, "interval must be a positive number of seconds"};
    }
    const double ms = seconds * 1000.0;
    if (ms > static_cast<double>(kMaxU32)) {
        return Error{ErrorCode::ConfigInvalid, "interval too large"};
    }
    return static_cast<uint32_t>(std::max(1.0, ms));
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Io, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [daemon]
        if (auto daemon = tbl["daemon"]; daemon.is_table()) {
            if (auto r = read_u32(daemon["poll_interval_ms"], "poll_interval_ms",
                                  config.daemon.poll_interval_ms); !r) {
                return r.error();
            }
            if (auto r = read_u32(daemon["cycle_budget_ms"], "cycle_budget_ms",
                                  config.daemon.cycle_budget_ms); !r) {
                return r.error();
            }
            config.daemon.auto_fan_control = daemon["auto_fan_control"].value_or(true);
        }

        // [sensors]
        if (auto sensors = tbl["sensors"]; sensors.is_table()) {
            if (auto r = read_u32(sensors["backend_timeout_ms"], "backend_timeout_ms",
                                  config.sensors.backend_timeout_ms); !r) {
                return r.error();
            }
            if (auto r = read_u32(sensors["worker_threads"], "worker_threads",
                                  config.sensors.worker_threads); !r) {
                return r.error();
            }
            config.sensors.enable_nvidia_smi = sensors["nvidia_smi"].value_or(true);
            config.sensors.enable_hwmon = sensors["hwmon"].value_or(true);
            config.sensors.enable_lm_sensors = sensors["lm_sensors"].value_or(true);
            config.sensors.enable_acpi = sensors["acpi"].value_or(true);
            config.sensors.enable_thermal_zone = sensors["thermal_zone"].value_or(true);
            config.sensors.sysfs_root = sensors["sysfs_root"].value_or(std::string{"/sys"});
            config.sensors.procfs_root = sensors["procfs_root"].value_or(std::string{"/proc"});
            config.sensors.dev_root = sensors["dev_root"].value_or(std::string{"/dev"});
        }

        // [thermal]
        if (auto thermal = tbl["thermal"]; thermal.is_table()) {
            config.thermal.hysteresis_margin_c = thermal["hysteresis_margin_c"].value_or(3.0);
            if (auto r = read_u32(thermal["escalation_bound"], "escalation_bound",
                                  config.thermal.escalation_bound); !r) {
                return r.error();
            }
            read_optional(thermal["tjmax_c"], config.thermal.tjmax_override_c);
            read_optional(thermal["comfort_c"], config.thermal.comfort_c);
            read_optional(thermal["warning_c"], config.thermal.warning_c);
            read_optional(thermal["critical_c"], config.thermal.critical_c);
            read_optional(thermal["emergency_c"], config.thermal.emergency_c);
            config.thermal.gpu_warning_c = thermal["gpu_warning_c"].value_or(75.0);
            config.thermal.gpu_critical_c = thermal["gpu_critical_c"].value_or(85.0);
            config.thermal.gpu_emergency_c = thermal["gpu_emergency_c"].value_or(95.0);
        }

        // [fan]
        if (auto fan = tbl["fan"]; fan.is_table()) {
            if (auto r = read_u32(fan["min_percent"], "fan.min_percent",
                                  config.fan.min_percent); !r) {
                return r.error();
            }
        }

        // [frequency]
        if (auto freq = tbl["frequency"]; freq.is_table()) {
            config.frequency.enable_direct_register = freq["direct_register"].value_or(true);
            config.frequency.enable_vendor_tool = freq["vendor_tool"].value_or(true);
            config.frequency.boot_fallback_path =
                freq["boot_fallback_path"].value_or(std::string{});
        }

        // [profiles.<name>]
        if (auto* profiles = tbl["profiles"].as_table()) {
            for (auto&& [key, node] : *profiles) {
                auto profile = parse_power_profile(key.str());
                if (!profile) {
                    return Error{ErrorCode::ConfigInvalid,
                                 "Unknown profile: " + std::string{key.str()}};
                }
                auto* section = node.as_table();
                if (!section) continue;
                auto parsed = parse_profile_override(*section);
                if (!parsed) {
                    return Error{ErrorCode::ConfigInvalid,
                                 "[profiles." + std::string{key.str()} + "] "
                                 + parsed.error().message};
                }
                config.profiles[*profile] = *parsed;
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.snapshot_file =
                telemetry["snapshot_file"].value_or(std::string{"power_monitoring"});
            if (auto r = read_u32(telemetry["max_file_size_mb"], "max_file_size_mb",
                                  config.telemetry.max_file_size_mb); !r) {
                return r.error();
            }
            if (auto r = read_u32(telemetry["rotate_count"], "rotate_count",
                                  config.telemetry.rotate_count); !r) {
                return r.error();
            }
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        // ── Validation ───────────────────────
        if (config.daemon.poll_interval_ms == 0) {
            return Error{ErrorCode::ConfigInvalid, "poll_interval_ms must be positive"};
        }
        if (config.thermal.hysteresis_margin_c < 0.0) {
            return Error{ErrorCode::ConfigInvalid, "hysteresis_margin_c must not be negative"};
        }
        if (config.fan.min_percent > 100) {
            return Error{ErrorCode::ConfigInvalid, "fan.min_percent must be <= 100"};
        }
        config.sensors.backend_timeout_ms =
            std::clamp<uint32_t>(config.sensors.backend_timeout_ms, 1, kMaxBackendTimeoutMs);

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigInvalid,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace thermal_guard
