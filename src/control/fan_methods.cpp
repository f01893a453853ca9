/**
 * @file fan_methods.cpp
 * @brief PWM and NVIDIA fan control.
 * @author Dimitris Kafetzis
 */

#include "control/fan_methods.hpp"
#include "platform/sysfs.hpp"

#include <algorithm>
#include <cmath>
#include <regex>

#include <unistd.h>

namespace thermal_guard {

namespace fs = std::filesystem;

std::vector<FanDevice> discover_pwm_fans(const fs::path& sysfs_root) {
    static const std::regex pwm_re(R"(^pwm(\d+)$)");
    std::vector<FanDevice> fans;
    uint32_t index = 0;

    for (const auto& chip : list_entries(sysfs_root / "class/hwmon", "hwmon")) {
        for (const auto& entry : list_entries(chip, "pwm")) {
            const auto fname = entry.filename().string();
            if (!std::regex_match(fname, pwm_re)) continue;

            FanDevice fan;
            fan.index = index++;
            fan.control_kind = ControlMethodKind::Pwm;
            fan.path = entry.string();
            if (path_exists(chip / (fname + "_enable"))) {
                fan.enable_path = (chip / (fname + "_enable")).string();
                auto mode = read_integer(fan.enable_path);
                fan.mode = (mode && *mode == PwmFanMethod::kEnableManual) ? FanMode::Manual
                                                                          : FanMode::Auto;
            }
            auto max = read_integer(chip / (fname + "_max"));
            fan.pwm_max = (max && *max > 0) ? static_cast<uint32_t>(*max) : 255;
            if (auto raw = read_integer(entry)) {
                auto pct = std::lround(100.0 * static_cast<double>(*raw) / fan.pwm_max);
                fan.current_percent = static_cast<uint8_t>(std::clamp<long>(pct, 0, 100));
            }
            fans.push_back(std::move(fan));
        }
    }
    return fans;
}

Result<void> FloorEnforcingFanMethod::apply(const FanDirective& directive) {
    if (directive.automatic) return apply_clamped(directive);
    return apply_clamped(FanDirective::manual(std::max(directive.percent, min_percent_)));
}

// ─────────────────────────────────────────────
// PwmFanMethod
// ─────────────────────────────────────────────

PwmFanMethod::PwmFanMethod(fs::path sysfs_root, uint8_t min_percent, int priority)
    : FloorEnforcingFanMethod(min_percent)
    , sysfs_root_(std::move(sysfs_root))
    , priority_(priority) {}

bool PwmFanMethod::is_available() {
    devices_ = discover_pwm_fans(sysfs_root_);
    return std::any_of(devices_.begin(), devices_.end(), [](const FanDevice& d) {
        return ::access(d.path.c_str(), W_OK) == 0;
    });
}

Result<void> PwmFanMethod::apply_clamped(const FanDirective& directive) {
    size_t applied = 0;
    std::string last_error;

    for (auto& fan : devices_) {
        if (directive.automatic) {
            if (fan.enable_path.empty()) {
                last_error = fan.path + ": no enable attribute";
                continue;
            }
            if (auto r = write_text(fan.enable_path, std::to_string(kEnableAuto)); !r) {
                last_error = r.error().message;
                continue;
            }
            fan.mode = FanMode::Auto;
            ++applied;
            continue;
        }

        if (!fan.enable_path.empty()) {
            if (auto r = write_text(fan.enable_path, std::to_string(kEnableManual)); !r) {
                last_error = r.error().message;
                continue;
            }
        }
        auto raw = std::lround(static_cast<double>(directive.percent) * fan.pwm_max / 100.0);
        if (auto r = write_text(fan.path, std::to_string(raw)); !r) {
            last_error = r.error().message;
            continue;
        }
        fan.mode = FanMode::Manual;
        fan.current_percent = directive.percent;
        ++applied;
    }

    if (applied == 0) {
        return Error{ErrorCode::ControlFailed,
                     last_error.empty() ? "no pwm devices" : last_error};
    }
    return {};
}

// ─────────────────────────────────────────────
// NvidiaSettingsFanMethod
// ─────────────────────────────────────────────

NvidiaSettingsFanMethod::NvidiaSettingsFanMethod(ICommandRunner& runner,
                                                 Duration timeout,
                                                 uint8_t min_percent,
                                                 uint32_t gpu_index,
                                                 uint32_t fan_index,
                                                 int priority)
    : FloorEnforcingFanMethod(min_percent)
    , runner_(runner)
    , timeout_(timeout)
    , gpu_index_(gpu_index)
    , priority_(priority) {
    device_.index = fan_index;
    device_.control_kind = ControlMethodKind::VendorGpu;
    device_.path = "[fan:" + std::to_string(fan_index) + "]";
}

bool NvidiaSettingsFanMethod::is_available() {
    return runner_.available("nvidia-settings");
}

Result<void> NvidiaSettingsFanMethod::apply_clamped(const FanDirective& directive) {
    const auto gpu = "[gpu:" + std::to_string(gpu_index_) + "]";
    std::vector<std::string> argv{"nvidia-settings", "-a",
        gpu + "/GPUFanControlState=" + (directive.automatic ? "0" : "1")};
    if (!directive.automatic) {
        argv.push_back("-a");
        argv.push_back(device_.path + "/GPUTargetFanSpeed="
                       + std::to_string(directive.percent));
    }

    auto out = runner_.run(argv, timeout_);
    if (!out) return Error{ErrorCode::ControlFailed, out.error().message};
    if (!out->ok()) {
        return Error{ErrorCode::ControlFailed,
                     "nvidia-settings exited with status " + std::to_string(out->exit_code)};
    }

    device_.mode = directive.automatic ? FanMode::Auto : FanMode::Manual;
    device_.current_percent = directive.automatic ? std::nullopt
                                                  : std::optional<uint8_t>{directive.percent};
    return {};
}

}  // namespace thermal_guard
