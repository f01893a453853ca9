/**
 * @file platform_power_methods.cpp
 * @brief DRM power level, radeon power profile and ACPI platform profile writers.
 * @author Dimitris Kafetzis
 */

#include "control/platform_power_methods.hpp"
#include "platform/sysfs.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

#include <unistd.h>

namespace thermal_guard {

namespace fs = std::filesystem;

// ─────────────────────────────────────────────
// DrmPowerLevelMethod
// ─────────────────────────────────────────────

DrmPowerLevelMethod::DrmPowerLevelMethod(fs::path gpu_device, int priority)
    : attribute_(std::move(gpu_device) / "power_dpm_force_performance_level")
    , priority_(priority) {}

bool DrmPowerLevelMethod::is_available() {
    return ::access(attribute_.c_str(), W_OK) == 0;
}

Result<void> DrmPowerLevelMethod::apply(const PlatformPowerTarget& target) {
    const auto& token = target.gpu_token;
    if (token != "auto" && token != "low" && token != "high") {
        return Error{ErrorCode::ControlFailed, "unsupported GPU power token: " + token};
    }
    if (auto r = write_text(attribute_, token); !r) {
        return Error{ErrorCode::ControlFailed, r.error().message};
    }
    return {};
}

// ─────────────────────────────────────────────
// RadeonPowerProfileMethod
// ─────────────────────────────────────────────

RadeonPowerProfileMethod::RadeonPowerProfileMethod(fs::path gpu_device, int priority)
    : profile_(gpu_device / "power_profile")
    , method_(gpu_device / "power_method")
    , priority_(priority) {}

bool RadeonPowerProfileMethod::is_available() {
    if (::access(profile_.c_str(), W_OK) != 0) return false;
    auto method = read_first_line(method_);
    return !method || *method == "profile";
}

Result<void> RadeonPowerProfileMethod::apply(const PlatformPowerTarget& target) {
    const auto& token = target.gpu_token;
    if (token != "auto" && token != "low" && token != "high") {
        return Error{ErrorCode::ControlFailed, "unsupported GPU power token: " + token};
    }
    if (auto r = write_text(profile_, token); !r) {
        return Error{ErrorCode::ControlFailed, r.error().message};
    }
    return {};
}

// ─────────────────────────────────────────────
// PlatformProfileMethod
// ─────────────────────────────────────────────

PlatformProfileMethod::PlatformProfileMethod(fs::path sysfs_root, int priority)
    : profile_(sysfs_root / "firmware/acpi/platform_profile")
    , choices_(sysfs_root / "firmware/acpi/platform_profile_choices")
    , priority_(priority) {}

bool PlatformProfileMethod::is_available() {
    return ::access(profile_.c_str(), W_OK) == 0;
}

Result<void> PlatformProfileMethod::apply(const PlatformPowerTarget& target) {
    std::vector<std::string> wanted;
    switch (target.profile) {
        case PowerProfile::Performance: wanted = {"performance", "balanced"}; break;
        case PowerProfile::Balanced:    wanted = {"balanced"}; break;
        case PowerProfile::PowerSave:   wanted = {"low-power", "quiet", "cool"}; break;
        case PowerProfile::Emergency:   wanted = {"low-power", "quiet", "cool"}; break;
    }

    std::vector<std::string> offered;
    if (auto line = read_first_line(choices_)) {
        std::istringstream iss(*line);
        std::string choice;
        while (iss >> choice) offered.push_back(choice);
    }

    for (const auto& name : wanted) {
        if (!offered.empty()
            && std::find(offered.begin(), offered.end(), name) == offered.end()) {
            continue;
        }
        if (auto r = write_text(profile_, name); !r) {
            return Error{ErrorCode::ControlFailed, r.error().message};
        }
        return {};
    }
    return Error{ErrorCode::ControlFailed,
                 "firmware offers no profile for " + std::string(to_string(target.profile))};
}

}  // namespace thermal_guard
