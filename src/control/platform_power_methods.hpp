/**
 * @file platform_power_methods.hpp
 * @brief Coarse GPU power and firmware platform profile directives.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "control/control_axis.hpp"

#include <filesystem>
#include <string>

namespace thermal_guard {

struct PlatformPowerTarget {
    PowerProfile profile{PowerProfile::Balanced};
    std::string gpu_token{"auto"};    ///< "auto", "low" or "high"
};

using PlatformPowerMethod = IControlMethod<PlatformPowerTarget>;

/**
 * @brief amdgpu power_dpm_force_performance_level.
 */
class DrmPowerLevelMethod : public PlatformPowerMethod {
public:
    explicit DrmPowerLevelMethod(std::filesystem::path gpu_device, int priority = 0);

    [[nodiscard]] ControlMethodKind kind() const noexcept override {
        return ControlMethodKind::DrmPowerLevel;
    }
    [[nodiscard]] int priority() const noexcept override { return priority_; }
    [[nodiscard]] bool is_available() override;
    Result<void> apply(const PlatformPowerTarget& target) override;

private:
    std::filesystem::path attribute_;
    int priority_;
};

/**
 * @brief Legacy radeon device/power_profile (pre-DPM "profile" method).
 *
 * Tokens map one to one: auto, low and high. The kernel only honors the
 * file while power_method is "profile", which is_available() checks when the
 * attribute exists.
 */
class RadeonPowerProfileMethod : public PlatformPowerMethod {
public:
    explicit RadeonPowerProfileMethod(std::filesystem::path gpu_device, int priority = 1);

    [[nodiscard]] ControlMethodKind kind() const noexcept override {
        return ControlMethodKind::RadeonPowerProfile;
    }
    [[nodiscard]] int priority() const noexcept override { return priority_; }
    [[nodiscard]] bool is_available() override;
    Result<void> apply(const PlatformPowerTarget& target) override;

private:
    std::filesystem::path profile_;
    std::filesystem::path method_;
    int priority_;
};

/**
 * @brief ACPI platform_profile (performance / balanced / low-power).
 *
 * The requested name falls back to the closest choice the firmware offers.
 */
class PlatformProfileMethod : public PlatformPowerMethod {
public:
    explicit PlatformProfileMethod(std::filesystem::path sysfs_root, int priority = 0);

    [[nodiscard]] ControlMethodKind kind() const noexcept override {
        return ControlMethodKind::PlatformProfile;
    }
    [[nodiscard]] int priority() const noexcept override { return priority_; }
    [[nodiscard]] bool is_available() override;
    Result<void> apply(const PlatformPowerTarget& target) override;

private:
    std::filesystem::path profile_;
    std::filesystem::path choices_;
    int priority_;
};

}  // namespace thermal_guard
