/**
 * @file control_abstraction.hpp
 * @brief Facade driving every control axis from a power profile.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "control/control_axis.hpp"
#include "control/fan_methods.hpp"
#include "control/frequency_methods.hpp"
#include "control/platform_power_methods.hpp"
#include "control/power_profiles.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "platform/command_runner.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace thermal_guard {

/// Per-axis outcomes of one apply_profile() call.
struct ProfileApplication {
    PowerProfile profile{PowerProfile::Balanced};
    ResolvedFrequency frequency;
    ControlOutcome frequency_outcome;
    FanDirective fan;                               ///< Directive sent to the fan axis
    std::optional<ControlOutcome> fan_outcome;      ///< Absent when fans are not managed
    std::optional<ControlOutcome> gpu_power_outcome;  ///< Absent without a GPU power method
    ControlOutcome platform_profile_outcome;

    /// Frequency (and fans, when managed) applied. GPU power and the firmware
    /// platform profile are best effort.
    [[nodiscard]] bool fully_applied() const noexcept {
        return frequency_outcome.success && (!fan_outcome || fan_outcome->success);
    }
};

class ControlAbstraction {
public:
    ControlAbstraction(std::shared_ptr<const HardwareProfile> hardware,
                       ProfileTable profiles,
                       Logger& logger);

    [[nodiscard]] ControlAxis<FrequencyTarget>& frequency_axis() noexcept { return frequency_; }
    [[nodiscard]] ControlAxis<FanDirective>& fan_axis() noexcept { return fan_; }
    [[nodiscard]] ControlAxis<PlatformPowerTarget>& gpu_power_axis() noexcept {
        return gpu_power_;
    }
    [[nodiscard]] ControlAxis<PlatformPowerTarget>& platform_profile_axis() noexcept {
        return platform_profile_;
    }

    /**
     * @brief Resolve `profile` against the hardware and drive each axis.
     *
     * With `manage_fans` false the fan axis is left untouched. `fan_floor`
     * raises the profile's fan directive to at least that level (see
     * hotter()); the daemon uses it to cool a hot GPU under a cool CPU.
     */
    ProfileApplication apply_profile(PowerProfile profile, bool manage_fans = true,
                                     std::optional<FanDirective> fan_floor = std::nullopt);

    ControlOutcome set_frequency(uint32_t khz);
    ControlOutcome set_fan(FanDirective directive);

    /// Fans seen by the PWM method at its last availability check.
    [[nodiscard]] std::vector<FanDevice> fan_devices() const;

    [[nodiscard]] const HardwareProfile& hardware() const noexcept { return *hardware_; }
    [[nodiscard]] const ProfileTable& profiles() const noexcept { return profiles_; }

    /// Registered by the factory so fan_devices() can report discovered fans.
    void attach_pwm_method(const PwmFanMethod* pwm) noexcept { pwm_ = pwm; }

private:
    std::shared_ptr<const HardwareProfile> hardware_;
    ProfileTable profiles_;
    Logger& logger_;
    ControlAxis<FrequencyTarget> frequency_;
    ControlAxis<FanDirective> fan_;
    ControlAxis<PlatformPowerTarget> gpu_power_;
    ControlAxis<PlatformPowerTarget> platform_profile_;
    const PwmFanMethod* pwm_{nullptr};
};

/**
 * @brief Build the facade with the methods the hardware profile allows.
 *
 * Frequency methods are registered in the order of
 * HardwareProfile::available_freq_methods. Fan methods are PWM, then
 * nvidia-settings when the GPU is NVIDIA. The GPU power axis holds the
 * amdgpu DRM power level, then the legacy radeon power_profile (AMD GPU
 * only). The ACPI platform profile is a separate axis of its own.
 */
[[nodiscard]] std::unique_ptr<ControlAbstraction> make_control_abstraction(
    std::shared_ptr<const HardwareProfile> hardware,
    const Config& config,
    const std::vector<MultiplierStep>& multipliers,
    ICommandRunner& runner,
    Logger& logger);

}  // namespace thermal_guard
