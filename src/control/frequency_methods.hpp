/**
 * @file frequency_methods.hpp
 * @brief CPU frequency control methods, most to least preferred.
 * @author Dimitris Kafetzis
 *
 *   GovernorScalingMethod         cpufreq sysfs (scaling limits or userspace setspeed)
 *   DirectRegisterMethod          IA32_PERF_CTL through /dev/cpu/N/msr
 *   VendorToolMethod              cpupower frequency-set
 *   BootParameterFallbackMethod   kernel command-line drop-in for the next boot
 */

#pragma once

#include "control/control_axis.hpp"
#include "hardware/generation_table.hpp"
#include "platform/command_runner.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <sys/types.h>

namespace thermal_guard {

struct FrequencyTarget {
    uint32_t khz{0};
};

using FrequencyMethod = IControlMethod<FrequencyTarget>;

/// Directories /sys/devices/system/cpu/cpuN that expose cpufreq.
[[nodiscard]] std::vector<std::filesystem::path> cpufreq_policies(
    const std::filesystem::path& sysfs_root);

// ─────────────────────────────────────────────
// GovernorScalingMethod
// ─────────────────────────────────────────────

/**
 * @brief Kernel cpufreq governor interface.
 *
 * P-state drivers (intel_pstate, amd-pstate) are capped through
 * scaling_max_freq. Other drivers use the userspace governor and
 * scaling_setspeed when it is offered, otherwise the same cap.
 */
class GovernorScalingMethod : public FrequencyMethod {
public:
    explicit GovernorScalingMethod(std::filesystem::path sysfs_root, int priority = 0);

    [[nodiscard]] ControlMethodKind kind() const noexcept override {
        return ControlMethodKind::GovernorScaling;
    }
    [[nodiscard]] int priority() const noexcept override { return priority_; }
    [[nodiscard]] bool is_available() override;
    Result<void> apply(const FrequencyTarget& target) override;

private:
    Result<void> apply_cap(const std::filesystem::path& cpufreq, uint32_t khz);
    Result<void> apply_setspeed(const std::filesystem::path& cpufreq, uint32_t khz);

    std::filesystem::path sysfs_root_;
    int priority_;
};

// ─────────────────────────────────────────────
// DirectRegisterMethod
// ─────────────────────────────────────────────

/**
 * @brief Writes IA32_PERF_CTL (0x199) on every CPU.
 *
 * Only frequencies present in the generation's multiplier table are
 * accepted; anything else is rejected.
 */
class DirectRegisterMethod : public FrequencyMethod {
public:
    static constexpr off_t kPerfCtlRegister = 0x199;

    DirectRegisterMethod(std::filesystem::path dev_root,
                         std::vector<MultiplierStep> multipliers,
                         int priority = 1);

    [[nodiscard]] ControlMethodKind kind() const noexcept override {
        return ControlMethodKind::DirectRegister;
    }
    [[nodiscard]] int priority() const noexcept override { return priority_; }
    [[nodiscard]] bool is_available() override;
    Result<void> apply(const FrequencyTarget& target) override;

private:
    std::vector<std::filesystem::path> msr_devices() const;

    std::filesystem::path dev_root_;
    std::vector<MultiplierStep> multipliers_;
    int priority_;
};

// ─────────────────────────────────────────────
// VendorToolMethod
// ─────────────────────────────────────────────

class VendorToolMethod : public FrequencyMethod {
public:
    VendorToolMethod(ICommandRunner& runner, Duration timeout, int priority = 2);

    [[nodiscard]] ControlMethodKind kind() const noexcept override {
        return ControlMethodKind::VendorTool;
    }
    [[nodiscard]] int priority() const noexcept override { return priority_; }
    [[nodiscard]] bool is_available() override;
    Result<void> apply(const FrequencyTarget& target) override;

private:
    ICommandRunner& runner_;
    Duration timeout_;
    int priority_;
};

// ─────────────────────────────────────────────
// BootParameterFallbackMethod
// ─────────────────────────────────────────────

/**
 * @brief Last resort when no runtime interface works.
 *
 * Writes a boot-loader drop-in that disables the P-state driver so the
 * next boot exposes a governor-controllable cpufreq driver. It does not
 * change the current frequency; success means the drop-in is in place.
 */
class BootParameterFallbackMethod : public FrequencyMethod {
public:
    BootParameterFallbackMethod(std::filesystem::path drop_in,
                                std::string kernel_params,
                                int priority = 3);

    [[nodiscard]] ControlMethodKind kind() const noexcept override {
        return ControlMethodKind::BootParameterFallback;
    }
    [[nodiscard]] int priority() const noexcept override { return priority_; }
    [[nodiscard]] bool is_available() override;
    Result<void> apply(const FrequencyTarget& target) override;

    /// Kernel parameters suitable for `vendor`.
    [[nodiscard]] static std::string default_params(CpuVendor vendor);

    /// Exact file content written to the drop-in.
    [[nodiscard]] std::string render() const;

private:
    std::filesystem::path drop_in_;
    std::string kernel_params_;
    int priority_;
};

}  // namespace thermal_guard
