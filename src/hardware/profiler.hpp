/**
 * @file profiler.hpp
 * @brief One-shot hardware capability detection.
 * @author Dimitris Kafetzis
 *
 * Reads static identification data once and derives an immutable
 * HardwareProfile:
 *   /proc/cpuinfo                             vendor, model string, core count
 *   /sys/devices/system/cpu/cpu0/cpufreq/     frequency range and steps
 *   /dev/cpu/0/msr                            direct-register access
 *   /sys/class/drm/card* /device/vendor       GPU vendor (PCI id)
 *   cpupower, nvidia-smi on $PATH             vendor tools
 *
 * Detection never throws. Anything it cannot determine is replaced by a
 * conservative default and logged as a warning.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "hardware/generation_table.hpp"
#include "platform/command_runner.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace thermal_guard {

struct ProfilerPaths {
    std::filesystem::path sysfs_root = "/sys";
    std::filesystem::path procfs_root = "/proc";
    std::filesystem::path dev_root = "/dev";
};

class HardwareProfiler {
public:
    HardwareProfiler(ProfilerPaths paths,
                     ICommandRunner& runner,
                     Logger& logger,
                     ThermalConfig thermal = {},
                     FrequencyConfig frequency = {});

    /**
     * @brief Detect the machine's profile.
     *
     * Errors only when the resulting profile is invalid even after falling
     * back to defaults (e.g. configured limit overrides that are not
     * strictly increasing). That is the daemon's single fatal startup case.
     */
    [[nodiscard]] Result<HardwareProfile> detect();

    /// Multiplier table for the detected generation (empty if none).
    [[nodiscard]] const std::vector<MultiplierStep>& multipliers() const noexcept {
        return multipliers_;
    }

    /// Human-readable multi-line report.
    [[nodiscard]] static std::string describe(const HardwareProfile& profile);

private:
    struct CpuIdentity {
        CpuVendor vendor{CpuVendor::Unknown};
        std::string model;
        uint32_t core_count{0};
        std::optional<double> current_mhz;
    };

    CpuIdentity read_cpu_identity();
    void detect_frequency_range(HardwareProfile& profile, const CpuIdentity& cpu);
    std::vector<ControlMethodKind> detect_freq_methods(const GenerationEntry& entry,
                                                       bool recognized);
    void detect_gpu(HardwareProfile& profile);
    /// `lspci -nn` fallback when no DRM card identifies the GPU.
    bool detect_gpu_lspci(HardwareProfile& profile);
    void apply_thermal_overrides(HardwareProfile& profile);

    ProfilerPaths paths_;
    ICommandRunner& runner_;
    Logger& logger_;
    ThermalConfig thermal_;
    FrequencyConfig frequency_;
    std::vector<MultiplierStep> multipliers_;
};

}  // namespace thermal_guard
