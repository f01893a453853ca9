/**
 * @file fan_methods.hpp
 * @brief Fan control methods and fan device discovery.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "control/control_axis.hpp"
#include "platform/command_runner.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace thermal_guard {

enum class FanMode : uint8_t { Auto, Manual };

struct FanDevice {
    uint32_t index{0};
    ControlMethodKind control_kind{ControlMethodKind::Pwm};
    std::optional<uint8_t> current_percent;
    FanMode mode{FanMode::Auto};
    std::string path;            ///< pwm attribute path, or GPU handle ("[fan:0]")
    std::string enable_path;     ///< pwmN_enable; empty if absent
    uint32_t pwm_max{255};
};

/// pwm channels under /sys/class/hwmon, in natural order.
[[nodiscard]] std::vector<FanDevice> discover_pwm_fans(const std::filesystem::path& sysfs_root);

using FanMethod = IControlMethod<FanDirective>;

/**
 * @brief Base for fan methods: enforces the minimum duty floor.
 *
 * Manual requests below the floor are raised to it. Auto requests hand
 * control back to firmware/driver and bypass the floor.
 */
class FloorEnforcingFanMethod : public FanMethod {
public:
    explicit FloorEnforcingFanMethod(uint8_t min_percent) : min_percent_(min_percent) {}

    Result<void> apply(const FanDirective& directive) final;

    [[nodiscard]] uint8_t min_percent() const noexcept { return min_percent_; }

protected:
    virtual Result<void> apply_clamped(const FanDirective& directive) = 0;

private:
    uint8_t min_percent_;
};

// ─────────────────────────────────────────────
// PwmFanMethod
// ─────────────────────────────────────────────

/**
 * @brief hwmon pwmN / pwmN_enable (1 = manual, 2 = automatic).
 *
 * Devices are rediscovered on every availability check.
 */
class PwmFanMethod : public FloorEnforcingFanMethod {
public:
    static constexpr int kEnableManual = 1;
    static constexpr int kEnableAuto = 2;

    PwmFanMethod(std::filesystem::path sysfs_root, uint8_t min_percent, int priority = 0);

    [[nodiscard]] ControlMethodKind kind() const noexcept override {
        return ControlMethodKind::Pwm;
    }
    [[nodiscard]] int priority() const noexcept override { return priority_; }
    [[nodiscard]] bool is_available() override;

    [[nodiscard]] const std::vector<FanDevice>& devices() const noexcept { return devices_; }

protected:
    Result<void> apply_clamped(const FanDirective& directive) override;

private:
    std::filesystem::path sysfs_root_;
    int priority_;
    std::vector<FanDevice> devices_;
};

// ─────────────────────────────────────────────
// NvidiaSettingsFanMethod
// ─────────────────────────────────────────────

/**
 * @brief NVIDIA GPU fan through nvidia-settings attributes.
 */
class NvidiaSettingsFanMethod : public FloorEnforcingFanMethod {
public:
    NvidiaSettingsFanMethod(ICommandRunner& runner,
                            Duration timeout,
                            uint8_t min_percent,
                            uint32_t gpu_index = 0,
                            uint32_t fan_index = 0,
                            int priority = 1);

    [[nodiscard]] ControlMethodKind kind() const noexcept override {
        return ControlMethodKind::VendorGpu;
    }
    [[nodiscard]] int priority() const noexcept override { return priority_; }
    [[nodiscard]] bool is_available() override;

    [[nodiscard]] const FanDevice& device() const noexcept { return device_; }

protected:
    Result<void> apply_clamped(const FanDirective& directive) override;

private:
    ICommandRunner& runner_;
    Duration timeout_;
    uint32_t gpu_index_;
    int priority_;
    FanDevice device_;
};

}  // namespace thermal_guard
