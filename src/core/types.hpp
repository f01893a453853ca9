/**
 * @file types.hpp
 * @brief Fundamental types used throughout ThermalGuard.
 * @author Dimitris Kafetzis
 *
 * Defines the sensor, hardware-profile and thermal-state vocabulary shared
 * by every module. All types are plain values; snapshots and profiles are
 * immutable once built and shared through std::shared_ptr<const T>.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <compare>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace thermal_guard {

// ─────────────────────────────────────────────
// Time Types
// ─────────────────────────────────────────────

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Sensor Readings
// ─────────────────────────────────────────────

enum class SensorType : uint8_t {
    Temperature,   ///< °C
    FanRpm,        ///< revolutions per minute
    Voltage,       ///< V
    Power,         ///< W
    Current        ///< A
};

[[nodiscard]] constexpr std::string_view to_string(SensorType type) noexcept {
    switch (type) {
        case SensorType::Temperature: return "temperature";
        case SensorType::FanRpm:      return "fan_rpm";
        case SensorType::Voltage:     return "voltage";
        case SensorType::Power:       return "power";
        case SensorType::Current:     return "current";
    }
    return "unknown";
}

/**
 * @brief A single typed value from one sensor backend.
 *
 * An unreadable sensor carries an empty value. It is never coerced to 0.
 */
struct SensorReading {
    SensorType type{SensorType::Temperature};
    std::string label;
    std::optional<double> value;
    std::string chip_id;     ///< Hardware group, e.g. "coretemp", "nvidia-gpu0"
    std::string backend;     ///< Provenance: name of the backend that produced it
};

/**
 * @brief The merged result of one poll cycle.
 *
 * Built by the SensorAggregator and never mutated afterwards. A snapshot
 * with no readings is valid.
 */
struct SensorSnapshot {
    std::vector<SensorReading> readings;
    Timestamp timestamp;

    [[nodiscard]] bool empty() const noexcept { return readings.empty(); }
    [[nodiscard]] size_t size() const noexcept { return readings.size(); }

    [[nodiscard]] std::vector<const SensorReading*> by_type(SensorType type) const {
        std::vector<const SensorReading*> out;
        for (const auto& r : readings) {
            if (r.type == type) out.push_back(&r);
        }
        return out;
    }

    [[nodiscard]] const SensorReading* find(std::string_view chip,
                                            std::string_view label) const {
        auto it = std::find_if(readings.begin(), readings.end(),
            [&](const SensorReading& r) { return r.chip_id == chip && r.label == label; });
        return it == readings.end() ? nullptr : &*it;
    }
};

// ─────────────────────────────────────────────
// Hardware Identity
// ─────────────────────────────────────────────

enum class CpuVendor : uint8_t { Unknown, Intel, Amd };

/// Ordered roughly by age within each vendor.
enum class CpuGeneration : uint8_t {
    Unknown,
    Core2,
    Nehalem,
    SandyBridge,
    IvyBridge,
    Haswell,
    Broadwell,
    SkylakePlus,
    K8,
    K10,
    Bulldozer,
    Zen
};

enum class GpuVendor : uint8_t { None, Nvidia, Amd, Intel };

[[nodiscard]] constexpr std::string_view to_string(CpuVendor vendor) noexcept {
    switch (vendor) {
        case CpuVendor::Unknown: return "unknown";
        case CpuVendor::Intel:   return "intel";
        case CpuVendor::Amd:     return "amd";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(CpuGeneration gen) noexcept {
    switch (gen) {
        case CpuGeneration::Unknown:     return "unknown";
        case CpuGeneration::Core2:       return "core2";
        case CpuGeneration::Nehalem:     return "nehalem";
        case CpuGeneration::SandyBridge: return "sandy_bridge";
        case CpuGeneration::IvyBridge:   return "ivy_bridge";
        case CpuGeneration::Haswell:     return "haswell";
        case CpuGeneration::Broadwell:   return "broadwell";
        case CpuGeneration::SkylakePlus: return "skylake_plus";
        case CpuGeneration::K8:          return "k8";
        case CpuGeneration::K10:         return "k10";
        case CpuGeneration::Bulldozer:   return "bulldozer";
        case CpuGeneration::Zen:         return "zen";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(GpuVendor vendor) noexcept {
    switch (vendor) {
        case GpuVendor::None:   return "none";
        case GpuVendor::Nvidia: return "nvidia";
        case GpuVendor::Amd:    return "amd";
        case GpuVendor::Intel:  return "intel";
    }
    return "none";
}

// ─────────────────────────────────────────────
// Control Methods
// ─────────────────────────────────────────────

enum class ControlMethodKind : uint8_t {
    // Frequency axis
    GovernorScaling,
    DirectRegister,
    VendorTool,
    BootParameterFallback,
    // Fan axis
    Pwm,
    VendorGpu,
    // GPU power axis
    DrmPowerLevel,
    RadeonPowerProfile,
    // Firmware platform profile axis
    PlatformProfile
};

[[nodiscard]] constexpr std::string_view to_string(ControlMethodKind kind) noexcept {
    switch (kind) {
        case ControlMethodKind::GovernorScaling:       return "governor_scaling";
        case ControlMethodKind::DirectRegister:        return "direct_register";
        case ControlMethodKind::VendorTool:            return "vendor_tool";
        case ControlMethodKind::BootParameterFallback: return "boot_parameter_fallback";
        case ControlMethodKind::Pwm:                   return "pwm";
        case ControlMethodKind::VendorGpu:             return "vendor_gpu";
        case ControlMethodKind::DrmPowerLevel:         return "drm_power_level";
        case ControlMethodKind::RadeonPowerProfile:    return "radeon_power_profile";
        case ControlMethodKind::PlatformProfile:       return "platform_profile";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Hardware Profile
// ─────────────────────────────────────────────

/**
 * @brief Zone entry temperatures in °C.
 *
 * `comfort` is the preferred operating ceiling. Reaching `warning`,
 * `critical` or `emergency` enters the zone of the same name.
 */
struct ThermalLimits {
    double comfort{55.0};
    double warning{65.0};
    double critical{75.0};
    double emergency{85.0};

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        return comfort > 0.0 && comfort < warning && warning < critical
            && critical < emergency;
    }

    auto operator<=>(const ThermalLimits&) const = default;
};

/**
 * @brief Static capabilities of the machine, detected once at startup.
 *
 * Immutable after detection; shared read-only with every component.
 */
struct HardwareProfile {
    CpuVendor cpu_vendor{CpuVendor::Unknown};
    std::string cpu_model;
    CpuGeneration cpu_generation{CpuGeneration::Unknown};
    uint32_t core_count{1};

    uint32_t freq_min_khz{800'000};
    uint32_t freq_max_khz{3'000'000};
    std::vector<uint32_t> supported_frequencies_khz;   ///< Ascending; empty = continuous

    double tjmax_c{70.0};
    ThermalLimits thermal_limits;

    std::vector<ControlMethodKind> available_freq_methods;  ///< In preference order

    GpuVendor gpu_vendor{GpuVendor::None};
    std::optional<std::filesystem::path> gpu_device_path;
    std::string gpu_model;                 ///< From lspci when the DRM scan found nothing
    bool gpu_power_profile{false};         ///< Legacy radeon device/power_profile present
    bool gpu_power_cap{false};             ///< device/hwmon/hwmon*/power1_cap present

    bool used_defaults{false};   ///< Some part of detection fell back

    [[nodiscard]] bool has_method(ControlMethodKind kind) const noexcept {
        return std::find(available_freq_methods.begin(), available_freq_methods.end(), kind)
               != available_freq_methods.end();
    }
};

// ─────────────────────────────────────────────
// Thermal State & Power Profiles
// ─────────────────────────────────────────────

enum class ThermalZone : uint8_t {
    Comfort,
    Warning,
    Critical,
    Emergency
};

enum class PowerProfile : uint8_t {
    Performance,
    Balanced,
    PowerSave,
    Emergency
};

[[nodiscard]] constexpr std::string_view to_string(ThermalZone zone) noexcept {
    switch (zone) {
        case ThermalZone::Comfort:   return "comfort";
        case ThermalZone::Warning:   return "warning";
        case ThermalZone::Critical:  return "critical";
        case ThermalZone::Emergency: return "emergency";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(PowerProfile profile) noexcept {
    switch (profile) {
        case PowerProfile::Performance: return "performance";
        case PowerProfile::Balanced:    return "balanced";
        case PowerProfile::PowerSave:   return "powersave";
        case PowerProfile::Emergency:   return "emergency";
    }
    return "unknown";
}

/**
 * @brief Fan target: either hand control to firmware or run at a percentage.
 */
struct FanDirective {
    bool automatic{true};
    uint8_t percent{0};

    [[nodiscard]] static constexpr FanDirective auto_mode() noexcept { return {true, 0}; }
    [[nodiscard]] static constexpr FanDirective manual(uint8_t pct) noexcept {
        return {false, static_cast<uint8_t>(pct > 100 ? 100 : pct)};
    }

    auto operator<=>(const FanDirective&) const = default;
};

/**
 * @brief Process-priority advice published for an external collaborator.
 *
 * ThermalGuard never renices or pins processes itself.
 */
struct PriorityRecommendation {
    int nice{0};
    std::optional<uint32_t> max_cores;   ///< Restrict heavy work to this many cores

    auto operator<=>(const PriorityRecommendation&) const = default;
};

/**
 * @brief Escalation state owned by the ThermalController.
 */
struct ThermalState {
    ThermalZone zone{ThermalZone::Comfort};
    uint32_t escalation_count{0};
    Timestamp last_transition_at{};
    std::optional<double> last_temperature_c;
    uint64_t cycles{0};
};

}  // namespace thermal_guard
