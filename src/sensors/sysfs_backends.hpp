/**
 * @file sysfs_backends.hpp
 * @brief Sensor backends that read kernel pseudo-filesystems directly.
 * @author Dimitris Kafetzis
 *
 *   HwmonBackend          /sys/class/hwmon/hwmon* /{temp,fan,in,power,curr}N_input
 *   PowerSupplyBackend    /sys/class/power_supply/* /{voltage,current,power}_now
 *   ThermalZoneBackend    /sys/class/thermal/thermal_zone* /{type,temp}
 */

#pragma once

#include "sensors/backend.hpp"

#include <filesystem>

namespace thermal_guard {

/**
 * @brief Kernel hardware-monitoring tree.
 *
 * Chip id is the hwmon `name` attribute (directory name if absent); label
 * is `<kind>N_label` or `<kind>N`. Units are converted from milli/micro
 * to base units.
 */
class HwmonBackend : public ISensorBackend {
public:
    explicit HwmonBackend(std::filesystem::path sysfs_root = "/sys");

    [[nodiscard]] std::string_view name() const noexcept override { return "hwmon"; }
    [[nodiscard]] ScopeRank scope_rank() const noexcept override { return ScopeRank::Hwmon; }

protected:
    Result<std::vector<SensorReading>> collect() override;

private:
    std::filesystem::path root_;
};

/**
 * @brief Platform/ACPI battery and adapter telemetry, chip id "acpi".
 */
class PowerSupplyBackend : public ISensorBackend {
public:
    explicit PowerSupplyBackend(std::filesystem::path sysfs_root = "/sys");

    [[nodiscard]] std::string_view name() const noexcept override { return "acpi"; }
    [[nodiscard]] ScopeRank scope_rank() const noexcept override {
        return ScopeRank::PlatformPower;
    }

protected:
    Result<std::vector<SensorReading>> collect() override;

private:
    std::filesystem::path root_;
};

/**
 * @brief Generic kernel thermal zones. Chip id is the zone type.
 */
class ThermalZoneBackend : public ISensorBackend {
public:
    explicit ThermalZoneBackend(std::filesystem::path sysfs_root = "/sys");

    [[nodiscard]] std::string_view name() const noexcept override { return "thermal_zone"; }
    [[nodiscard]] ScopeRank scope_rank() const noexcept override {
        return ScopeRank::ThermalZone;
    }

protected:
    Result<std::vector<SensorReading>> collect() override;

private:
    std::filesystem::path root_;
};

}  // namespace thermal_guard
