/**
 * @file sysfs_backends.cpp
 * @brief hwmon, power_supply and thermal_zone readers.
 * @author Dimitris Kafetzis
 */

#include "sensors/sysfs_backends.hpp"
#include "platform/sysfs.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <regex>
#include <tuple>

namespace thermal_guard {

namespace fs = std::filesystem;

namespace {

struct HwmonKind {
    std::string_view prefix;
    SensorType type;
    double scale;   ///< Divisor from sysfs units to base units
};

constexpr std::array<HwmonKind, 5> kHwmonKinds{{
    {"temp", SensorType::Temperature, 1000.0},       // millidegree C
    {"fan", SensorType::FanRpm, 1.0},                // RPM
    {"in", SensorType::Voltage, 1000.0},             // mV
    {"power", SensorType::Power, 1'000'000.0},       // uW
    {"curr", SensorType::Current, 1000.0},           // mA
}};

std::optional<double> read_scaled(const fs::path& path, double scale) {
    auto raw = read_integer(path);
    if (!raw) return std::nullopt;
    return static_cast<double>(*raw) / scale;
}

}  // namespace

// ─────────────────────────────────────────────
// HwmonBackend
// ─────────────────────────────────────────────

HwmonBackend::HwmonBackend(fs::path sysfs_root) : root_(std::move(sysfs_root)) {}

Result<std::vector<SensorReading>> HwmonBackend::collect() {
    const auto hwmon_root = root_ / "class/hwmon";
    if (!path_exists(hwmon_root)) {
        return Error{ErrorCode::BackendUnavailable, hwmon_root.string() + " missing"};
    }

    static const std::regex attr_re(R"(^(temp|fan|in|power|curr)(\d+)_(input|average)$)");

    std::vector<SensorReading> readings;
    for (const auto& dir : list_entries(hwmon_root, "hwmon")) {
        auto chip = read_first_line(dir / "name").value_or(dir.filename().string());
        if (chip.empty()) chip = dir.filename().string();

        // (kind index, channel) -> attribute path; prefer _input over _average
        std::map<std::pair<size_t, uint32_t>, fs::path> channels;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            const auto fname = entry.path().filename().string();
            std::smatch m;
            if (!std::regex_match(fname, m, attr_re)) continue;

            auto kind_it = std::find_if(kHwmonKinds.begin(), kHwmonKinds.end(),
                [&](const HwmonKind& k) { return k.prefix == m[1].str(); });
            auto index = static_cast<size_t>(kind_it - kHwmonKinds.begin());
            auto channel = static_cast<uint32_t>(std::stoul(m[2].str()));
            auto key = std::make_pair(index, channel);

            if (m[3] == "input" || channels.find(key) == channels.end()) {
                channels[key] = entry.path();
            }
        }

        for (const auto& [key, path] : channels) {
            const auto& kind = kHwmonKinds[key.first];
            const auto base = std::string{kind.prefix} + std::to_string(key.second);

            SensorReading r;
            r.type = kind.type;
            r.chip_id = chip;
            r.label = read_first_line(dir / (base + "_label")).value_or(base);
            if (r.label.empty()) r.label = base;
            r.value = read_scaled(path, kind.scale);
            readings.push_back(std::move(r));
        }
    }
    return readings;
}

// ─────────────────────────────────────────────
// PowerSupplyBackend
// ─────────────────────────────────────────────

PowerSupplyBackend::PowerSupplyBackend(fs::path sysfs_root) : root_(std::move(sysfs_root)) {}

Result<std::vector<SensorReading>> PowerSupplyBackend::collect() {
    const auto supply_root = root_ / "class/power_supply";
    if (!path_exists(supply_root)) {
        return Error{ErrorCode::BackendUnavailable, supply_root.string() + " missing"};
    }

    struct Attr {
        std::string_view file;
        std::string_view suffix;
        SensorType type;
    };
    constexpr std::array<Attr, 3> attrs{{
        {"voltage_now", "voltage", SensorType::Voltage},
        {"current_now", "current", SensorType::Current},
        {"power_now", "power", SensorType::Power},
    }};

    std::vector<SensorReading> readings;
    for (const auto& supply : list_entries(supply_root, "")) {
        const auto supply_name = supply.filename().string();
        for (const auto& attr : attrs) {
            const auto path = supply / std::string{attr.file};
            if (!path_exists(path)) continue;

            SensorReading r;
            r.type = attr.type;
            r.chip_id = "acpi";
            r.label = supply_name + " " + std::string{attr.suffix};
            r.value = read_scaled(path, 1'000'000.0);   // uV, uA, uW
            readings.push_back(std::move(r));
        }
    }
    return readings;
}

// ─────────────────────────────────────────────
// ThermalZoneBackend
// ─────────────────────────────────────────────

ThermalZoneBackend::ThermalZoneBackend(fs::path sysfs_root) : root_(std::move(sysfs_root)) {}

Result<std::vector<SensorReading>> ThermalZoneBackend::collect() {
    const auto zone_root = root_ / "class/thermal";
    if (!path_exists(zone_root)) {
        return Error{ErrorCode::BackendUnavailable, zone_root.string() + " missing"};
    }

    std::vector<SensorReading> readings;
    for (const auto& zone : list_entries(zone_root, "thermal_zone")) {
        SensorReading r;
        r.type = SensorType::Temperature;
        r.chip_id = read_first_line(zone / "type").value_or("thermal_zone");
        if (r.chip_id.empty()) r.chip_id = "thermal_zone";
        r.label = zone.filename().string();
        r.value = read_scaled(zone / "temp", 1000.0);
        readings.push_back(std::move(r));
    }
    return readings;
}

}  // namespace thermal_guard
