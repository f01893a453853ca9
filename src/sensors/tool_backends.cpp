/**
 * @file tool_backends.cpp
 * @brief lm-sensors and nvidia-smi output parsers.
 * @author Dimitris Kafetzis
 */

#include "sensors/tool_backends.hpp"
#include "platform/sysfs.hpp"

#include <sstream>

namespace thermal_guard {

namespace {

std::optional<double> parse_number(std::string_view text, size_t* consumed = nullptr) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;
    try {
        size_t idx = 0;
        double v = std::stod(s, &idx);
        if (consumed) *consumed = idx;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool is_na(std::string_view field) {
    auto t = trim(field);
    return t.empty() || t == "N/A" || t == "[N/A]" || t == "[Not Supported]";
}

/// lm-sensors uses hwmon-style labels for unlabeled channels (fan1, in0).
std::optional<SensorType> type_from_label(std::string_view label) {
    if (label.starts_with("temp")) return SensorType::Temperature;
    if (label.starts_with("fan")) return SensorType::FanRpm;
    if (label.starts_with("in")) return SensorType::Voltage;
    if (label.starts_with("power")) return SensorType::Power;
    if (label.starts_with("curr")) return SensorType::Current;
    return std::nullopt;
}

/// Classify by unit suffix; returns the multiplier to base units.
std::optional<std::pair<SensorType, double>> type_from_unit(std::string_view unit) {
    if (unit.ends_with("RPM")) return std::make_pair(SensorType::FanRpm, 1.0);
    if (unit.ends_with("C")) return std::make_pair(SensorType::Temperature, 1.0);
    if (unit == "mV") return std::make_pair(SensorType::Voltage, 0.001);
    if (unit == "V") return std::make_pair(SensorType::Voltage, 1.0);
    if (unit == "mW") return std::make_pair(SensorType::Power, 0.001);
    if (unit == "W") return std::make_pair(SensorType::Power, 1.0);
    if (unit == "mA") return std::make_pair(SensorType::Current, 0.001);
    if (unit == "A") return std::make_pair(SensorType::Current, 1.0);
    return std::nullopt;
}

std::vector<std::string> split_csv(std::string_view line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream iss{std::string{line}};
    while (std::getline(iss, field, ',')) {
        fields.push_back(trim(field));
    }
    return fields;
}

}  // namespace

// ─────────────────────────────────────────────
// LmSensorsBackend
// ─────────────────────────────────────────────

LmSensorsBackend::LmSensorsBackend(ICommandRunner& runner, Duration timeout)
    : runner_(runner), timeout_(timeout) {}

std::vector<SensorReading> LmSensorsBackend::parse(std::string_view text) {
    std::vector<SensorReading> readings;
    std::string chip;
    std::istringstream iss{std::string{text}};
    std::string line;

    while (std::getline(iss, line)) {
        if (trim(line).empty()) {
            chip.clear();
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            if (chip.empty()) {
                auto raw = trim(line);
                chip = raw.substr(0, raw.find('-'));
            }
            continue;
        }
        if (chip.empty()) continue;

        auto label = trim(std::string_view{line}.substr(0, colon));
        if (label == "Adapter") continue;

        // Value is everything after the colon up to the limits in parentheses.
        auto rest = std::string_view{line}.substr(colon + 1);
        rest = rest.substr(0, rest.find('('));
        auto value_text = trim(rest);

        SensorReading r;
        r.chip_id = chip;
        r.label = label;

        if (is_na(value_text)) {
            auto type = type_from_label(label);
            if (!type) continue;
            r.type = *type;
            readings.push_back(std::move(r));
            continue;
        }

        size_t consumed = 0;
        auto number = parse_number(value_text, &consumed);
        if (!number) continue;
        auto unit = trim(std::string_view{value_text}.substr(consumed));
        auto typed = type_from_unit(unit);
        if (!typed) continue;

        r.type = typed->first;
        r.value = *number * typed->second;
        readings.push_back(std::move(r));
    }
    return readings;
}

Result<std::vector<SensorReading>> LmSensorsBackend::collect() {
    auto out = runner_.run({"sensors", "-A"}, timeout_);
    if (!out) return out.error();
    if (!out->ok()) {
        return Error{ErrorCode::BackendUnavailable,
                     "sensors exited with status " + std::to_string(out->exit_code)};
    }
    return parse(out->stdout_text);
}

// ─────────────────────────────────────────────
// NvidiaSmiBackend
// ─────────────────────────────────────────────

NvidiaSmiBackend::NvidiaSmiBackend(ICommandRunner& runner, Duration timeout)
    : runner_(runner), timeout_(timeout) {}

std::vector<SensorReading> NvidiaSmiBackend::parse(std::string_view text) {
    std::vector<SensorReading> readings;
    std::istringstream iss{std::string{text}};
    std::string line;

    while (std::getline(iss, line)) {
        auto fields = split_csv(line);
        if (fields.size() < 4) continue;
        auto index = parse_number(fields[0]);
        if (!index) continue;

        const auto chip = "nvidia-gpu" + std::to_string(static_cast<int>(*index));
        auto add = [&](SensorType type, std::string label, const std::string& field) {
            SensorReading r;
            r.type = type;
            r.chip_id = chip;
            r.label = std::move(label);
            if (!is_na(field)) r.value = parse_number(field);
            readings.push_back(std::move(r));
        };
        add(SensorType::Temperature, "GPU Core", fields[1]);
        add(SensorType::Power, "GPU Power", fields[2]);
        add(SensorType::Power, "GPU Power Limit", fields[3]);
    }
    return readings;
}

Result<std::vector<SensorReading>> NvidiaSmiBackend::collect() {
    auto out = runner_.run({"nvidia-smi", std::string{kQuery},
                            "--format=csv,noheader,nounits"}, timeout_);
    if (!out) return out.error();
    if (!out->ok()) {
        return Error{ErrorCode::BackendUnavailable,
                     "nvidia-smi exited with status " + std::to_string(out->exit_code)};
    }
    return parse(out->stdout_text);
}

}  // namespace thermal_guard
