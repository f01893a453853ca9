/**
 * @file snapshot_recorder.cpp
 * @brief SnapshotRecorder implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/snapshot_recorder.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace thermal_guard {

namespace {

bool contains_icase(std::string_view haystack, std::string_view needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a))
                == std::tolower(static_cast<unsigned char>(b));
        });
    return it != haystack.end();
}

const SensorReading* first_where(const SensorSnapshot& snapshot, SensorType type,
                                 bool gpu, auto&& pred) {
    for (const auto& r : snapshot.readings) {
        if (r.type != type || !r.value || is_gpu_chip(r.chip_id) != gpu) continue;
        if (pred(r)) return &r;
    }
    return nullptr;
}

std::optional<double> value_of(const SensorReading* r) {
    return r ? r->value : std::nullopt;
}

void write_optional(std::ostringstream& oss, std::string_view key,
                    const std::optional<double>& value) {
    if (value) oss << ",\"" << key << "\":" << *value;
}

void write_strings(std::ostringstream& oss, std::string_view key,
                   const std::vector<std::string>& items) {
    oss << ",\"" << key << "\":[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << ',';
        oss << '"' << json_escape(items[i]) << '"';
    }
    oss << ']';
}

}  // namespace

bool is_gpu_chip(std::string_view chip) noexcept {
    static constexpr std::array<std::string_view, 6> kPrefixes = {
        "nvidia", "amdgpu", "radeon", "nouveau", "i915", "xe"};
    return std::any_of(kPrefixes.begin(), kPrefixes.end(),
                       [&](std::string_view p) { return chip.starts_with(p); });
}

SnapshotRecord make_snapshot_record(const SensorSnapshot& snapshot,
                                    std::optional<double> cpu_temp) {
    SnapshotRecord rec;
    rec.timestamp = snapshot.timestamp;
    rec.cpu_temp = cpu_temp;

    auto any = [](const SensorReading&) { return true; };

    rec.gpu_temp = value_of(first_where(snapshot, SensorType::Temperature, true, any));
    rec.gpu_fan_rpm = value_of(first_where(snapshot, SensorType::FanRpm, true, any));
    rec.gpu_power = value_of(first_where(snapshot, SensorType::Power, true,
        [](const SensorReading& r) { return !contains_icase(r.label, "limit"); }));

    const auto* cpu_fan = first_where(snapshot, SensorType::FanRpm, false,
        [](const SensorReading& r) {
            return contains_icase(r.label, "cpu") || contains_icase(r.label, "fan1");
        });
    if (!cpu_fan) cpu_fan = first_where(snapshot, SensorType::FanRpm, false, any);
    rec.cpu_fan_rpm = value_of(cpu_fan);

    rec.cpu_power = value_of(first_where(snapshot, SensorType::Power, false,
        [](const SensorReading& r) {
            return contains_icase(r.label, "package") || contains_icase(r.label, "cpu");
        }));

    for (const auto& r : snapshot.readings) {
        if (rec.voltages.size() >= SnapshotRecord::kMaxVoltages) break;
        if (r.type != SensorType::Voltage || !r.value) continue;
        auto key = r.label;
        auto taken = [&](const std::string& k) {
            return std::any_of(rec.voltages.begin(), rec.voltages.end(),
                               [&](const auto& kv) { return kv.first == k; });
        };
        if (taken(key)) key = r.chip_id + "/" + r.label;
        rec.voltages.emplace_back(std::move(key), *r.value);
    }
    return rec;
}

std::string to_json(const SnapshotRecord& record) {
    std::ostringstream oss;
    oss << R"({"timestamp":")" << format_iso8601(record.timestamp) << '"';
    write_optional(oss, "cpu_temp", record.cpu_temp);
    write_optional(oss, "gpu_temp", record.gpu_temp);
    write_optional(oss, "cpu_fan_rpm", record.cpu_fan_rpm);
    write_optional(oss, "gpu_fan_rpm", record.gpu_fan_rpm);
    write_optional(oss, "gpu_power", record.gpu_power);
    write_optional(oss, "cpu_power", record.cpu_power);

    oss << R"(,"voltages":{)";
    for (size_t i = 0; i < record.voltages.size(); ++i) {
        if (i > 0) oss << ',';
        oss << '"' << json_escape(record.voltages[i].first) << "\":"
            << record.voltages[i].second;
    }
    oss << '}';

    write_strings(oss, "alerts", record.alerts);
    oss << R"(,"zone":")" << to_string(record.zone) << '"'
        << R"(,"profile":")" << to_string(record.profile) << '"'
        << R"(,"escalation_count":)" << record.escalation_count;
    write_strings(oss, "notices", record.notices);
    oss << '}';
    return oss.str();
}

// ─────────────────────────────────────────────
// SnapshotRecorder
// ─────────────────────────────────────────────

SnapshotRecorder::SnapshotRecorder(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void SnapshotRecorder::record(const SnapshotRecord& record) {
    const auto line = to_json(record);
    std::lock_guard lock(write_mutex_);
    sink_->write(line);
    ++written_;
}

void SnapshotRecorder::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace thermal_guard
