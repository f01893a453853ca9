/**
 * @file snapshot_recorder.hpp
 * @brief Per-cycle snapshot records and their NDJSON serialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace thermal_guard {

/**
 * @brief One line of the snapshot log.
 *
 * Absent sensors stay empty and are omitted from the serialized object.
 */
struct SnapshotRecord {
    Timestamp timestamp;
    std::optional<double> cpu_temp;
    std::optional<double> gpu_temp;
    std::optional<double> cpu_fan_rpm;
    std::optional<double> gpu_fan_rpm;
    std::optional<double> gpu_power;
    std::optional<double> cpu_power;
    std::vector<std::pair<std::string, double>> voltages;   ///< At most kMaxVoltages
    std::vector<std::string> alerts;
    std::vector<std::string> notices;
    ThermalZone zone{ThermalZone::Comfort};
    PowerProfile profile{PowerProfile::Performance};
    uint32_t escalation_count{0};

    static constexpr size_t kMaxVoltages = 5;
};

/// Whether `chip` belongs to a GPU (nvidia-gpuN, amdgpu, radeon, nouveau, i915, xe).
[[nodiscard]] bool is_gpu_chip(std::string_view chip) noexcept;

/**
 * @brief Fill the sensor fields of a record from a snapshot.
 *
 * `cpu_temp` is the controller's chosen temperature. GPU fields come from
 * GPU chips; the CPU fan is the first non-GPU fan labelled "cpu" or
 * "fan1", else the first non-GPU fan; the CPU power is the first power
 * reading labelled "package" or "cpu".
 */
[[nodiscard]] SnapshotRecord make_snapshot_record(const SensorSnapshot& snapshot,
                                                  std::optional<double> cpu_temp);

/// One JSON object, no trailing newline.
[[nodiscard]] std::string to_json(const SnapshotRecord& record);

/**
 * @brief Appends snapshot records to a sink as NDJSON.
 */
class SnapshotRecorder {
public:
    explicit SnapshotRecorder(std::unique_ptr<ILogSink> sink);

    void record(const SnapshotRecord& record);
    void flush();

    [[nodiscard]] uint64_t records_written() const noexcept { return written_; }

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
    uint64_t written_{0};
};

}  // namespace thermal_guard
