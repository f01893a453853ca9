/**
 * @file aggregator.hpp
 * @brief Concurrent multi-backend polling and (chip, label) deduplication.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/worker_pool.hpp"
#include "platform/command_runner.hpp"
#include "sensors/backend.hpp"

#include <atomic>
#include <memory>
#include <vector>

namespace thermal_guard {

/// Outcome counts for one poll cycle, for logging.
struct PollStats {
    size_t ok{0};          ///< Returned at least one reading
    size_t empty{0};       ///< Returned nothing (unavailable or failed)
    size_t timed_out{0};   ///< Missed the shared deadline
    size_t skipped{0};     ///< Previous poll still running
    size_t readings{0};    ///< Readings after deduplication
};

/// One backend's contribution, in registration order.
struct BackendReadings {
    ScopeRank rank{ScopeRank::ThermalZone};
    std::vector<SensorReading> readings;
};

/**
 * @brief Merge backend outputs into one ordered list.
 *
 * Contributions are ordered by scope rank, then by their position in the
 * input (the fixed backend priority list). For each (chip, label) only the
 * first reading in that order is kept.
 */
[[nodiscard]] std::vector<SensorReading> merge_backend_readings(
    std::vector<BackendReadings> contributions);

/**
 * @brief Polls every backend concurrently and builds the cycle's snapshot.
 *
 * All backends share one deadline per cycle. Backends that miss it are
 * dropped from that snapshot; a backend whose previous poll is still
 * running is skipped rather than queued a second time. Satisfies
 * SnapshotSourceLike.
 */
class SensorAggregator {
public:
    /// `worker_threads` 0 means one worker per backend.
    SensorAggregator(std::vector<std::unique_ptr<ISensorBackend>> backends,
                     Logger& logger,
                     Duration timeout,
                     size_t worker_threads = 0);
    ~SensorAggregator();

    SensorAggregator(const SensorAggregator&) = delete;
    SensorAggregator& operator=(const SensorAggregator&) = delete;

    /// Never throws; may return an empty snapshot.
    std::shared_ptr<const SensorSnapshot> poll();

    [[nodiscard]] const PollStats& last_stats() const noexcept { return stats_; }
    [[nodiscard]] size_t backend_count() const noexcept { return slots_.size(); }
    [[nodiscard]] Duration timeout() const noexcept { return timeout_; }

private:
    struct Slot {
        std::unique_ptr<ISensorBackend> backend;
        std::shared_ptr<std::atomic<bool>> in_flight;
    };

    std::vector<Slot> slots_;
    Logger& logger_;
    Duration timeout_;
    PollStats stats_;
    WorkerPool pool_;   // declared last: joins in-flight polls before slots_ is destroyed
};

static_assert(SnapshotSourceLike<SensorAggregator>);

/**
 * @brief The enabled backends in fixed priority order:
 *        nvidia_smi, hwmon, lm_sensors, acpi, thermal_zone.
 */
[[nodiscard]] std::vector<std::unique_ptr<ISensorBackend>> make_default_backends(
    const SensorsConfig& config, ICommandRunner& runner);

}  // namespace thermal_guard
