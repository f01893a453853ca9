/**
 * @file aggregator.cpp
 * @brief SensorAggregator implementation.
 * @author Dimitris Kafetzis
 */

#include "sensors/aggregator.hpp"
#include "sensors/sysfs_backends.hpp"
#include "sensors/tool_backends.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <optional>
#include <set>
#include <utility>

namespace thermal_guard {

std::vector<SensorReading> merge_backend_readings(std::vector<BackendReadings> contributions) {
    std::stable_sort(contributions.begin(), contributions.end(),
        [](const BackendReadings& a, const BackendReadings& b) { return a.rank < b.rank; });

    std::vector<SensorReading> merged;
    std::set<std::pair<std::string, std::string>> seen;
    for (auto& contribution : contributions) {
        for (auto& reading : contribution.readings) {
            auto key = std::make_pair(reading.chip_id, reading.label);
            if (!seen.insert(std::move(key)).second) continue;
            merged.push_back(std::move(reading));
        }
    }
    return merged;
}

SensorAggregator::SensorAggregator(std::vector<std::unique_ptr<ISensorBackend>> backends,
                                   Logger& logger,
                                   Duration timeout,
                                   size_t worker_threads)
    : logger_(logger)
    , timeout_(timeout)
    , pool_(std::max<size_t>(worker_threads == 0 ? backends.size() : worker_threads, 1)) {
    slots_.reserve(backends.size());
    for (auto& backend : backends) {
        slots_.push_back({std::move(backend), std::make_shared<std::atomic<bool>>(false)});
    }
}

SensorAggregator::~SensorAggregator() = default;

std::shared_ptr<const SensorSnapshot> SensorAggregator::poll() {
    stats_ = PollStats{};
    const auto deadline = std::chrono::steady_clock::now() + timeout_;

    std::vector<std::optional<std::future<std::vector<SensorReading>>>> pending(slots_.size());
    for (size_t i = 0; i < slots_.size(); ++i) {
        auto& slot = slots_[i];
        if (slot.in_flight->exchange(true)) {
            ++stats_.skipped;
            logger_.debug("Backend " + std::string{slot.backend->name()}
                          + " still busy from a previous cycle; skipped");
            continue;
        }
        try {
            pending[i] = pool_.submit(
                [backend = slot.backend.get(), flag = slot.in_flight]() {
                    auto readings = backend->poll();
                    flag->store(false);
                    return readings;
                });
        } catch (const std::exception& e) {
            slot.in_flight->store(false);
            ++stats_.empty;
            logger_.warn("Could not schedule backend " + std::string{slot.backend->name()}
                         + ": " + e.what());
        }
    }

    std::vector<BackendReadings> contributions;
    contributions.reserve(slots_.size());
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (!pending[i]) continue;
        auto& future = *pending[i];
        const auto name = std::string{slots_[i].backend->name()};

        if (future.wait_until(deadline) != std::future_status::ready) {
            ++stats_.timed_out;
            logger_.debug("Backend " + name + " missed the "
                          + std::to_string(timeout_.count()) + "ms deadline");
            continue;
        }

        std::vector<SensorReading> readings;
        try {
            readings = future.get();
        } catch (const std::exception& e) {
            logger_.debug("Backend " + name + " failed: " + e.what());
        }

        if (readings.empty()) {
            ++stats_.empty;
            if (auto err = slots_[i].backend->last_error()) {
                logger_.debug("Backend " + name + " unavailable: " + *err);
            }
            continue;
        }
        ++stats_.ok;
        contributions.push_back({slots_[i].backend->scope_rank(), std::move(readings)});
    }

    auto snapshot = std::make_shared<SensorSnapshot>();
    snapshot->readings = merge_backend_readings(std::move(contributions));
    snapshot->timestamp = std::chrono::system_clock::now();
    stats_.readings = snapshot->readings.size();

    logger_.debug("Poll: " + std::to_string(stats_.ok) + " ok, "
                  + std::to_string(stats_.empty) + " empty, "
                  + std::to_string(stats_.timed_out) + " timed out, "
                  + std::to_string(stats_.skipped) + " skipped, "
                  + std::to_string(stats_.readings) + " readings");
    return snapshot;
}

// ─────────────────────────────────────────────
// Default backend set
// ─────────────────────────────────────────────

std::vector<std::unique_ptr<ISensorBackend>> make_default_backends(const SensorsConfig& config,
                                                                   ICommandRunner& runner) {
    const Duration timeout{config.backend_timeout_ms};
    std::vector<std::unique_ptr<ISensorBackend>> backends;
    if (config.enable_nvidia_smi) {
        backends.push_back(std::make_unique<NvidiaSmiBackend>(runner, timeout));
    }
    if (config.enable_hwmon) {
        backends.push_back(std::make_unique<HwmonBackend>(config.sysfs_root));
    }
    if (config.enable_lm_sensors) {
        backends.push_back(std::make_unique<LmSensorsBackend>(runner, timeout));
    }
    if (config.enable_acpi) {
        backends.push_back(std::make_unique<PowerSupplyBackend>(config.sysfs_root));
    }
    if (config.enable_thermal_zone) {
        backends.push_back(std::make_unique<ThermalZoneBackend>(config.sysfs_root));
    }
    return backends;
}

}  // namespace thermal_guard
