/**
 * @file monitoring_daemon.hpp
 * @brief The sense → decide → act control loop.
 * @author Dimitris Kafetzis
 *
 * One cycle:
 *   1. poll the snapshot source
 *   2. advance the ThermalController
 *   3. apply the decided profile if it differs from the last fully applied
 *      one, if the GPU tier changed, or if the previous attempt failed. A hot
 *      GPU raises the fan directive to the fan of its own tier's profile
 *   4. append a SnapshotRecord to the snapshot log
 *   5. publish a DaemonStatus
 * run() repeats cycles until its stop_token is signalled, sleeping
 * interruptibly between them.
 *
 * Template-parameterized on SourceT so tests can script temperatures.
 */

#pragma once

#include "control/control_abstraction.hpp"
#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "daemon/status_channel.hpp"
#include "telemetry/snapshot_recorder.hpp"
#include "thermal/thermal_controller.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace thermal_guard {

struct DaemonOptions {
    Duration poll_interval{5000};
    Duration cycle_budget{10000};
    bool manage_fans{true};
    bool apply_controls{true};     ///< false: observe and record only
    double gpu_warning_c{75.0};
    double gpu_critical_c{85.0};
    double gpu_emergency_c{95.0};

    [[nodiscard]] static DaemonOptions from_config(const Config& config) {
        DaemonOptions opts;
        opts.poll_interval = Duration{config.daemon.poll_interval_ms};
        opts.cycle_budget = Duration{config.daemon.cycle_budget_ms};
        opts.manage_fans = config.daemon.auto_fan_control;
        opts.gpu_warning_c = config.thermal.gpu_warning_c;
        opts.gpu_critical_c = config.thermal.gpu_critical_c;
        opts.gpu_emergency_c = config.thermal.gpu_emergency_c;
        return opts;
    }
};

/// Notice emitted when a snapshot carries no usable CPU temperature.
inline constexpr std::string_view kSensorsUnavailableNotice =
    "sensors unavailable: no CPU temperature this cycle";

/// One-decimal temperature for alert text.
[[nodiscard]] inline std::string format_celsius(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f C", value);
    return buf;
}

/// GPU tier for `gpu_temp` against the configured GPU thresholds.
[[nodiscard]] inline ThermalZone gpu_zone_for(double gpu_temp,
                                              const DaemonOptions& opts) noexcept {
    if (gpu_temp >= opts.gpu_emergency_c) return ThermalZone::Emergency;
    if (gpu_temp >= opts.gpu_critical_c) return ThermalZone::Critical;
    if (gpu_temp >= opts.gpu_warning_c) return ThermalZone::Warning;
    return ThermalZone::Comfort;
}

/**
 * @brief Alerts for a zone escalation and for GPU temperature thresholds.
 *
 * Only escalations into Warning, Critical or Emergency raise an alert;
 * cooling down does not. GPU alerts repeat every cycle the GPU stays hot.
 */
[[nodiscard]] inline std::vector<std::string> collect_alerts(const ThermalDecision& decision,
                                                             std::optional<double> gpu_temp,
                                                             const DaemonOptions& opts) {
    std::vector<std::string> alerts;
    if (decision.transitioned && decision.zone > decision.previous
        && decision.zone != ThermalZone::Comfort) {
        std::string text = "CPU " + std::string(to_string(decision.zone)) + " zone entered";
        if (decision.temperature_c) text += " at " + format_celsius(*decision.temperature_c);
        alerts.push_back(std::move(text));
    }
    if (gpu_temp) {
        switch (gpu_zone_for(*gpu_temp, opts)) {
            case ThermalZone::Emergency:
                alerts.push_back("GPU EMERGENCY: " + format_celsius(*gpu_temp) + " (limit "
                                 + format_celsius(opts.gpu_emergency_c) + ")");
                break;
            case ThermalZone::Critical:
                alerts.push_back("GPU CRITICAL: " + format_celsius(*gpu_temp));
                break;
            case ThermalZone::Warning:
                alerts.push_back("GPU WARNING: " + format_celsius(*gpu_temp));
                break;
            case ThermalZone::Comfort:
                break;
        }
    }
    return alerts;
}

template <SnapshotSourceLike SourceT>
class MonitoringDaemon {
public:
    MonitoringDaemon(SourceT& source,
                     ThermalController& controller,
                     ControlAbstraction& control,
                     SnapshotRecorder& recorder,
                     StatusChannel& status,
                     Logger& logger,
                     DaemonOptions opts = {});

    MonitoringDaemon(const MonitoringDaemon&) = delete;
    MonitoringDaemon& operator=(const MonitoringDaemon&) = delete;

    /// Run one full cycle and return the status it published.
    std::shared_ptr<const DaemonStatus> run_cycle();

    /// Loop until `stop` is requested. Returns after the current cycle.
    void run(std::stop_token stop);

    [[nodiscard]] uint64_t cycles() const noexcept { return cycles_; }
    [[nodiscard]] std::optional<PowerProfile> applied_profile() const noexcept {
        return applied_profile_;
    }
    [[nodiscard]] ThermalZone gpu_zone() const noexcept { return gpu_zone_; }
    [[nodiscard]] const DaemonOptions& options() const noexcept { return opts_; }

private:
    bool should_apply(const ThermalDecision& decision) const noexcept;
    std::optional<FanDirective> gpu_fan_floor() const;

    SourceT& source_;
    ThermalController& controller_;
    ControlAbstraction& control_;
    SnapshotRecorder& recorder_;
    StatusChannel& status_;
    Logger& logger_;
    DaemonOptions opts_;

    uint64_t cycles_{0};
    std::optional<PowerProfile> applied_profile_;
    std::optional<ProfileApplication> last_application_;
    bool last_apply_failed_{false};
    ThermalZone gpu_zone_{ThermalZone::Comfort};          ///< Held while the GPU reading is missing
    ThermalZone applied_gpu_zone_{ThermalZone::Comfort};

    std::mutex sleep_mutex_;
    std::condition_variable_any sleep_cv_;
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <SnapshotSourceLike SourceT>
MonitoringDaemon<SourceT>::MonitoringDaemon(SourceT& source,
                                            ThermalController& controller,
                                            ControlAbstraction& control,
                                            SnapshotRecorder& recorder,
                                            StatusChannel& status,
                                            Logger& logger,
                                            DaemonOptions opts)
    : source_(source)
    , controller_(controller)
    , control_(control)
    , recorder_(recorder)
    , status_(status)
    , logger_(logger)
    , opts_(opts) {}

template <SnapshotSourceLike SourceT>
bool MonitoringDaemon<SourceT>::should_apply(const ThermalDecision& decision) const noexcept {
    if (!opts_.apply_controls) return false;
    if (decision.data_missing && !applied_profile_) return false;
    if (opts_.manage_fans && gpu_zone_ != applied_gpu_zone_) return true;
    return last_apply_failed_ || applied_profile_ != decision.profile;
}

template <SnapshotSourceLike SourceT>
std::optional<FanDirective> MonitoringDaemon<SourceT>::gpu_fan_floor() const {
    if (gpu_zone_ == ThermalZone::Comfort) return std::nullopt;
    return control_.profiles().at(profile_for(gpu_zone_)).fan;
}

template <SnapshotSourceLike SourceT>
std::shared_ptr<const DaemonStatus> MonitoringDaemon<SourceT>::run_cycle() {
    const auto started = std::chrono::steady_clock::now();
    ++cycles_;

    auto snapshot = source_.poll();
    if (!snapshot) snapshot = std::make_shared<const SensorSnapshot>();

    const auto decision = controller_.update(*snapshot);
    if (decision.transitioned) {
        logger_.info("thermal zone " + std::string(to_string(decision.previous)) + " -> "
                     + std::string(to_string(decision.zone))
                     + (decision.temperature_c
                            ? " at " + format_celsius(*decision.temperature_c)
                            : std::string{}));
    }

    auto record = make_snapshot_record(*snapshot, decision.temperature_c);
    if (record.gpu_temp) {
        const auto zone = gpu_zone_for(*record.gpu_temp, opts_);
        if (zone != gpu_zone_) {
            logger_.info("GPU tier " + std::string(to_string(gpu_zone_)) + " -> "
                         + std::string(to_string(zone)) + " at "
                         + format_celsius(*record.gpu_temp));
        }
        gpu_zone_ = zone;
    }

    if (should_apply(decision)) {
        auto app = control_.apply_profile(decision.profile, opts_.manage_fans, gpu_fan_floor());
        last_apply_failed_ = !app.fully_applied();
        if (!last_apply_failed_) {
            applied_profile_ = decision.profile;
            applied_gpu_zone_ = gpu_zone_;
        } else {
            logger_.warn("profile " + std::string(to_string(decision.profile))
                         + " not fully applied; retrying next cycle");
        }
        last_application_ = std::move(app);
    }

    record.alerts = collect_alerts(decision, record.gpu_temp, opts_);
    if (decision.data_missing) {
        record.notices.emplace_back(kSensorsUnavailableNotice);
        logger_.debug(std::string(kSensorsUnavailableNotice));
    }
    record.zone = decision.zone;
    record.profile = decision.profile;
    record.escalation_count = decision.escalation_count;
    recorder_.record(record);
    for (const auto& alert : record.alerts) logger_.warn(alert);

    auto status = std::make_shared<DaemonStatus>();
    status->cycle = cycles_;
    status->timestamp = snapshot->timestamp;
    status->decision = decision;
    status->snapshot = snapshot;
    status->applied_profile = applied_profile_;
    status->last_application = last_application_;
    status->alerts = std::move(record.alerts);
    status->notices = std::move(record.notices);
    std::shared_ptr<const DaemonStatus> published = std::move(status);
    status_.publish(published);

    const auto elapsed = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - started);
    if (elapsed > opts_.cycle_budget) {
        logger_.warn("cycle " + std::to_string(cycles_) + " took "
                     + std::to_string(elapsed.count()) + " ms, over budget of "
                     + std::to_string(opts_.cycle_budget.count()) + " ms");
    }
    return published;
}

template <SnapshotSourceLike SourceT>
void MonitoringDaemon<SourceT>::run(std::stop_token stop) {
    logger_.info("monitoring loop started: interval "
                 + std::to_string(opts_.poll_interval.count()) + " ms, fan control "
                 + (opts_.manage_fans ? "on" : "off"));

    while (!stop.stop_requested()) {
        run_cycle();
        recorder_.flush();

        std::unique_lock lock(sleep_mutex_);
        sleep_cv_.wait_for(lock, stop, opts_.poll_interval, [] { return false; });
    }

    logger_.info("monitoring loop stopped after " + std::to_string(cycles_) + " cycles");
}

}  // namespace thermal_guard
