/**
 * @file test_daemon.cpp
 * @brief Integration tests driving the full sense → decide → act loop.
 */

#include "control/control_abstraction.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "daemon/monitoring_daemon.hpp"
#include "daemon/status_channel.hpp"
#include "telemetry/snapshot_recorder.hpp"
#include "thermal/thermal_controller.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <thread>

using namespace thermal_guard;
using thermal_guard::testing::MemorySink;
using thermal_guard::testing::quiet_logger;

namespace {

/// One scripted cycle: CPU package temperature and optional GPU core temperature.
struct Sample {
    std::optional<double> cpu;
    std::optional<double> gpu;
};

class ScriptedSource {
public:
    explicit ScriptedSource(std::vector<Sample> samples)
        : samples_(samples.begin(), samples.end()) {}

    std::shared_ptr<const SensorSnapshot> poll() {
        std::lock_guard lock(mutex_);
        auto snapshot = std::make_shared<SensorSnapshot>();
        snapshot->timestamp = std::chrono::system_clock::now();
        Sample sample = last_;
        if (!samples_.empty()) {
            sample = samples_.front();
            samples_.pop_front();
            last_ = sample;
        }
        if (sample.cpu) {
            SensorReading r;
            r.type = SensorType::Temperature;
            r.chip_id = "coretemp";
            r.label = "Package id 0";
            r.value = sample.cpu;
            r.backend = "hwmon";
            snapshot->readings.push_back(r);
        }
        if (sample.gpu) {
            SensorReading r;
            r.type = SensorType::Temperature;
            r.chip_id = "nvidia-gpu0";
            r.label = "GPU Core";
            r.value = sample.gpu;
            r.backend = "nvidia_smi";
            snapshot->readings.push_back(r);
        }
        return snapshot;
    }

private:
    std::mutex mutex_;
    std::deque<Sample> samples_;
    Sample last_{40.0, std::nullopt};
};

static_assert(SnapshotSourceLike<ScriptedSource>);

using Script = std::vector<Sample>;

struct ApplyLog {
    std::vector<uint32_t> frequencies;
    std::vector<FanDirective> fans;
    int failures_left{0};
};

class RecordingFrequencyMethod : public FrequencyMethod {
public:
    explicit RecordingFrequencyMethod(std::shared_ptr<ApplyLog> log) : log_(std::move(log)) {}

    [[nodiscard]] ControlMethodKind kind() const noexcept override {
        return ControlMethodKind::GovernorScaling;
    }
    [[nodiscard]] int priority() const noexcept override { return 0; }
    [[nodiscard]] bool is_available() override { return true; }

    Result<void> apply(const FrequencyTarget& target) override {
        if (log_->failures_left > 0) {
            --log_->failures_left;
            return Error{ErrorCode::ControlFailed, "scaling_max_freq busy"};
        }
        log_->frequencies.push_back(target.khz);
        return {};
    }

private:
    std::shared_ptr<ApplyLog> log_;
};

class RecordingFanMethod : public FloorEnforcingFanMethod {
public:
    explicit RecordingFanMethod(std::shared_ptr<ApplyLog> log)
        : FloorEnforcingFanMethod(20), log_(std::move(log)) {}

    [[nodiscard]] ControlMethodKind kind() const noexcept override {
        return ControlMethodKind::Pwm;
    }
    [[nodiscard]] int priority() const noexcept override { return 0; }
    [[nodiscard]] bool is_available() override { return true; }

protected:
    Result<void> apply_clamped(const FanDirective& directive) override {
        log_->fans.push_back(directive);
        return {};
    }

private:
    std::shared_ptr<ApplyLog> log_;
};

class DaemonIntegration : public ::testing::Test {
protected:
    void SetUp() override {
        auto hw = std::make_shared<HardwareProfile>();
        hw->freq_min_khz = 800'000;
        hw->freq_max_khz = 3'000'000;
        hw->thermal_limits = {55.0, 65.0, 75.0, 85.0};
        hw->available_freq_methods = {ControlMethodKind::GovernorScaling};

        control_ = std::make_unique<ControlAbstraction>(hw, ProfileTable{}, quiet_logger());
        control_->frequency_axis().add_method(
            std::make_unique<RecordingFrequencyMethod>(log_));
        control_->fan_axis().add_method(std::make_unique<RecordingFanMethod>(log_));

        controller_ = std::make_unique<ThermalController>(hw->thermal_limits, 3.0, 12);
        recorder_ = std::make_unique<SnapshotRecorder>(std::make_unique<MemorySink>(lines_));
    }

    std::unique_ptr<MonitoringDaemon<ScriptedSource>> make_daemon(ScriptedSource& source,
                                                                 DaemonOptions opts = {}) {
        return std::make_unique<MonitoringDaemon<ScriptedSource>>(
            source, *controller_, *control_, *recorder_, status_, quiet_logger(), opts);
    }

    std::shared_ptr<ApplyLog> log_ = std::make_shared<ApplyLog>();
    std::shared_ptr<std::vector<std::string>> lines_ =
        std::make_shared<std::vector<std::string>>();
    std::unique_ptr<ControlAbstraction> control_;
    std::unique_ptr<ThermalController> controller_;
    std::unique_ptr<SnapshotRecorder> recorder_;
    StatusChannel status_{quiet_logger()};
};

}  // namespace

// ═══════════════════════════════════════════════
// Control loop scenarios
// ═══════════════════════════════════════════════

TEST_F(DaemonIntegration, HeatUpCoolDownAppliesOnlyOnChange) {
    ScriptedSource source(
        Script{{60.0}, {68.0}, {77.0}, {90.0}, {74.0}, {60.0}, {60.0}, {60.0}});
    auto daemon = make_daemon(source);

    const std::vector<ThermalZone> zones{
        ThermalZone::Comfort,   ThermalZone::Warning,  ThermalZone::Critical,
        ThermalZone::Emergency, ThermalZone::Emergency, ThermalZone::Critical,
        ThermalZone::Warning,   ThermalZone::Comfort};
    std::vector<std::vector<std::string>> alerts;
    for (size_t i = 0; i < zones.size(); ++i) {
        auto status = daemon->run_cycle();
        EXPECT_EQ(status->decision.zone, zones[i]) << "cycle " << i;
        EXPECT_EQ(status->applied_profile, profile_for(zones[i])) << "cycle " << i;
        EXPECT_EQ(status->cycle, i + 1);
        alerts.push_back(status->alerts);
    }

    EXPECT_EQ(log_->frequencies, (std::vector<uint32_t>{
        3'000'000, 2'400'000, 1'800'000, 800'000, 1'800'000, 2'400'000, 3'000'000}));
    EXPECT_EQ(log_->fans.size(), 7u);
    EXPECT_EQ(log_->fans[3], FanDirective::manual(100));

    EXPECT_TRUE(alerts[0].empty());
    EXPECT_EQ(alerts[1], (std::vector<std::string>{"CPU warning zone entered at 68.0 C"}));
    EXPECT_EQ(alerts[2], (std::vector<std::string>{"CPU critical zone entered at 77.0 C"}));
    EXPECT_EQ(alerts[3], (std::vector<std::string>{"CPU emergency zone entered at 90.0 C"}));
    for (size_t i = 4; i < alerts.size(); ++i) EXPECT_TRUE(alerts[i].empty()) << "cycle " << i;

    ASSERT_EQ(lines_->size(), zones.size());
    EXPECT_NE(lines_->at(3).find(R"("zone":"emergency")"), std::string::npos);
    EXPECT_NE(lines_->at(3).find(R"("cpu_temp":90)"), std::string::npos);
    EXPECT_EQ(status_.publish_count(), zones.size());
    EXPECT_EQ(daemon->cycles(), zones.size());
}

TEST_F(DaemonIntegration, NoSensorsMeansNoActionAndNotices) {
    ScriptedSource source(Script{{}, {}, {}, {}, {}});
    auto daemon = make_daemon(source);

    for (int i = 0; i < 5; ++i) {
        auto status = daemon->run_cycle();
        EXPECT_EQ(status->decision.zone, ThermalZone::Comfort);
        EXPECT_TRUE(status->decision.data_missing);
        EXPECT_TRUE(status->alerts.empty());
        ASSERT_EQ(status->notices.size(), 1u);
        EXPECT_EQ(status->notices.front(), kSensorsUnavailableNotice);
        EXPECT_FALSE(status->applied_profile.has_value());
    }
    EXPECT_TRUE(log_->frequencies.empty());
    EXPECT_TRUE(log_->fans.empty());

    ASSERT_EQ(lines_->size(), 5u);
    EXPECT_EQ(lines_->front().find("cpu_temp"), std::string::npos);
    EXPECT_NE(lines_->front().find(std::string(kSensorsUnavailableNotice)), std::string::npos);
}

TEST_F(DaemonIntegration, SensorDropoutHoldsZoneWithoutReapplying) {
    ScriptedSource source(Script{{80.0}, {}, {}, {}});
    auto daemon = make_daemon(source);

    auto first = daemon->run_cycle();
    ASSERT_EQ(first->decision.zone, ThermalZone::Critical);
    ASSERT_EQ(log_->frequencies.size(), 1u);

    for (int i = 0; i < 3; ++i) {
        auto status = daemon->run_cycle();
        EXPECT_EQ(status->decision.zone, ThermalZone::Critical);
        EXPECT_EQ(status->decision.escalation_count, first->decision.escalation_count);
        EXPECT_TRUE(status->decision.data_missing);
    }
    EXPECT_EQ(log_->frequencies.size(), 1u);
    EXPECT_EQ(daemon->applied_profile(), PowerProfile::PowerSave);
}

TEST_F(DaemonIntegration, FailedApplyIsRetried) {
    log_->failures_left = 1;
    ScriptedSource source(Script{{70.0}, {70.0}, {70.0}});
    auto daemon = make_daemon(source);

    auto first = daemon->run_cycle();
    EXPECT_FALSE(first->applied_profile.has_value());
    ASSERT_TRUE(first->last_application.has_value());
    EXPECT_FALSE(first->last_application->fully_applied());

    auto second = daemon->run_cycle();
    EXPECT_EQ(second->applied_profile, PowerProfile::Balanced);
    EXPECT_EQ(log_->frequencies, (std::vector<uint32_t>{2'400'000}));

    daemon->run_cycle();
    EXPECT_EQ(log_->frequencies.size(), 1u);
}

TEST_F(DaemonIntegration, ObserveOnlyNeverTouchesHardware) {
    ScriptedSource source(Script{{90.0}, {60.0}});
    DaemonOptions opts;
    opts.apply_controls = false;
    auto daemon = make_daemon(source, opts);

    auto status = daemon->run_cycle();
    EXPECT_EQ(status->decision.zone, ThermalZone::Emergency);
    EXPECT_FALSE(status->last_application.has_value());
    daemon->run_cycle();
    EXPECT_TRUE(log_->frequencies.empty());
    EXPECT_TRUE(log_->fans.empty());
}

TEST_F(DaemonIntegration, UnmanagedFansAreLeftAlone) {
    ScriptedSource source(Script{{70.0}});
    DaemonOptions opts;
    opts.manage_fans = false;
    auto daemon = make_daemon(source, opts);

    auto status = daemon->run_cycle();
    EXPECT_EQ(status->applied_profile, PowerProfile::Balanced);
    EXPECT_EQ(log_->frequencies.size(), 1u);
    EXPECT_TRUE(log_->fans.empty());
}

TEST_F(DaemonIntegration, HotGpuAlertsEveryCycle) {
    ScriptedSource source(Script{{50.0, 88.0}, {50.0, 88.0}, {50.0, 97.0}, {50.0, 60.0}});
    auto daemon = make_daemon(source);

    EXPECT_EQ(daemon->run_cycle()->alerts,
              (std::vector<std::string>{"GPU CRITICAL: 88.0 C"}));
    EXPECT_EQ(daemon->run_cycle()->alerts,
              (std::vector<std::string>{"GPU CRITICAL: 88.0 C"}));
    EXPECT_EQ(daemon->run_cycle()->alerts,
              (std::vector<std::string>{"GPU EMERGENCY: 97.0 C (limit 95.0 C)"}));
    EXPECT_TRUE(daemon->run_cycle()->alerts.empty());

    // CPU decisions use the CPU package, not the hotter GPU.
    EXPECT_EQ(status_.latest()->decision.zone, ThermalZone::Comfort);
}

TEST_F(DaemonIntegration, HotGpuRaisesFansUnderCoolCpu) {
    ScriptedSource source(
        Script{{40.0, 90.0}, {40.0, 90.0}, {40.0, 99.0}, {40.0, std::nullopt}, {40.0, 60.0}});
    auto daemon = make_daemon(source);

    auto status = daemon->run_cycle();
    EXPECT_EQ(status->decision.profile, PowerProfile::Performance);
    EXPECT_EQ(daemon->gpu_zone(), ThermalZone::Critical);
    ASSERT_EQ(log_->fans.size(), 1u);
    EXPECT_EQ(log_->fans.back(), FanDirective::manual(75));
    ASSERT_TRUE(status->last_application.has_value());
    EXPECT_EQ(status->last_application->fan, FanDirective::manual(75));

    daemon->run_cycle();
    EXPECT_EQ(log_->fans.size(), 1u);

    daemon->run_cycle();
    EXPECT_EQ(daemon->gpu_zone(), ThermalZone::Emergency);
    ASSERT_EQ(log_->fans.size(), 2u);
    EXPECT_EQ(log_->fans.back(), FanDirective::manual(100));

    // A missing GPU reading holds the tier.
    daemon->run_cycle();
    EXPECT_EQ(daemon->gpu_zone(), ThermalZone::Emergency);
    EXPECT_EQ(log_->fans.size(), 2u);

    daemon->run_cycle();
    EXPECT_EQ(daemon->gpu_zone(), ThermalZone::Comfort);
    ASSERT_EQ(log_->fans.size(), 3u);
    EXPECT_EQ(log_->fans.back(), FanDirective::auto_mode());
    EXPECT_EQ(log_->frequencies,
              (std::vector<uint32_t>{3'000'000, 3'000'000, 3'000'000}));
}

TEST_F(DaemonIntegration, HotCpuKeepsItsHotterFanOverGpuTier) {
    ScriptedSource source(Script{{90.0, 80.0}});
    auto daemon = make_daemon(source);

    daemon->run_cycle();
    EXPECT_EQ(daemon->gpu_zone(), ThermalZone::Warning);
    ASSERT_EQ(log_->fans.size(), 1u);
    EXPECT_EQ(log_->fans.back(), FanDirective::manual(100));
}

TEST_F(DaemonIntegration, GpuTierIgnoredWithoutFanControl) {
    ScriptedSource source(Script{{40.0, 90.0}, {40.0, 99.0}});
    DaemonOptions opts;
    opts.manage_fans = false;
    auto daemon = make_daemon(source, opts);

    daemon->run_cycle();
    daemon->run_cycle();
    EXPECT_TRUE(log_->fans.empty());
    EXPECT_EQ(log_->frequencies.size(), 1u);
}

TEST(GpuZoneTest, ThresholdsMapToTiers) {
    DaemonOptions opts;
    EXPECT_EQ(gpu_zone_for(60.0, opts), ThermalZone::Comfort);
    EXPECT_EQ(gpu_zone_for(75.0, opts), ThermalZone::Warning);
    EXPECT_EQ(gpu_zone_for(85.0, opts), ThermalZone::Critical);
    EXPECT_EQ(gpu_zone_for(95.0, opts), ThermalZone::Emergency);
}

TEST_F(DaemonIntegration, SubscribersReceiveEveryCycle) {
    ScriptedSource source(Script{{60.0}, {70.0}});
    std::vector<ThermalZone> seen;
    status_.subscribe([&seen](const DaemonStatus& s) { seen.push_back(s.decision.zone); });

    auto daemon = make_daemon(source);
    daemon->run_cycle();
    daemon->run_cycle();
    EXPECT_EQ(seen, (std::vector<ThermalZone>{ThermalZone::Comfort, ThermalZone::Warning}));
}

// ═══════════════════════════════════════════════
// Loop lifecycle
// ═══════════════════════════════════════════════

TEST_F(DaemonIntegration, RunStopsOnRequest) {
    ScriptedSource source(Script{{60.0}});
    DaemonOptions opts;
    opts.poll_interval = Duration{10};
    auto daemon = make_daemon(source, opts);

    std::jthread loop([&daemon](std::stop_token stop) { daemon->run(stop); });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while (status_.publish_count() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    loop.request_stop();
    loop.join();

    EXPECT_GE(daemon->cycles(), 3u);
    EXPECT_EQ(daemon->cycles(), status_.publish_count());
    EXPECT_EQ(log_->frequencies.size(), 1u);
}

TEST_F(DaemonIntegration, LongIntervalIsInterruptedByStop) {
    ScriptedSource source(Script{{60.0}});
    DaemonOptions opts;
    opts.poll_interval = Duration{60'000};
    auto daemon = make_daemon(source, opts);

    const auto started = std::chrono::steady_clock::now();
    std::jthread loop([&daemon](std::stop_token stop) { daemon->run(stop); });
    while (status_.publish_count() < 1) {
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    loop.request_stop();
    loop.join();

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds{5});
    EXPECT_EQ(daemon->cycles(), 1u);
}
