/**
 * @file test_aggregator.cpp
 * @brief Unit tests for SensorAggregator polling, deadlines and dedup.
 */

#include "sensors/aggregator.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace thermal_guard;
using thermal_guard::testing::FakeCommandRunner;
using thermal_guard::testing::quiet_logger;

namespace {

SensorReading make_reading(std::string chip, std::string label, double value,
                           SensorType type = SensorType::Temperature) {
    SensorReading r;
    r.type = type;
    r.chip_id = std::move(chip);
    r.label = std::move(label);
    r.value = value;
    return r;
}

class FakeBackend : public ISensorBackend {
public:
    FakeBackend(std::string name, ScopeRank rank, std::vector<SensorReading> readings,
                std::chrono::milliseconds delay = std::chrono::milliseconds{0})
        : name_(std::move(name)), rank_(rank), readings_(std::move(readings)), delay_(delay) {}

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }
    [[nodiscard]] ScopeRank scope_rank() const noexcept override { return rank_; }

    [[nodiscard]] int polls() const noexcept { return polls_.load(); }

protected:
    Result<std::vector<SensorReading>> collect() override {
        ++polls_;
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        if (readings_.empty()) return Error{ErrorCode::BackendUnavailable, "nothing here"};
        return readings_;
    }

private:
    std::string name_;
    ScopeRank rank_;
    std::vector<SensorReading> readings_;
    std::chrono::milliseconds delay_;
    std::atomic<int> polls_{0};
};

class ThrowingBackend : public ISensorBackend {
public:
    explicit ThrowingBackend(std::string name = "throwing",
                             ScopeRank rank = ScopeRank::Hwmon)
        : name_(std::move(name)), rank_(rank) {}

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }
    [[nodiscard]] ScopeRank scope_rank() const noexcept override { return rank_; }

protected:
    Result<std::vector<SensorReading>> collect() override {
        throw std::runtime_error("driver went away");
    }

private:
    std::string name_;
    ScopeRank rank_;
};

}  // namespace

TEST(MergeReadingsTest, NarrowerScopeWins) {
    std::vector<BackendReadings> contributions{
        {ScopeRank::ThermalZone, {make_reading("coretemp", "Package id 0", 50.0)}},
        {ScopeRank::Hwmon, {make_reading("coretemp", "Package id 0", 45.0),
                            make_reading("coretemp", "Core 0", 44.0)}},
        {ScopeRank::DiagnosticTool, {make_reading("coretemp", "Core 0", 47.0),
                                     make_reading("nct6775", "fan1", 900.0,
                                                  SensorType::FanRpm)}},
    };

    auto merged = merge_backend_readings(std::move(contributions));
    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged[0].label, "Package id 0");
    EXPECT_DOUBLE_EQ(*merged[0].value, 45.0);
    EXPECT_EQ(merged[1].label, "Core 0");
    EXPECT_DOUBLE_EQ(*merged[1].value, 44.0);
    EXPECT_EQ(merged[2].chip_id, "nct6775");
}

TEST(MergeReadingsTest, EqualRankKeepsInputOrder) {
    std::vector<BackendReadings> contributions{
        {ScopeRank::Hwmon, {make_reading("a", "x", 1.0)}},
        {ScopeRank::Hwmon, {make_reading("a", "x", 2.0)}},
    };
    auto merged = merge_backend_readings(std::move(contributions));
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_DOUBLE_EQ(*merged[0].value, 1.0);
}

TEST(MergeReadingsTest, SameLabelOnDifferentChipsIsKept) {
    std::vector<BackendReadings> contributions{
        {ScopeRank::Hwmon, {make_reading("coretemp", "temp1", 40.0),
                            make_reading("acpitz", "temp1", 30.0)}},
    };
    EXPECT_EQ(merge_backend_readings(std::move(contributions)).size(), 2u);
}

TEST(SensorAggregatorTest, PollsAllBackendsAndTagsProvenance) {
    std::vector<std::unique_ptr<ISensorBackend>> backends;
    backends.push_back(std::make_unique<FakeBackend>(
        "thermal_zone", ScopeRank::ThermalZone,
        std::vector<SensorReading>{make_reading("x86_pkg_temp", "thermal_zone0", 51.0)}));
    backends.push_back(std::make_unique<FakeBackend>(
        "hwmon", ScopeRank::Hwmon,
        std::vector<SensorReading>{make_reading("coretemp", "Package id 0", 50.0)}));

    SensorAggregator aggregator(std::move(backends), quiet_logger(), Duration{1000});
    auto snapshot = aggregator.poll();
    ASSERT_NE(snapshot, nullptr);
    ASSERT_EQ(snapshot->size(), 2u);
    EXPECT_EQ(snapshot->readings[0].backend, "hwmon");
    EXPECT_EQ(snapshot->readings[1].backend, "thermal_zone");
    EXPECT_EQ(aggregator.last_stats().ok, 2u);
    EXPECT_EQ(aggregator.last_stats().readings, 2u);
}

TEST(SensorAggregatorTest, EveryBackendEmptyGivesEmptySnapshot) {
    std::vector<std::unique_ptr<ISensorBackend>> backends;
    backends.push_back(std::make_unique<FakeBackend>("a", ScopeRank::Hwmon,
                                                     std::vector<SensorReading>{}));
    backends.push_back(std::make_unique<FakeBackend>("b", ScopeRank::ThermalZone,
                                                     std::vector<SensorReading>{}));
    backends.push_back(std::make_unique<ThrowingBackend>());

    SensorAggregator aggregator(std::move(backends), quiet_logger(), Duration{1000});
    auto snapshot = aggregator.poll();
    ASSERT_NE(snapshot, nullptr);
    EXPECT_TRUE(snapshot->empty());
    EXPECT_EQ(aggregator.last_stats().empty, 3u);
    EXPECT_EQ(aggregator.last_stats().ok, 0u);
}

TEST(SensorAggregatorTest, SnapshotKeepsWorkingBackendsForEveryCombination) {
    enum class Mode { Ok, Empty, Throws };
    const std::array<Mode, 3> modes{Mode::Ok, Mode::Empty, Mode::Throws};
    const std::array<ScopeRank, 3> ranks{ScopeRank::ThermalZone, ScopeRank::Hwmon,
                                         ScopeRank::DiagnosticTool};

    for (size_t combo = 0; combo < 27; ++combo) {
        std::vector<std::unique_ptr<ISensorBackend>> backends;
        std::vector<std::string> expected_backends;
        size_t code = combo;
        for (size_t i = 0; i < 3; ++i) {
            const Mode mode = modes[code % 3];
            code /= 3;
            const std::string name = "backend" + std::to_string(i);
            switch (mode) {
                case Mode::Ok:
                    backends.push_back(std::make_unique<FakeBackend>(
                        name, ranks[i],
                        std::vector<SensorReading>{
                            make_reading("chip" + std::to_string(i), "temp1", 40.0 + i)}));
                    expected_backends.push_back(name);
                    break;
                case Mode::Empty:
                    backends.push_back(std::make_unique<FakeBackend>(
                        name, ranks[i], std::vector<SensorReading>{}));
                    break;
                case Mode::Throws:
                    backends.push_back(std::make_unique<ThrowingBackend>(name, ranks[i]));
                    break;
            }
        }

        SensorAggregator aggregator(std::move(backends), quiet_logger(), Duration{1000});
        auto snapshot = aggregator.poll();
        ASSERT_NE(snapshot, nullptr) << ::testing::Message() << "combination " << combo;

        std::vector<std::string> seen;
        for (const auto& r : snapshot->readings) seen.push_back(r.backend);
        std::sort(seen.begin(), seen.end());
        EXPECT_EQ(seen, expected_backends) << "combination " << combo;

        const auto& stats = aggregator.last_stats();
        EXPECT_EQ(stats.ok, expected_backends.size()) << "combination " << combo;
        EXPECT_EQ(stats.empty, 3 - expected_backends.size()) << "combination " << combo;
        EXPECT_EQ(stats.readings, expected_backends.size()) << "combination " << combo;
        EXPECT_EQ(stats.timed_out, 0u) << "combination " << combo;
    }
}

TEST(SensorAggregatorTest, NoBackendsGivesEmptySnapshot) {
    SensorAggregator aggregator({}, quiet_logger(), Duration{100});
    auto snapshot = aggregator.poll();
    ASSERT_NE(snapshot, nullptr);
    EXPECT_TRUE(snapshot->empty());
}

TEST(SensorAggregatorTest, SlowBackendIsDroppedThenSkipped) {
    std::vector<std::unique_ptr<ISensorBackend>> backends;
    auto slow = std::make_unique<FakeBackend>(
        "slow", ScopeRank::DiagnosticTool,
        std::vector<SensorReading>{make_reading("nct6775", "fan1", 900.0, SensorType::FanRpm)},
        std::chrono::milliseconds{600});
    auto* slow_ptr = slow.get();
    backends.push_back(std::move(slow));
    backends.push_back(std::make_unique<FakeBackend>(
        "fast", ScopeRank::Hwmon,
        std::vector<SensorReading>{make_reading("coretemp", "Package id 0", 50.0)}));

    SensorAggregator aggregator(std::move(backends), quiet_logger(), Duration{100});

    auto start = std::chrono::steady_clock::now();
    auto first = aggregator.poll();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::milliseconds{500});
    ASSERT_EQ(first->size(), 1u);
    EXPECT_EQ(first->readings[0].chip_id, "coretemp");
    EXPECT_EQ(aggregator.last_stats().timed_out, 1u);

    // The slow poll is still running: it must not be queued a second time.
    auto second = aggregator.poll();
    EXPECT_EQ(aggregator.last_stats().skipped, 1u);
    EXPECT_EQ(second->size(), 1u);
    EXPECT_EQ(slow_ptr->polls(), 1);
}

TEST(SensorAggregatorTest, DefaultBackendsFollowPriorityOrder) {
    FakeCommandRunner runner;
    SensorsConfig config;
    auto backends = make_default_backends(config, runner);
    ASSERT_EQ(backends.size(), 5u);
    EXPECT_EQ(backends[0]->name(), "nvidia_smi");
    EXPECT_EQ(backends[1]->name(), "hwmon");
    EXPECT_EQ(backends[2]->name(), "lm_sensors");
    EXPECT_EQ(backends[3]->name(), "acpi");
    EXPECT_EQ(backends[4]->name(), "thermal_zone");

    config.enable_nvidia_smi = false;
    config.enable_lm_sensors = false;
    backends = make_default_backends(config, runner);
    ASSERT_EQ(backends.size(), 3u);
    EXPECT_EQ(backends[0]->name(), "hwmon");
}
