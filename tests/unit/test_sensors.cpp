/**
 * @file test_sensors.cpp
 * @brief Unit tests for the sysfs and tool sensor backends.
 */

#include "sensors/sysfs_backends.hpp"
#include "sensors/tool_backends.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace thermal_guard;
using thermal_guard::testing::FakeCommandRunner;
using thermal_guard::testing::FakeTree;

namespace {

const SensorReading* find_reading(const std::vector<SensorReading>& readings,
                                  std::string_view chip, std::string_view label) {
    for (const auto& r : readings) {
        if (r.chip_id == chip && r.label == label) return &r;
    }
    return nullptr;
}

}  // namespace

// ── hwmon ───────────────────────────────────

TEST(HwmonBackendTest, ReadsAndScalesChannels) {
    FakeTree sys("hwmon");
    sys.write("class/hwmon/hwmon0/name", "coretemp\n");
    sys.write("class/hwmon/hwmon0/temp1_input", "45000\n");
    sys.write("class/hwmon/hwmon0/temp1_label", "Package id 0\n");
    sys.write("class/hwmon/hwmon0/temp2_input", "43500\n");
    sys.write("class/hwmon/hwmon1/name", "nct6775\n");
    sys.write("class/hwmon/hwmon1/fan1_input", "1200\n");
    sys.write("class/hwmon/hwmon1/in0_input", "1104\n");
    sys.write("class/hwmon/hwmon1/power1_average", "35000000\n");

    HwmonBackend backend(sys.root());
    auto readings = backend.poll();
    ASSERT_EQ(readings.size(), 5u);
    EXPECT_FALSE(backend.last_error().has_value());

    const auto* pkg = find_reading(readings, "coretemp", "Package id 0");
    ASSERT_NE(pkg, nullptr);
    EXPECT_EQ(pkg->type, SensorType::Temperature);
    EXPECT_DOUBLE_EQ(*pkg->value, 45.0);
    EXPECT_EQ(pkg->backend, "hwmon");

    const auto* unlabeled = find_reading(readings, "coretemp", "temp2");
    ASSERT_NE(unlabeled, nullptr);
    EXPECT_DOUBLE_EQ(*unlabeled->value, 43.5);

    const auto* fan = find_reading(readings, "nct6775", "fan1");
    ASSERT_NE(fan, nullptr);
    EXPECT_EQ(fan->type, SensorType::FanRpm);
    EXPECT_DOUBLE_EQ(*fan->value, 1200.0);

    const auto* volt = find_reading(readings, "nct6775", "in0");
    ASSERT_NE(volt, nullptr);
    EXPECT_NEAR(*volt->value, 1.104, 1e-9);

    const auto* power = find_reading(readings, "nct6775", "power1");
    ASSERT_NE(power, nullptr);
    EXPECT_DOUBLE_EQ(*power->value, 35.0);
}

TEST(HwmonBackendTest, PrefersInputOverAverage) {
    FakeTree sys("hwmon_avg");
    sys.write("class/hwmon/hwmon0/name", "amdgpu\n");
    sys.write("class/hwmon/hwmon0/power1_average", "20000000\n");
    sys.write("class/hwmon/hwmon0/power1_input", "25000000\n");

    HwmonBackend backend(sys.root());
    auto readings = backend.poll();
    ASSERT_EQ(readings.size(), 1u);
    EXPECT_DOUBLE_EQ(*readings.front().value, 25.0);
}

TEST(HwmonBackendTest, ChipFallsBackToDirectoryName) {
    FakeTree sys("hwmon_noname");
    sys.write("class/hwmon/hwmon3/temp1_input", "50000\n");

    HwmonBackend backend(sys.root());
    auto readings = backend.poll();
    ASSERT_EQ(readings.size(), 1u);
    EXPECT_EQ(readings.front().chip_id, "hwmon3");
}

TEST(HwmonBackendTest, UnreadableValueIsKeptWithoutValue) {
    FakeTree sys("hwmon_bad");
    sys.write("class/hwmon/hwmon0/name", "coretemp\n");
    sys.write("class/hwmon/hwmon0/temp1_input", "garbage\n");

    HwmonBackend backend(sys.root());
    auto readings = backend.poll();
    ASSERT_EQ(readings.size(), 1u);
    EXPECT_FALSE(readings.front().value.has_value());
}

TEST(HwmonBackendTest, MissingTreeIsEmptyWithError) {
    FakeTree sys("hwmon_missing");
    HwmonBackend backend(sys.root());
    EXPECT_TRUE(backend.poll().empty());
    ASSERT_TRUE(backend.last_error().has_value());
    EXPECT_NE(backend.last_error()->find("missing"), std::string::npos);
}

// ── power_supply / thermal_zone ─────────────

TEST(PowerSupplyBackendTest, ReadsBatteryTelemetry) {
    FakeTree sys("psu");
    sys.write("class/power_supply/BAT0/voltage_now", "12450000\n");
    sys.write("class/power_supply/BAT0/power_now", "9800000\n");
    sys.write("class/power_supply/AC/online", "1\n");

    PowerSupplyBackend backend(sys.root());
    auto readings = backend.poll();
    ASSERT_EQ(readings.size(), 2u);

    const auto* volt = find_reading(readings, "acpi", "BAT0 voltage");
    ASSERT_NE(volt, nullptr);
    EXPECT_EQ(volt->type, SensorType::Voltage);
    EXPECT_NEAR(*volt->value, 12.45, 1e-9);

    const auto* power = find_reading(readings, "acpi", "BAT0 power");
    ASSERT_NE(power, nullptr);
    EXPECT_NEAR(*power->value, 9.8, 1e-9);
    EXPECT_EQ(power->backend, "acpi");
}

TEST(ThermalZoneBackendTest, ReadsZones) {
    FakeTree sys("tz");
    sys.write("class/thermal/thermal_zone0/type", "acpitz\n");
    sys.write("class/thermal/thermal_zone0/temp", "38000\n");
    sys.write("class/thermal/thermal_zone1/type", "x86_pkg_temp\n");
    sys.write("class/thermal/thermal_zone1/temp", "52000\n");
    sys.write("class/thermal/cooling_device0/type", "Processor\n");

    ThermalZoneBackend backend(sys.root());
    auto readings = backend.poll();
    ASSERT_EQ(readings.size(), 2u);
    EXPECT_EQ(readings[0].chip_id, "acpitz");
    EXPECT_EQ(readings[0].label, "thermal_zone0");
    EXPECT_DOUBLE_EQ(*readings[0].value, 38.0);
    EXPECT_EQ(readings[1].chip_id, "x86_pkg_temp");
    EXPECT_DOUBLE_EQ(*readings[1].value, 52.0);
}

// ── lm-sensors ──────────────────────────────

TEST(LmSensorsBackendTest, ParsesSensorsOutput) {
    const std::string text =
        "coretemp-isa-0000\n"
        "Package id 0:  +45.0°C  (high = +80.0°C, crit = +100.0°C)\n"
        "Core 0:        +43.0°C  (high = +80.0°C, crit = +100.0°C)\n"
        "\n"
        "nct6775-isa-0290\n"
        "Vcore:         +1.10 V  (min =  +0.00 V, max =  +1.74 V)\n"
        "fan1:          1250 RPM  (min =    0 RPM)\n"
        "temp7:            N/A\n"
        "intrusion0:    ALARM\n";

    auto readings = LmSensorsBackend::parse(text);
    ASSERT_EQ(readings.size(), 5u);

    const auto* pkg = find_reading(readings, "coretemp", "Package id 0");
    ASSERT_NE(pkg, nullptr);
    EXPECT_EQ(pkg->type, SensorType::Temperature);
    EXPECT_DOUBLE_EQ(*pkg->value, 45.0);

    const auto* vcore = find_reading(readings, "nct6775", "Vcore");
    ASSERT_NE(vcore, nullptr);
    EXPECT_EQ(vcore->type, SensorType::Voltage);
    EXPECT_DOUBLE_EQ(*vcore->value, 1.10);

    const auto* fan = find_reading(readings, "nct6775", "fan1");
    ASSERT_NE(fan, nullptr);
    EXPECT_EQ(fan->type, SensorType::FanRpm);
    EXPECT_DOUBLE_EQ(*fan->value, 1250.0);

    const auto* na = find_reading(readings, "nct6775", "temp7");
    ASSERT_NE(na, nullptr);
    EXPECT_FALSE(na->value.has_value());

    EXPECT_EQ(find_reading(readings, "nct6775", "intrusion0"), nullptr);
}

TEST(LmSensorsBackendTest, CollectUsesRunner) {
    FakeCommandRunner runner;
    runner.install("sensors", {0, "k10temp-pci-00c3\nTctl:  +61.2°C\n"});

    LmSensorsBackend backend(runner, Duration{500});
    auto readings = backend.poll();
    ASSERT_EQ(readings.size(), 1u);
    EXPECT_EQ(readings.front().chip_id, "k10temp");
    EXPECT_EQ(readings.front().backend, "lm_sensors");

    auto calls = runner.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls.front(), (std::vector<std::string>{"sensors", "-A"}));
}

TEST(LmSensorsBackendTest, MissingToolIsEmptyWithError) {
    FakeCommandRunner runner;
    LmSensorsBackend backend(runner, Duration{500});
    EXPECT_TRUE(backend.poll().empty());
    EXPECT_TRUE(backend.last_error().has_value());
}

TEST(LmSensorsBackendTest, NonZeroExitIsEmpty) {
    FakeCommandRunner runner;
    runner.install("sensors", {1, "No sensors found!\n"});
    LmSensorsBackend backend(runner, Duration{500});
    EXPECT_TRUE(backend.poll().empty());
    ASSERT_TRUE(backend.last_error().has_value());
    EXPECT_NE(backend.last_error()->find("status 1"), std::string::npos);
}

// ── nvidia-smi ──────────────────────────────

TEST(NvidiaSmiBackendTest, ParsesCsvRows) {
    auto readings = NvidiaSmiBackend::parse("0, 67, 120.50, 250.00\n"
                                            "1, 45, [N/A], 180.00\n");
    ASSERT_EQ(readings.size(), 6u);

    const auto* core = find_reading(readings, "nvidia-gpu0", "GPU Core");
    ASSERT_NE(core, nullptr);
    EXPECT_DOUBLE_EQ(*core->value, 67.0);

    const auto* power = find_reading(readings, "nvidia-gpu0", "GPU Power");
    ASSERT_NE(power, nullptr);
    EXPECT_EQ(power->type, SensorType::Power);
    EXPECT_DOUBLE_EQ(*power->value, 120.5);

    const auto* limit = find_reading(readings, "nvidia-gpu0", "GPU Power Limit");
    ASSERT_NE(limit, nullptr);
    EXPECT_DOUBLE_EQ(*limit->value, 250.0);

    const auto* na = find_reading(readings, "nvidia-gpu1", "GPU Power");
    ASSERT_NE(na, nullptr);
    EXPECT_FALSE(na->value.has_value());
}

TEST(NvidiaSmiBackendTest, SkipsMalformedRows) {
    auto readings = NvidiaSmiBackend::parse("garbage\nx, 1, 2, 3\n");
    EXPECT_TRUE(readings.empty());
}

TEST(NvidiaSmiBackendTest, CollectPassesQuery) {
    FakeCommandRunner runner;
    runner.install("nvidia-smi", {0, "0, 55, 30.1, 200.0\n"});

    NvidiaSmiBackend backend(runner, Duration{500});
    auto readings = backend.poll();
    ASSERT_EQ(readings.size(), 3u);
    EXPECT_EQ(readings.front().backend, "nvidia_smi");

    auto calls = runner.calls();
    ASSERT_EQ(calls.size(), 1u);
    ASSERT_EQ(calls.front().size(), 3u);
    EXPECT_EQ(calls.front()[1], NvidiaSmiBackend::kQuery);
    EXPECT_EQ(calls.front()[2], "--format=csv,noheader,nounits");
}

TEST(NvidiaSmiBackendTest, TimeoutIsEmptyWithError) {
    FakeCommandRunner runner;
    runner.install_error("nvidia-smi", ErrorCode::Timeout);
    NvidiaSmiBackend backend(runner, Duration{500});
    EXPECT_TRUE(backend.poll().empty());
    EXPECT_TRUE(backend.last_error().has_value());
}
