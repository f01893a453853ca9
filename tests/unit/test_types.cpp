/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace thermal_guard;

namespace {

SensorReading reading(SensorType type, std::string chip, std::string label,
                      std::optional<double> value) {
    SensorReading r;
    r.type = type;
    r.chip_id = std::move(chip);
    r.label = std::move(label);
    r.value = value;
    return r;
}

}  // namespace

TEST(SensorSnapshotTest, EmptyIsValid) {
    SensorSnapshot snap;
    EXPECT_TRUE(snap.empty());
    EXPECT_EQ(snap.size(), 0u);
    EXPECT_TRUE(snap.by_type(SensorType::Temperature).empty());
    EXPECT_EQ(snap.find("coretemp", "Package id 0"), nullptr);
}

TEST(SensorSnapshotTest, QueryHelpers) {
    SensorSnapshot snap;
    snap.readings.push_back(reading(SensorType::Temperature, "coretemp", "Core 0", 51.0));
    snap.readings.push_back(reading(SensorType::FanRpm, "it8728", "fan1", 1200.0));
    snap.readings.push_back(reading(SensorType::Temperature, "acpitz", "temp1", std::nullopt));

    EXPECT_EQ(snap.by_type(SensorType::Temperature).size(), 2u);
    EXPECT_EQ(snap.by_type(SensorType::Voltage).size(), 0u);

    const auto* fan = snap.find("it8728", "fan1");
    ASSERT_NE(fan, nullptr);
    EXPECT_DOUBLE_EQ(*fan->value, 1200.0);

    const auto* missing = snap.find("acpitz", "temp1");
    ASSERT_NE(missing, nullptr);
    EXPECT_FALSE(missing->value.has_value());
}

TEST(ThermalLimitsTest, StrictlyIncreasing) {
    EXPECT_TRUE((ThermalLimits{55, 65, 75, 85}.is_valid()));
    EXPECT_FALSE((ThermalLimits{55, 65, 65, 85}.is_valid()));
    EXPECT_FALSE((ThermalLimits{70, 65, 75, 85}.is_valid()));
    EXPECT_FALSE((ThermalLimits{0, 65, 75, 85}.is_valid()));
}

TEST(HardwareProfileTest, HasMethod) {
    HardwareProfile hw;
    hw.available_freq_methods = {ControlMethodKind::GovernorScaling,
                                 ControlMethodKind::VendorTool};
    EXPECT_TRUE(hw.has_method(ControlMethodKind::VendorTool));
    EXPECT_FALSE(hw.has_method(ControlMethodKind::DirectRegister));
}

TEST(FanDirectiveTest, ManualClampsToHundred) {
    EXPECT_EQ(FanDirective::manual(150).percent, 100);
    EXPECT_FALSE(FanDirective::manual(40).automatic);
    EXPECT_TRUE(FanDirective::auto_mode().automatic);
    EXPECT_EQ(FanDirective::manual(40), FanDirective::manual(40));
}

TEST(EnumToStringTest, Names) {
    EXPECT_EQ(to_string(ThermalZone::Emergency), "emergency");
    EXPECT_EQ(to_string(PowerProfile::PowerSave), "powersave");
    EXPECT_EQ(to_string(ControlMethodKind::DirectRegister), "direct_register");
    EXPECT_EQ(to_string(CpuGeneration::SandyBridge), "sandy_bridge");
    EXPECT_EQ(to_string(SensorType::FanRpm), "fan_rpm");
    EXPECT_EQ(to_string(GpuVendor::Nvidia), "nvidia");
}
