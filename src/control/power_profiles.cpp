/**
 * @file power_profiles.cpp
 * @brief ProfileTable implementation.
 * @author Dimitris Kafetzis
 */

#include "control/power_profiles.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace thermal_guard {

namespace {

constexpr size_t index_of(PowerProfile p) noexcept {
    return static_cast<size_t>(p);
}

}  // namespace

FanDirective hotter(FanDirective a, FanDirective b) noexcept {
    if (a.automatic) return b;
    if (b.automatic) return a;
    return a.percent >= b.percent ? a : b;
}

ProfileTable::ProfileTable() {
    using Mode = FrequencyPolicy::Mode;
    settings_[index_of(PowerProfile::Performance)] =
        {{Mode::PercentOfMax, 100.0, 0}, "auto", FanDirective::auto_mode()};
    settings_[index_of(PowerProfile::Balanced)] =
        {{Mode::PercentOfMax, 80.0, 0}, "auto", FanDirective::manual(50)};
    settings_[index_of(PowerProfile::PowerSave)] =
        {{Mode::PercentOfMax, 60.0, 0}, "low", FanDirective::manual(75)};
    settings_[index_of(PowerProfile::Emergency)] =
        {{Mode::Minimum, 0.0, 0}, "low", FanDirective::manual(100)};
}

ProfileTable::ProfileTable(const std::map<PowerProfile, ProfileOverride>& overrides)
    : ProfileTable() {
    for (const auto& [profile, po] : overrides) {
        auto& s = settings_[index_of(profile)];
        if (po.freq_khz) {
            s.frequency = {FrequencyPolicy::Mode::Explicit, 0.0, *po.freq_khz};
        } else if (po.freq_percent) {
            s.frequency = {FrequencyPolicy::Mode::PercentOfMax, *po.freq_percent, 0};
        }
        if (po.gpu_token) s.gpu_token = *po.gpu_token;
        if (po.fan) s.fan = *po.fan;
    }
}

const ProfileSettings& ProfileTable::at(PowerProfile profile) const noexcept {
    return settings_[index_of(profile)];
}

ResolvedFrequency ProfileTable::resolve_frequency(PowerProfile profile,
                                                  const HardwareProfile& hw) const {
    const auto& policy = at(profile).frequency;
    uint32_t target = hw.freq_max_khz;
    switch (policy.mode) {
        case FrequencyPolicy::Mode::PercentOfMax:
            target = static_cast<uint32_t>(
                std::llround(static_cast<double>(hw.freq_max_khz) * policy.percent / 100.0));
            break;
        case FrequencyPolicy::Mode::Explicit:
            target = policy.khz;
            break;
        case FrequencyPolicy::Mode::Minimum:
            target = hw.freq_min_khz;
            break;
    }
    target = std::clamp(target, hw.freq_min_khz, hw.freq_max_khz);

    ResolvedFrequency resolved{target, target, false};
    const auto& steps = hw.supported_frequencies_khz;
    if (!steps.empty()) {
        auto it = std::upper_bound(steps.begin(), steps.end(), target);
        uint32_t step = (it == steps.begin()) ? steps.front() : *std::prev(it);
        resolved.khz = step;
        resolved.snapped = step != target;
    }
    return resolved;
}

}  // namespace thermal_guard
