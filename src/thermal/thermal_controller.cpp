/**
 * @file thermal_controller.cpp
 * @brief ThermalController implementation and CPU temperature selection.
 * @author Dimitris Kafetzis
 */

#include "thermal/thermal_controller.hpp"

#include <algorithm>
#include <array>
#include <string_view>

namespace thermal_guard {

namespace {

bool is_package_label(std::string_view label) noexcept {
    return label.starts_with("Package") || label == "Tctl" || label == "Tdie";
}

std::optional<double> max_value(const SensorSnapshot& snapshot, bool cpu_only,
                                bool package_only) {
    std::optional<double> best;
    for (const auto& r : snapshot.readings) {
        if (r.type != SensorType::Temperature || !r.value) continue;
        if (cpu_only && !is_cpu_chip(r.chip_id)) continue;
        if (package_only && !is_package_label(r.label)) continue;
        if (!best || *r.value > *best) best = r.value;
    }
    return best;
}

}  // namespace

bool is_cpu_chip(std::string_view chip) noexcept {
    static constexpr std::array<std::string_view, 4> kExact = {
        "coretemp", "k10temp", "zenpower", "x86_pkg_temp"};
    if (std::find(kExact.begin(), kExact.end(), chip) != kExact.end()) return true;
    return chip.starts_with("cpu");
}

std::optional<double> select_cpu_temperature(const SensorSnapshot& snapshot) {
    if (auto t = max_value(snapshot, true, true)) return t;
    if (auto t = max_value(snapshot, true, false)) return t;
    return max_value(snapshot, false, false);
}

PriorityRecommendation priority_for(ThermalZone zone) noexcept {
    switch (zone) {
        case ThermalZone::Comfort:   return {0, std::nullopt};
        case ThermalZone::Warning:   return {5, std::nullopt};
        case ThermalZone::Critical:  return {10, 2u};
        case ThermalZone::Emergency: return {19, 1u};
    }
    return {19, 1u};
}

// ─────────────────────────────────────────────
// ThermalController
// ─────────────────────────────────────────────

ThermalController::ThermalController(ThermalLimits limits, double hysteresis_margin_c,
                                     uint32_t escalation_bound)
    : limits_(limits)
    , margin_(std::max(0.0, hysteresis_margin_c))
    , bound_(escalation_bound) {}

ThermalZone ThermalController::highest_met(double t) const noexcept {
    if (t >= limits_.emergency) return ThermalZone::Emergency;
    if (t >= limits_.critical) return ThermalZone::Critical;
    if (t >= limits_.warning) return ThermalZone::Warning;
    return ThermalZone::Comfort;
}

ThermalZone ThermalController::next_zone(double t) const noexcept {
    const auto current = state_.zone;
    const auto hot = highest_met(t);
    if (hot > current) return hot;

    switch (current) {
        case ThermalZone::Comfort:
            return ThermalZone::Comfort;
        case ThermalZone::Warning:
            return t < limits_.warning - margin_ ? ThermalZone::Comfort : ThermalZone::Warning;
        case ThermalZone::Critical:
            if (t < limits_.critical - margin_) return ThermalZone::Warning;
            if (state_.escalation_count > bound_) return ThermalZone::Emergency;
            return ThermalZone::Critical;
        case ThermalZone::Emergency:
            return t < limits_.critical - margin_ ? ThermalZone::Critical
                                                   : ThermalZone::Emergency;
    }
    return current;
}

ThermalDecision ThermalController::update(std::optional<double> temperature_c, Timestamp now) {
    ThermalDecision decision;
    decision.previous = state_.zone;
    decision.temperature_c = temperature_c;
    ++state_.cycles;

    if (!temperature_c) {
        decision.data_missing = true;
    } else {
        const auto zone = next_zone(*temperature_c);
        if (zone != state_.zone) {
            state_.zone = zone;
            state_.last_transition_at = now;
            decision.transitioned = true;
        }
        if (zone == ThermalZone::Comfort) {
            state_.escalation_count = 0;
        } else {
            ++state_.escalation_count;
        }
        state_.last_temperature_c = temperature_c;
    }

    decision.zone = state_.zone;
    decision.profile = profile_for(state_.zone);
    decision.priority = priority_for(state_.zone);
    decision.escalation_count = state_.escalation_count;
    return decision;
}

}  // namespace thermal_guard
