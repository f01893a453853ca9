/**
 * @file thermal_controller.hpp
 * @brief Hysteretic thermal escalation state machine.
 * @author Dimitris Kafetzis
 *
 * Zones escalate immediately to the highest zone whose entry threshold is
 * met and de-escalate one zone per cycle once the temperature drops below
 * the lower threshold minus the hysteresis margin. A system that stays in
 * Critical for more than `escalation_bound` consecutive hot cycles is
 * forced into Emergency.
 */

#pragma once

#include "core/types.hpp"

#include <optional>

namespace thermal_guard {

struct ThermalDecision {
    ThermalZone zone{ThermalZone::Comfort};
    ThermalZone previous{ThermalZone::Comfort};
    bool transitioned{false};
    PowerProfile profile{PowerProfile::Performance};
    PriorityRecommendation priority;
    bool data_missing{false};
    std::optional<double> temperature_c;
    uint32_t escalation_count{0};
};

/// Comfort → Performance, Warning → Balanced, Critical → PowerSave, Emergency → Emergency.
[[nodiscard]] constexpr PowerProfile profile_for(ThermalZone zone) noexcept {
    switch (zone) {
        case ThermalZone::Comfort:   return PowerProfile::Performance;
        case ThermalZone::Warning:   return PowerProfile::Balanced;
        case ThermalZone::Critical:  return PowerProfile::PowerSave;
        case ThermalZone::Emergency: return PowerProfile::Emergency;
    }
    return PowerProfile::Emergency;
}

[[nodiscard]] PriorityRecommendation priority_for(ThermalZone zone) noexcept;

/**
 * @brief The CPU temperature used for zone decisions.
 *
 * Prefers a package sensor (Package id N, Tctl, Tdie) on a CPU chip
 * (coretemp, k10temp, zenpower, cpu*, x86_pkg_temp), then the hottest
 * reading on any CPU chip, then the hottest temperature in the snapshot.
 */
[[nodiscard]] std::optional<double> select_cpu_temperature(const SensorSnapshot& snapshot);

/// Whether `chip` names a CPU temperature source.
[[nodiscard]] bool is_cpu_chip(std::string_view chip) noexcept;

class ThermalController {
public:
    ThermalController(ThermalLimits limits, double hysteresis_margin_c,
                      uint32_t escalation_bound);

    /**
     * @brief Advance the machine by one cycle.
     *
     * An absent temperature holds both the zone and the escalation count.
     */
    ThermalDecision update(std::optional<double> temperature_c, Timestamp now);

    ThermalDecision update(const SensorSnapshot& snapshot) {
        return update(select_cpu_temperature(snapshot), snapshot.timestamp);
    }

    [[nodiscard]] const ThermalState& state() const noexcept { return state_; }
    [[nodiscard]] const ThermalLimits& limits() const noexcept { return limits_; }
    [[nodiscard]] double hysteresis_margin() const noexcept { return margin_; }
    [[nodiscard]] uint32_t escalation_bound() const noexcept { return bound_; }

private:
    [[nodiscard]] ThermalZone next_zone(double t) const noexcept;
    [[nodiscard]] ThermalZone highest_met(double t) const noexcept;

    ThermalLimits limits_;
    double margin_;
    uint32_t bound_;
    ThermalState state_;
};

}  // namespace thermal_guard
