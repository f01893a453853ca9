/**
 * @file power_profiles.hpp
 * @brief Power profile definitions and frequency target resolution.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <array>
#include <map>
#include <string>

namespace thermal_guard {

struct FrequencyPolicy {
    enum class Mode : uint8_t { PercentOfMax, Explicit, Minimum };

    Mode mode{Mode::PercentOfMax};
    double percent{100.0};
    uint32_t khz{0};
};

struct ProfileSettings {
    FrequencyPolicy frequency;
    std::string gpu_token;   ///< "auto", "low" or "high"
    FanDirective fan;
};

/// The more aggressive of two fan directives: manual beats auto, and of
/// two manual directives the higher percentage wins.
[[nodiscard]] FanDirective hotter(FanDirective a, FanDirective b) noexcept;

/// A frequency target after clamping and snapping to a supported step.
struct ResolvedFrequency {
    uint32_t requested_khz{0};
    uint32_t khz{0};
    bool snapped{false};
};

/**
 * @brief The four profiles with their targets.
 *
 * Defaults:
 *   Performance  100 % of max, GPU auto, fan auto
 *   Balanced      80 % of max, GPU auto, fan 50 %
 *   PowerSave     60 % of max, GPU low,  fan 75 %
 *   Emergency    minimum,      GPU low,  fan 100 %
 */
class ProfileTable {
public:
    ProfileTable();
    explicit ProfileTable(const std::map<PowerProfile, ProfileOverride>& overrides);

    [[nodiscard]] const ProfileSettings& at(PowerProfile profile) const noexcept;

    /**
     * @brief Concrete frequency for `profile` on this hardware.
     *
     * Clamped to [freq_min_khz, freq_max_khz]. When the hardware exposes a
     * discrete list of supported frequencies the target snaps down to the
     * highest step not above it (or the lowest step if none is).
     */
    [[nodiscard]] ResolvedFrequency resolve_frequency(PowerProfile profile,
                                                      const HardwareProfile& hw) const;

private:
    std::array<ProfileSettings, 4> settings_;
};

}  // namespace thermal_guard
