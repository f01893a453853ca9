/**
 * @file generation_table.hpp
 * @brief CPU generation lookup table and matcher.
 * @author Dimitris Kafetzis
 *
 * The table is data: each entry lists regular expressions over the
 * /proc/cpuinfo model string, the generation's maximum junction
 * temperature, the frequency-control methods plausible on that family, and
 * (for families with a documented one) the multiplier register table used
 * by direct-register control.
 *
 * Matching is deliberately separate from detection: match_generation() is
 * a pure function over a string and a table.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace thermal_guard {

/// One row of a direct-register multiplier table.
struct MultiplierStep {
    uint32_t freq_khz;
    uint16_t register_value;
};

struct GenerationEntry {
    CpuGeneration generation{CpuGeneration::Unknown};
    CpuVendor vendor{CpuVendor::Unknown};
    std::vector<std::string> patterns;          ///< ECMAScript regular expressions
    double tjmax_c{70.0};
    std::vector<ControlMethodKind> methods;     ///< Plausible, in preference order
    std::vector<MultiplierStep> multipliers;    ///< Descending by frequency
};

struct GenerationMatch {
    const GenerationEntry* entry{nullptr};
    size_t match_length{0};
};

/**
 * @brief The built-in table, in tie-break order.
 */
[[nodiscard]] const std::vector<GenerationEntry>& generation_table();

/**
 * @brief Find the table entry that best describes `model`.
 *
 * The entry owning the longest single pattern match wins; equal lengths go
 * to the earlier entry. Returns std::nullopt when nothing matches.
 */
[[nodiscard]] std::optional<GenerationMatch> match_generation(
    std::string_view model, const std::vector<GenerationEntry>& table);

/**
 * @brief Entry used when nothing matches: the lowest Tjmax in the table,
 *        restricted to governor scaling.
 */
[[nodiscard]] GenerationEntry conservative_entry(const std::vector<GenerationEntry>& table);

/**
 * @brief Percentile law: 65/75/85/95 % of Tjmax, floored to whole degrees.
 */
[[nodiscard]] ThermalLimits derive_thermal_limits(double tjmax_c) noexcept;

/**
 * @brief Exact lookup of a register value. Frequencies not present in the
 *        table are rejected, never rounded.
 */
[[nodiscard]] std::optional<uint16_t> lookup_multiplier(
    const std::vector<MultiplierStep>& table, uint32_t freq_khz) noexcept;

}  // namespace thermal_guard
