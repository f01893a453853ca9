/**
 * @file generation_table.cpp
 * @brief Built-in generation table and longest-match lookup.
 * @author Dimitris Kafetzis
 */

#include "hardware/generation_table.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace thermal_guard {

namespace {

using K = ControlMethodKind;

const std::vector<ControlMethodKind> kRegisterCapable{
    K::GovernorScaling, K::DirectRegister, K::VendorTool, K::BootParameterFallback};
const std::vector<ControlMethodKind> kGovernorFamily{
    K::GovernorScaling, K::VendorTool, K::BootParameterFallback};

// IA32_PERF_CTL values for Core 2 Duo / Quad parts (FID in the high byte,
// VID in the low byte).
const std::vector<MultiplierStep> kCore2Multipliers{
    {2'833'000, 0x0615}, {2'666'000, 0x0514}, {2'500'000, 0x0513},
    {2'333'000, 0x0512}, {2'166'000, 0x0411}, {2'000'000, 0x0610},
    {1'833'000, 0x050F}, {1'666'000, 0x050E}, {1'500'000, 0x050D},
    {1'333'000, 0x040C}, {1'200'000, 0x040B},
};

std::vector<GenerationEntry> build_table() {
    return {
        {CpuGeneration::Core2, CpuVendor::Intel,
         {R"(Core\(TM\)2)", R"(Core 2 (Duo|Quad))", R"(Pentium\(R\) Dual)"},
         85.0, kRegisterCapable, kCore2Multipliers},
        {CpuGeneration::SandyBridge, CpuVendor::Intel,
         {R"(i[357]-2\d{3})"}, 95.0, kGovernorFamily, {}},
        {CpuGeneration::IvyBridge, CpuVendor::Intel,
         {R"(i[357]-3\d{3})"}, 100.0, kGovernorFamily, {}},
        {CpuGeneration::Haswell, CpuVendor::Intel,
         {R"(i[357]-4\d{3})"}, 100.0, kGovernorFamily, {}},
        {CpuGeneration::Broadwell, CpuVendor::Intel,
         {R"(i[357]-5\d{3})"}, 100.0, kGovernorFamily, {}},
        {CpuGeneration::SkylakePlus, CpuVendor::Intel,
         {R"(i[3579]-[6-9]\d{3})", R"(i[3579]-1[0-4]\d{3})", R"(Core\(TM\) Ultra)"},
         100.0, kGovernorFamily, {}},
        {CpuGeneration::Nehalem, CpuVendor::Intel,
         {R"(\bi[357]\b)", R"(i[357] CPU\s+[5-9]\d{2})"}, 95.0, kGovernorFamily, {}},
        {CpuGeneration::Zen, CpuVendor::Amd,
         {R"(Ryzen)", R"(EPYC)", R"(Threadripper)"}, 95.0, kGovernorFamily, {}},
        {CpuGeneration::Bulldozer, CpuVendor::Amd,
         {R"(\bFX(\(tm\))?-\d{4})", R"(Bulldozer)"}, 75.0, kGovernorFamily, {}},
        {CpuGeneration::K10, CpuVendor::Amd,
         {R"(Phenom)", R"(Athlon(\(tm\))? II)"}, 70.0, kGovernorFamily, {}},
        {CpuGeneration::K8, CpuVendor::Amd,
         {R"(Athlon(\(tm\))? 64)", R"(Opteron)", R"(Turion)"}, 70.0, kGovernorFamily, {}},
    };
}

}  // namespace

const std::vector<GenerationEntry>& generation_table() {
    static const std::vector<GenerationEntry> table = build_table();
    return table;
}

std::optional<GenerationMatch> match_generation(std::string_view model,
                                                const std::vector<GenerationEntry>& table) {
    const std::string subject{model};
    std::optional<GenerationMatch> best;

    for (const auto& entry : table) {
        for (const auto& pattern : entry.patterns) {
            std::regex re(pattern, std::regex::ECMAScript);
            for (auto it = std::sregex_iterator(subject.begin(), subject.end(), re);
                 it != std::sregex_iterator(); ++it) {
                auto length = static_cast<size_t>(it->length());
                if (length == 0) continue;
                if (!best || length > best->match_length) {
                    best = GenerationMatch{&entry, length};
                }
            }
        }
    }
    return best;
}

GenerationEntry conservative_entry(const std::vector<GenerationEntry>& table) {
    GenerationEntry fallback;
    fallback.generation = CpuGeneration::Unknown;
    fallback.vendor = CpuVendor::Unknown;
    fallback.methods = {ControlMethodKind::GovernorScaling};
    fallback.tjmax_c = table.empty() ? 70.0 : table.front().tjmax_c;
    for (const auto& entry : table) {
        fallback.tjmax_c = std::min(fallback.tjmax_c, entry.tjmax_c);
    }
    return fallback;
}

ThermalLimits derive_thermal_limits(double tjmax_c) noexcept {
    return ThermalLimits{
        .comfort = std::floor(tjmax_c * 0.65),
        .warning = std::floor(tjmax_c * 0.75),
        .critical = std::floor(tjmax_c * 0.85),
        .emergency = std::floor(tjmax_c * 0.95),
    };
}

std::optional<uint16_t> lookup_multiplier(const std::vector<MultiplierStep>& table,
                                          uint32_t freq_khz) noexcept {
    for (const auto& step : table) {
        if (step.freq_khz == freq_khz) return step.register_value;
    }
    return std::nullopt;
}

}  // namespace thermal_guard
