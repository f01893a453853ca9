/**
 * @file profiler.cpp
 * @brief HardwareProfiler: CPU generation, frequency range, control
 *        method plausibility and GPU vendor detection.
 * @author Dimitris Kafetzis
 */

#include "hardware/profiler.hpp"
#include "platform/sysfs.hpp"

#include <algorithm>
#include <sstream>

namespace thermal_guard {

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kDefaultMinKhz = 800'000;
constexpr uint32_t kDefaultMaxKhz = 3'000'000;
constexpr uint32_t kEstimateFloorMhz = 2000;

/// Value part of a "key : value" line from /proc/cpuinfo.
std::string cpuinfo_value(const std::string& line) {
    auto colon = line.find(':');
    if (colon == std::string::npos) return {};
    return trim(std::string_view{line}.substr(colon + 1));
}

std::optional<uint32_t> read_khz(const fs::path& path) {
    auto v = read_integer(path);
    if (!v || *v <= 0) return std::nullopt;
    return static_cast<uint32_t>(*v);
}

GpuVendor gpu_vendor_from_pci(std::string_view id) noexcept {
    if (id == "0x10de") return GpuVendor::Nvidia;
    if (id == "0x1002") return GpuVendor::Amd;
    if (id == "0x8086") return GpuVendor::Intel;
    return GpuVendor::None;
}

/// Vendor of one `lspci -nn` display controller line, or None.
GpuVendor gpu_vendor_from_lspci(std::string_view line) noexcept {
    if (line.find("VGA") == std::string_view::npos
        && line.find("3D controller") == std::string_view::npos
        && line.find("Display controller") == std::string_view::npos) {
        return GpuVendor::None;
    }
    if (line.find("NVIDIA") != std::string_view::npos) return GpuVendor::Nvidia;
    if (line.find("AMD") != std::string_view::npos
        || line.find("ATI") != std::string_view::npos) {
        return GpuVendor::Amd;
    }
    if (line.find("Intel") != std::string_view::npos) return GpuVendor::Intel;
    return GpuVendor::None;
}

bool has_power_cap(const fs::path& device) {
    for (const auto& hwmon : list_entries(device / "hwmon", "hwmon")) {
        if (fs::exists(hwmon / "power1_cap")) return true;
    }
    return false;
}

}  // namespace

HardwareProfiler::HardwareProfiler(ProfilerPaths paths,
                                   ICommandRunner& runner,
                                   Logger& logger,
                                   ThermalConfig thermal,
                                   FrequencyConfig frequency)
    : paths_(std::move(paths))
    , runner_(runner)
    , logger_(logger)
    , thermal_(std::move(thermal))
    , frequency_(std::move(frequency)) {}

// ─────────────────────────────────────────────
// CPU identity
// ─────────────────────────────────────────────

HardwareProfiler::CpuIdentity HardwareProfiler::read_cpu_identity() {
    CpuIdentity cpu;
    for (const auto& line : read_lines(paths_.procfs_root / "cpuinfo")) {
        if (line.starts_with("processor")) {
            ++cpu.core_count;
        } else if (line.starts_with("vendor_id") && cpu.vendor == CpuVendor::Unknown) {
            auto v = cpuinfo_value(line);
            if (v == "GenuineIntel") cpu.vendor = CpuVendor::Intel;
            else if (v == "AuthenticAMD") cpu.vendor = CpuVendor::Amd;
        } else if (line.starts_with("model name") && cpu.model.empty()) {
            cpu.model = cpuinfo_value(line);
        } else if (line.starts_with("cpu MHz") && !cpu.current_mhz) {
            try {
                cpu.current_mhz = std::stod(cpuinfo_value(line));
            } catch (const std::exception&) {
                logger_.debug("Unparseable cpu MHz line: " + line);
            }
        }
    }

    if (cpu.vendor == CpuVendor::Unknown) {
        if (cpu.model.find("Intel") != std::string::npos) cpu.vendor = CpuVendor::Intel;
        else if (cpu.model.find("AMD") != std::string::npos) cpu.vendor = CpuVendor::Amd;
    }
    return cpu;
}

// ─────────────────────────────────────────────
// Frequency range
// ─────────────────────────────────────────────

void HardwareProfiler::detect_frequency_range(HardwareProfile& profile,
                                              const CpuIdentity& cpu) {
    const auto cpufreq = paths_.sysfs_root / "devices/system/cpu/cpu0/cpufreq";
    auto min_khz = read_khz(cpufreq / "cpuinfo_min_freq");
    auto max_khz = read_khz(cpufreq / "cpuinfo_max_freq");

    if (min_khz && max_khz && *min_khz < *max_khz) {
        profile.freq_min_khz = *min_khz;
        profile.freq_max_khz = *max_khz;
    } else if (cpu.current_mhz && *cpu.current_mhz > 0.0) {
        auto max_mhz = std::max(static_cast<uint32_t>(*cpu.current_mhz), kEstimateFloorMhz);
        profile.freq_max_khz = max_mhz * 1000;
        profile.freq_min_khz = (max_mhz / 3) * 1000;
        profile.used_defaults = true;
        logger_.warn("cpufreq range unavailable; estimated "
                     + std::to_string(profile.freq_min_khz / 1000) + "-"
                     + std::to_string(profile.freq_max_khz / 1000) + " MHz from cpuinfo");
    } else {
        profile.freq_min_khz = kDefaultMinKhz;
        profile.freq_max_khz = kDefaultMaxKhz;
        profile.used_defaults = true;
        logger_.warn("CPU frequency range unknown; assuming 800-3000 MHz");
    }

    if (auto steps = read_first_line(cpufreq / "scaling_available_frequencies")) {
        std::istringstream iss(*steps);
        uint32_t khz = 0;
        while (iss >> khz) {
            if (khz >= profile.freq_min_khz && khz <= profile.freq_max_khz) {
                profile.supported_frequencies_khz.push_back(khz);
            }
        }
    }
}

// ─────────────────────────────────────────────
// Control method plausibility
// ─────────────────────────────────────────────

std::vector<ControlMethodKind> HardwareProfiler::detect_freq_methods(
    const GenerationEntry& entry, bool recognized) {
    if (!recognized) {
        return {ControlMethodKind::GovernorScaling};
    }

    std::vector<ControlMethodKind> methods;
    for (auto kind : entry.methods) {
        bool plausible = false;
        switch (kind) {
            case ControlMethodKind::GovernorScaling:
                plausible = path_exists(paths_.sysfs_root / "devices/system/cpu/cpu0/cpufreq");
                break;
            case ControlMethodKind::DirectRegister:
                plausible = frequency_.enable_direct_register && !entry.multipliers.empty()
                            && path_exists(paths_.dev_root / "cpu/0/msr");
                break;
            case ControlMethodKind::VendorTool:
                plausible = frequency_.enable_vendor_tool && runner_.available("cpupower");
                break;
            case ControlMethodKind::BootParameterFallback:
                plausible = !frequency_.boot_fallback_path.empty();
                break;
            default:
                break;
        }
        if (plausible) methods.push_back(kind);
    }

    if (methods.empty()) {
        logger_.warn("No frequency control interface found; keeping governor scaling "
                     "as the only candidate");
        methods.push_back(ControlMethodKind::GovernorScaling);
    }
    return methods;
}

// ─────────────────────────────────────────────
// GPU
// ─────────────────────────────────────────────

void HardwareProfiler::detect_gpu(HardwareProfile& profile) {
    struct Card {
        GpuVendor vendor;
        fs::path device;
    };
    std::vector<Card> cards;
    for (const auto& card : list_entries(paths_.sysfs_root / "class/drm", "card")) {
        if (card.filename().string().find('-') != std::string::npos) continue;  // connector
        auto id = read_first_line(card / "device/vendor");
        if (!id) continue;
        auto vendor = gpu_vendor_from_pci(*id);
        if (vendor != GpuVendor::None) cards.push_back({vendor, card / "device"});
    }

    auto find_card = [&](GpuVendor vendor) -> const Card* {
        auto it = std::find_if(cards.begin(), cards.end(),
                               [&](const Card& c) { return c.vendor == vendor; });
        return it == cards.end() ? nullptr : &*it;
    };

    // Discrete vendors first; an Intel iGPU is only reported when alone.
    if (const auto* c = find_card(GpuVendor::Nvidia)) {
        profile.gpu_vendor = GpuVendor::Nvidia;
        profile.gpu_device_path = c->device;
        profile.gpu_power_cap = has_power_cap(c->device);
        return;
    }
    if (runner_.available("nvidia-smi")) {
        auto out = runner_.run({"nvidia-smi", "-L"}, Duration{2000});
        if (out && out->ok() && !trim(out->stdout_text).empty()) {
            profile.gpu_vendor = GpuVendor::Nvidia;
            // "GPU 0: NVIDIA GeForce GTX 1060 (UUID: ...)"
            auto first = out->stdout_text.substr(0, out->stdout_text.find('\n'));
            auto colon = first.find(": ");
            auto paren = first.find(" (UUID");
            if (colon != std::string::npos) {
                profile.gpu_model = trim(first.substr(colon + 2, paren == std::string::npos
                                                                     ? std::string::npos
                                                                     : paren - colon - 2));
            }
            return;
        }
    }
    for (auto vendor : {GpuVendor::Amd, GpuVendor::Intel}) {
        if (const auto* c = find_card(vendor)) {
            profile.gpu_vendor = vendor;
            profile.gpu_device_path = c->device;
            profile.gpu_power_profile = fs::exists(c->device / "power_profile");
            profile.gpu_power_cap = has_power_cap(c->device);
            return;
        }
    }
    if (detect_gpu_lspci(profile)) return;
    profile.gpu_vendor = GpuVendor::None;
}

bool HardwareProfiler::detect_gpu_lspci(HardwareProfile& profile) {
    if (!runner_.available("lspci")) return false;
    auto out = runner_.run({"lspci", "-nn"}, Duration{2000});
    if (!out || !out->ok()) return false;

    struct Found {
        GpuVendor vendor;
        std::string model;
    };
    std::vector<Found> found;
    std::istringstream iss(out->stdout_text);
    std::string line;
    while (std::getline(iss, line)) {
        auto vendor = gpu_vendor_from_lspci(line);
        if (vendor == GpuVendor::None) continue;
        // "01:00.0 VGA compatible controller [0300]: <model>"
        auto colon = line.find("]: ");
        std::string model = colon == std::string::npos ? trim(line)
                                                       : trim(line.substr(colon + 3));
        found.push_back({vendor, std::move(model)});
    }

    for (auto vendor : {GpuVendor::Nvidia, GpuVendor::Amd, GpuVendor::Intel}) {
        auto it = std::find_if(found.begin(), found.end(),
                               [&](const Found& f) { return f.vendor == vendor; });
        if (it != found.end()) {
            profile.gpu_vendor = it->vendor;
            profile.gpu_model = it->model;
            logger_.debug("GPU found by lspci: " + it->model);
            return true;
        }
    }
    return false;
}

// ─────────────────────────────────────────────
// Thermal limits
// ─────────────────────────────────────────────

void HardwareProfiler::apply_thermal_overrides(HardwareProfile& profile) {
    auto& limits = profile.thermal_limits;
    bool overridden = false;
    auto apply = [&](const std::optional<double>& value, double& target) {
        if (value) {
            target = *value;
            overridden = true;
        }
    };
    apply(thermal_.comfort_c, limits.comfort);
    apply(thermal_.warning_c, limits.warning);
    apply(thermal_.critical_c, limits.critical);
    apply(thermal_.emergency_c, limits.emergency);

    if (overridden) {
        logger_.info("Thermal limits overridden by configuration");
    }
}

// ─────────────────────────────────────────────
// detect
// ─────────────────────────────────────────────

Result<HardwareProfile> HardwareProfiler::detect() {
    HardwareProfile profile;
    const auto cpu = read_cpu_identity();

    profile.cpu_model = cpu.model;
    if (cpu.core_count == 0) {
        profile.core_count = 1;
        profile.used_defaults = true;
        logger_.warn("Could not count processors in cpuinfo; assuming 1 core");
    } else {
        profile.core_count = cpu.core_count;
    }

    const auto& table = generation_table();
    auto match = cpu.model.empty() ? std::nullopt : match_generation(cpu.model, table);
    const GenerationEntry entry = match ? *match->entry : conservative_entry(table);
    if (!match) {
        profile.used_defaults = true;
        logger_.warn("CPU model '" + cpu.model + "' not recognized; using conservative "
                     "thermal limits and governor scaling only");
    }

    profile.cpu_generation = entry.generation;
    profile.cpu_vendor = cpu.vendor != CpuVendor::Unknown ? cpu.vendor : entry.vendor;
    profile.tjmax_c = thermal_.tjmax_override_c.value_or(entry.tjmax_c);
    profile.thermal_limits = derive_thermal_limits(profile.tjmax_c);
    multipliers_ = match ? entry.multipliers : std::vector<MultiplierStep>{};

    detect_frequency_range(profile, cpu);
    profile.available_freq_methods = detect_freq_methods(entry, match.has_value());

    if (profile.supported_frequencies_khz.empty()
        && profile.has_method(ControlMethodKind::DirectRegister)) {
        for (const auto& step : multipliers_) {
            if (step.freq_khz >= profile.freq_min_khz && step.freq_khz <= profile.freq_max_khz) {
                profile.supported_frequencies_khz.push_back(step.freq_khz);
            }
        }
    }
    std::sort(profile.supported_frequencies_khz.begin(),
              profile.supported_frequencies_khz.end());
    profile.supported_frequencies_khz.erase(
        std::unique(profile.supported_frequencies_khz.begin(),
                    profile.supported_frequencies_khz.end()),
        profile.supported_frequencies_khz.end());

    detect_gpu(profile);
    apply_thermal_overrides(profile);

    if (!profile.thermal_limits.is_valid()) {
        const auto& l = profile.thermal_limits;
        return Error{ErrorCode::Fatal,
                     "Thermal limits are not strictly increasing (comfort "
                     + std::to_string(l.comfort) + ", warning " + std::to_string(l.warning)
                     + ", critical " + std::to_string(l.critical) + ", emergency "
                     + std::to_string(l.emergency) + ")"};
    }

    logger_.info("Hardware profile: " + std::string(to_string(profile.cpu_vendor)) + " "
                 + std::string(to_string(profile.cpu_generation)) + ", "
                 + std::to_string(profile.core_count) + " cores, "
                 + std::to_string(profile.freq_min_khz / 1000) + "-"
                 + std::to_string(profile.freq_max_khz / 1000) + " MHz, GPU "
                 + std::string(to_string(profile.gpu_vendor)));
    return profile;
}

std::string HardwareProfiler::describe(const HardwareProfile& p) {
    std::ostringstream oss;
    oss << "CPU:          " << (p.cpu_model.empty() ? "unknown" : p.cpu_model) << '\n'
        << "Vendor:       " << to_string(p.cpu_vendor) << '\n'
        << "Generation:   " << to_string(p.cpu_generation) << '\n'
        << "Cores:        " << p.core_count << '\n'
        << "Frequency:    " << p.freq_min_khz / 1000 << " - " << p.freq_max_khz / 1000
        << " MHz";
    if (!p.supported_frequencies_khz.empty()) {
        oss << " (" << p.supported_frequencies_khz.size() << " steps)";
    }
    oss << '\n'
        << "Tjmax:        " << p.tjmax_c << " C\n"
        << "Limits:       comfort " << p.thermal_limits.comfort
        << " / warning " << p.thermal_limits.warning
        << " / critical " << p.thermal_limits.critical
        << " / emergency " << p.thermal_limits.emergency << " C\n"
        << "Freq methods:";
    for (auto kind : p.available_freq_methods) oss << ' ' << to_string(kind);
    oss << '\n'
        << "GPU:          " << to_string(p.gpu_vendor);
    if (!p.gpu_model.empty()) oss << ", " << p.gpu_model;
    if (p.gpu_device_path) oss << " (" << p.gpu_device_path->string() << ')';
    if (p.gpu_power_profile) oss << ", power_profile";
    if (p.gpu_power_cap) oss << ", power cap";
    oss << '\n';
    if (p.used_defaults) oss << "Note:         some values are defaults\n";
    return oss.str();
}

}  // namespace thermal_guard
