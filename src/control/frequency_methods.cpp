/**
 * @file frequency_methods.cpp
 * @brief Frequency control method implementations.
 * @author Dimitris Kafetzis
 */

#include "control/frequency_methods.hpp"
#include "platform/sysfs.hpp"

#include <cerrno>
#include <cstring>
#include <regex>

#include <fcntl.h>
#include <unistd.h>

namespace thermal_guard {

namespace fs = std::filesystem;

namespace {

bool writable(const fs::path& path) {
    return ::access(path.c_str(), W_OK) == 0;
}

bool is_pstate_driver(std::string_view driver) {
    return driver.starts_with("intel_pstate") || driver.starts_with("amd-pstate")
        || driver.starts_with("amd_pstate") || driver == "intel_cpufreq";
}

}  // namespace

std::vector<fs::path> cpufreq_policies(const fs::path& sysfs_root) {
    static const std::regex cpu_re(R"(^cpu\d+$)");
    std::vector<fs::path> out;
    for (const auto& dir : list_entries(sysfs_root / "devices/system/cpu", "cpu")) {
        if (!std::regex_match(dir.filename().string(), cpu_re)) continue;
        if (path_exists(dir / "cpufreq")) out.push_back(dir / "cpufreq");
    }
    return out;
}

// ─────────────────────────────────────────────
// GovernorScalingMethod
// ─────────────────────────────────────────────

GovernorScalingMethod::GovernorScalingMethod(fs::path sysfs_root, int priority)
    : sysfs_root_(std::move(sysfs_root)), priority_(priority) {}

bool GovernorScalingMethod::is_available() {
    auto policies = cpufreq_policies(sysfs_root_);
    return !policies.empty() && writable(policies.front() / "scaling_max_freq");
}

Result<void> GovernorScalingMethod::apply_cap(const fs::path& cpufreq, uint32_t khz) {
    // Lower the floor first, otherwise the kernel rejects max < min.
    if (auto current_min = read_integer(cpufreq / "scaling_min_freq");
        current_min && *current_min > static_cast<long long>(khz)) {
        if (auto r = write_text(cpufreq / "scaling_min_freq", std::to_string(khz)); !r) {
            return r;
        }
    }
    return write_text(cpufreq / "scaling_max_freq", std::to_string(khz));
}

Result<void> GovernorScalingMethod::apply_setspeed(const fs::path& cpufreq, uint32_t khz) {
    if (read_first_line(cpufreq / "scaling_governor").value_or("") != "userspace") {
        if (auto r = write_text(cpufreq / "scaling_governor", "userspace"); !r) return r;
    }
    return write_text(cpufreq / "scaling_setspeed", std::to_string(khz));
}

Result<void> GovernorScalingMethod::apply(const FrequencyTarget& target) {
    auto policies = cpufreq_policies(sysfs_root_);
    if (policies.empty()) {
        return Error{ErrorCode::ControlFailed, "no cpufreq policies"};
    }

    for (const auto& cpufreq : policies) {
        const auto driver = read_first_line(cpufreq / "scaling_driver").value_or("");
        const auto governors =
            read_first_line(cpufreq / "scaling_available_governors").value_or("");
        const bool use_setspeed = !is_pstate_driver(driver)
            && governors.find("userspace") != std::string::npos
            && path_exists(cpufreq / "scaling_setspeed");

        auto r = use_setspeed ? apply_setspeed(cpufreq, target.khz)
                              : apply_cap(cpufreq, target.khz);
        if (!r) {
            return Error{ErrorCode::ControlFailed,
                         cpufreq.parent_path().filename().string() + ": " + r.error().message};
        }
    }
    return {};
}

// ─────────────────────────────────────────────
// DirectRegisterMethod
// ─────────────────────────────────────────────

DirectRegisterMethod::DirectRegisterMethod(fs::path dev_root,
                                           std::vector<MultiplierStep> multipliers,
                                           int priority)
    : dev_root_(std::move(dev_root))
    , multipliers_(std::move(multipliers))
    , priority_(priority) {}

std::vector<fs::path> DirectRegisterMethod::msr_devices() const {
    std::vector<fs::path> out;
    for (const auto& dir : list_entries(dev_root_ / "cpu", "")) {
        if (!trailing_index(dir.filename().string())) continue;
        if (path_exists(dir / "msr")) out.push_back(dir / "msr");
    }
    return out;
}

bool DirectRegisterMethod::is_available() {
    if (multipliers_.empty()) return false;
    auto devices = msr_devices();
    return !devices.empty() && writable(devices.front());
}

Result<void> DirectRegisterMethod::apply(const FrequencyTarget& target) {
    auto reg = lookup_multiplier(multipliers_, target.khz);
    if (!reg) {
        return Error{ErrorCode::ControlFailed,
                     std::to_string(target.khz) + " kHz has no multiplier entry"};
    }

    const uint64_t value = *reg;
    unsigned char bytes[8];
    for (size_t i = 0; i < sizeof(bytes); ++i) {
        bytes[i] = static_cast<unsigned char>((value >> (8 * i)) & 0xFF);
    }

    auto devices = msr_devices();
    if (devices.empty()) {
        return Error{ErrorCode::ControlFailed, "no msr devices"};
    }
    for (const auto& device : devices) {
        int fd = ::open(device.c_str(), O_WRONLY | O_CLOEXEC);
        if (fd < 0) {
            return Error{ErrorCode::ControlFailed,
                         "open " + device.string() + ": " + std::strerror(errno)};
        }
        ssize_t written = ::pwrite(fd, bytes, sizeof(bytes), kPerfCtlRegister);
        int saved_errno = errno;
        ::close(fd);
        if (written != static_cast<ssize_t>(sizeof(bytes))) {
            return Error{ErrorCode::ControlFailed,
                         "pwrite " + device.string() + ": " + std::strerror(saved_errno)};
        }
    }
    return {};
}

// ─────────────────────────────────────────────
// VendorToolMethod
// ─────────────────────────────────────────────

VendorToolMethod::VendorToolMethod(ICommandRunner& runner, Duration timeout, int priority)
    : runner_(runner), timeout_(timeout), priority_(priority) {}

bool VendorToolMethod::is_available() {
    return runner_.available("cpupower");
}

Result<void> VendorToolMethod::apply(const FrequencyTarget& target) {
    auto out = runner_.run({"cpupower", "frequency-set", "-u",
                            std::to_string(target.khz / 1000) + "MHz"}, timeout_);
    if (!out) {
        return Error{ErrorCode::ControlFailed, out.error().message};
    }
    if (!out->ok()) {
        return Error{ErrorCode::ControlFailed,
                     "cpupower exited with status " + std::to_string(out->exit_code)};
    }
    return {};
}

// ─────────────────────────────────────────────
// BootParameterFallbackMethod
// ─────────────────────────────────────────────

BootParameterFallbackMethod::BootParameterFallbackMethod(fs::path drop_in,
                                                         std::string kernel_params,
                                                         int priority)
    : drop_in_(std::move(drop_in))
    , kernel_params_(std::move(kernel_params))
    , priority_(priority) {}

std::string BootParameterFallbackMethod::default_params(CpuVendor vendor) {
    if (vendor == CpuVendor::Intel) return "intel_pstate=disable processor.max_cstate=1";
    return "processor.max_cstate=1";
}

std::string BootParameterFallbackMethod::render() const {
    return "# Written by thermal_guard: no runtime frequency control was available.\n"
           "GRUB_CMDLINE_LINUX_DEFAULT=\"$GRUB_CMDLINE_LINUX_DEFAULT "
           + kernel_params_ + "\"\n";
}

bool BootParameterFallbackMethod::is_available() {
    if (drop_in_.empty()) return false;
    auto dir = drop_in_.parent_path();
    return path_exists(dir) && writable(dir);
}

Result<void> BootParameterFallbackMethod::apply(const FrequencyTarget& /*target*/) {
    const auto content = render();
    if (auto existing = read_lines(drop_in_); !existing.empty()) {
        std::string joined;
        for (const auto& line : existing) joined += line + "\n";
        if (joined == content) return {};
    }
    if (auto r = write_text(drop_in_, content); !r) {
        return Error{ErrorCode::ControlFailed, r.error().message};
    }
    return {};
}

}  // namespace thermal_guard
