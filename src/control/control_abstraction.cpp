/**
 * @file control_abstraction.cpp
 * @brief ControlAbstraction and its default method wiring.
 * @author Dimitris Kafetzis
 */

#include "control/control_abstraction.hpp"

#include <algorithm>

namespace thermal_guard {

ControlAbstraction::ControlAbstraction(std::shared_ptr<const HardwareProfile> hardware,
                                       ProfileTable profiles,
                                       Logger& logger)
    : hardware_(std::move(hardware))
    , profiles_(std::move(profiles))
    , logger_(logger)
    , frequency_("frequency", logger)
    , fan_("fan", logger)
    , gpu_power_("gpu_power", logger)
    , platform_profile_("platform_profile", logger) {}

ProfileApplication ControlAbstraction::apply_profile(PowerProfile profile, bool manage_fans,
                                                     std::optional<FanDirective> fan_floor) {
    ProfileApplication app;
    app.profile = profile;
    const auto& settings = profiles_.at(profile);

    app.frequency = profiles_.resolve_frequency(profile, *hardware_);
    if (app.frequency.snapped) {
        logger_.info("frequency target " + std::to_string(app.frequency.requested_khz)
                     + " kHz snapped to supported step "
                     + std::to_string(app.frequency.khz) + " kHz");
    }
    app.frequency_outcome = frequency_.set(FrequencyTarget{app.frequency.khz});

    app.fan = fan_floor ? hotter(settings.fan, *fan_floor) : settings.fan;
    if (manage_fans) {
        app.fan_outcome = fan_.set(app.fan);
    }

    const PlatformPowerTarget power{profile, settings.gpu_token};
    if (gpu_power_.method_count() > 0) {
        app.gpu_power_outcome = gpu_power_.set(power);
    }
    app.platform_profile_outcome = platform_profile_.set(power);

    logger_.info("profile " + std::string(to_string(profile)) + ": frequency "
                 + app.frequency_outcome.summary()
                 + (app.fan_outcome ? ", fan " + app.fan_outcome->summary() : std::string{})
                 + (app.gpu_power_outcome ? ", gpu power " + app.gpu_power_outcome->summary()
                                          : std::string{})
                 + ", platform profile " + app.platform_profile_outcome.summary());
    return app;
}

ControlOutcome ControlAbstraction::set_frequency(uint32_t khz) {
    return frequency_.set(FrequencyTarget{khz});
}

ControlOutcome ControlAbstraction::set_fan(FanDirective directive) {
    return fan_.set(directive);
}

std::vector<FanDevice> ControlAbstraction::fan_devices() const {
    if (!pwm_) return {};
    return pwm_->devices();
}

// ─────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────

std::unique_ptr<ControlAbstraction> make_control_abstraction(
    std::shared_ptr<const HardwareProfile> hardware,
    const Config& config,
    const std::vector<MultiplierStep>& multipliers,
    ICommandRunner& runner,
    Logger& logger) {
    const auto timeout = Duration{config.sensors.backend_timeout_ms};
    const auto floor = static_cast<uint8_t>(std::min<uint32_t>(config.fan.min_percent, 100));
    const auto& sensors = config.sensors;

    auto control = std::make_unique<ControlAbstraction>(
        hardware, ProfileTable(config.profiles), logger);

    int prio = 0;
    for (auto kind : hardware->available_freq_methods) {
        switch (kind) {
            case ControlMethodKind::GovernorScaling:
                control->frequency_axis().add_method(
                    std::make_unique<GovernorScalingMethod>(sensors.sysfs_root, prio));
                break;
            case ControlMethodKind::DirectRegister:
                control->frequency_axis().add_method(
                    std::make_unique<DirectRegisterMethod>(sensors.dev_root, multipliers, prio));
                break;
            case ControlMethodKind::VendorTool:
                control->frequency_axis().add_method(
                    std::make_unique<VendorToolMethod>(runner, timeout, prio));
                break;
            case ControlMethodKind::BootParameterFallback:
                control->frequency_axis().add_method(
                    std::make_unique<BootParameterFallbackMethod>(
                        config.frequency.boot_fallback_path,
                        BootParameterFallbackMethod::default_params(hardware->cpu_vendor),
                        prio));
                break;
            default:
                logger.warn("ignoring non-frequency method "
                            + std::string(to_string(kind)) + " in hardware profile");
                continue;
        }
        ++prio;
    }

    auto pwm = std::make_unique<PwmFanMethod>(sensors.sysfs_root, floor, 0);
    control->attach_pwm_method(pwm.get());
    control->fan_axis().add_method(std::move(pwm));
    if (hardware->gpu_vendor == GpuVendor::Nvidia) {
        control->fan_axis().add_method(
            std::make_unique<NvidiaSettingsFanMethod>(runner, timeout, floor, 0, 0, 1));
    }

    if (hardware->gpu_vendor == GpuVendor::Amd && hardware->gpu_device_path) {
        control->gpu_power_axis().add_method(
            std::make_unique<DrmPowerLevelMethod>(*hardware->gpu_device_path, 0));
        control->gpu_power_axis().add_method(
            std::make_unique<RadeonPowerProfileMethod>(*hardware->gpu_device_path, 1));
    }
    control->platform_profile_axis().add_method(
        std::make_unique<PlatformProfileMethod>(sensors.sysfs_root, 0));

    return control;
}

}  // namespace thermal_guard
