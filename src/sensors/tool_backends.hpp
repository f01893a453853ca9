/**
 * @file tool_backends.hpp
 * @brief Sensor backends that shell out to vendor/diagnostic tools.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "platform/command_runner.hpp"
#include "sensors/backend.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace thermal_guard {

/**
 * @brief lm-sensors `sensors -A` output.
 *
 * Chip ids are normalized to the driver name before the first '-'
 * ("coretemp-isa-0000" -> "coretemp") so they collide with hwmon names
 * and deduplicate against them.
 */
class LmSensorsBackend : public ISensorBackend {
public:
    LmSensorsBackend(ICommandRunner& runner, Duration timeout);

    [[nodiscard]] std::string_view name() const noexcept override { return "lm_sensors"; }
    [[nodiscard]] ScopeRank scope_rank() const noexcept override {
        return ScopeRank::DiagnosticTool;
    }

    /// Parse the text printed by `sensors -A`.
    [[nodiscard]] static std::vector<SensorReading> parse(std::string_view text);

protected:
    Result<std::vector<SensorReading>> collect() override;

private:
    ICommandRunner& runner_;
    Duration timeout_;
};

/**
 * @brief NVIDIA GPU telemetry through nvidia-smi CSV queries.
 *
 * One chip per GPU ("nvidia-gpu<index>"). Fields reported as N/A become
 * readings without a value.
 */
class NvidiaSmiBackend : public ISensorBackend {
public:
    NvidiaSmiBackend(ICommandRunner& runner, Duration timeout);

    [[nodiscard]] std::string_view name() const noexcept override { return "nvidia_smi"; }
    [[nodiscard]] ScopeRank scope_rank() const noexcept override {
        return ScopeRank::VendorGpuTool;
    }

    static constexpr std::string_view kQuery =
        "--query-gpu=index,temperature.gpu,power.draw,power.limit";

    /// Parse `--format=csv,noheader,nounits` output of kQuery.
    [[nodiscard]] static std::vector<SensorReading> parse(std::string_view text);

protected:
    Result<std::vector<SensorReading>> collect() override;

private:
    ICommandRunner& runner_;
    Duration timeout_;
};

}  // namespace thermal_guard
