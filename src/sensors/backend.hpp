/**
 * @file backend.hpp
 * @brief Sensor backend interface.
 * @author Dimitris Kafetzis
 *
 * Each backend reads one data source and returns typed readings. Backends
 * are polled concurrently by the SensorAggregator; a failing backend must
 * never affect the others, so poll() is noexcept and failure is an empty
 * list.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace thermal_guard {

/**
 * @brief Dedup preference of a backend: lower means narrower scope.
 *
 * When two backends report the same (chip, label), the reading from the
 * lower rank is kept.
 */
enum class ScopeRank : uint8_t {
    VendorGpuTool = 0,
    Hwmon = 1,
    DiagnosticTool = 2,
    PlatformPower = 3,
    ThermalZone = 4
};

/**
 * @brief Abstract sensor source (virtual: backends are chosen at startup).
 */
class ISensorBackend {
public:
    virtual ~ISensorBackend() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual ScopeRank scope_rank() const noexcept = 0;

    /**
     * @brief Read the source once.
     *
     * Never throws. On failure returns an empty list and keeps the reason
     * for last_error(). Every returned reading is tagged with name().
     */
    std::vector<SensorReading> poll() noexcept;

    /// Reason for the most recent empty poll, if it failed.
    [[nodiscard]] std::optional<std::string> last_error() const;

protected:
    virtual Result<std::vector<SensorReading>> collect() = 0;

private:
    void set_error(std::optional<std::string> error) noexcept;

    mutable std::mutex error_mutex_;
    std::optional<std::string> last_error_;
};

}  // namespace thermal_guard
