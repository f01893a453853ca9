/**
 * @file backend.cpp
 * @brief ISensorBackend error containment.
 * @author Dimitris Kafetzis
 */

#include "sensors/backend.hpp"

#include <exception>

namespace thermal_guard {

std::vector<SensorReading> ISensorBackend::poll() noexcept {
    try {
        auto result = collect();
        if (!result) {
            set_error(result.error().message);
            return {};
        }
        auto readings = std::move(result).value();
        for (auto& reading : readings) {
            reading.backend = std::string{name()};
        }
        set_error(std::nullopt);
        return readings;
    } catch (const std::exception& e) {
        set_error(std::string{"exception: "} + e.what());
        return {};
    }
}

std::optional<std::string> ISensorBackend::last_error() const {
    std::lock_guard lock(error_mutex_);
    return last_error_;
}

void ISensorBackend::set_error(std::optional<std::string> error) noexcept {
    std::lock_guard lock(error_mutex_);
    last_error_ = std::move(error);
}

}  // namespace thermal_guard
