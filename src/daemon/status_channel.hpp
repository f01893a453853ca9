/**
 * @file status_channel.hpp
 * @brief Latest daemon status, readable from any thread.
 * @author Dimitris Kafetzis
 *
 * The control loop publishes one immutable DaemonStatus per cycle. Readers
 * either poll latest() or subscribe for a callback on every publish; the
 * process-priority collaborator consumes the zone, profile and priority
 * recommendation this way.
 */

#pragma once

#include "control/control_abstraction.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "thermal/thermal_controller.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace thermal_guard {

struct DaemonStatus {
    uint64_t cycle{0};
    Timestamp timestamp;
    ThermalDecision decision;
    std::shared_ptr<const SensorSnapshot> snapshot;
    std::optional<PowerProfile> applied_profile;          ///< Last fully applied profile
    std::optional<ProfileApplication> last_application;   ///< Most recent apply attempt
    std::vector<std::string> alerts;
    std::vector<std::string> notices;
};

/// Compact JSON rendering (zone, profile, priority, temperature, outcomes).
[[nodiscard]] std::string to_json(const DaemonStatus& status);

class StatusChannel {
public:
    using Subscriber = std::function<void(const DaemonStatus&)>;
    using SubscriptionId = uint64_t;

    explicit StatusChannel(Logger& logger);

    /// Store `status` as latest and notify subscribers on the caller's thread.
    void publish(std::shared_ptr<const DaemonStatus> status);

    /// nullptr until the first publish.
    [[nodiscard]] std::shared_ptr<const DaemonStatus> latest() const;

    SubscriptionId subscribe(Subscriber subscriber);
    bool unsubscribe(SubscriptionId id);

    [[nodiscard]] uint64_t publish_count() const noexcept { return published_.load(); }

private:
    Logger& logger_;
    std::atomic<std::shared_ptr<const DaemonStatus>> latest_;
    std::atomic<uint64_t> published_{0};

    mutable std::mutex subscribers_mutex_;
    std::vector<std::pair<SubscriptionId, Subscriber>> subscribers_;
    SubscriptionId next_id_{1};
};

}  // namespace thermal_guard
