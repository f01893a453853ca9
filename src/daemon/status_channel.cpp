/**
 * @file status_channel.cpp
 * @brief StatusChannel implementation.
 * @author Dimitris Kafetzis
 */

#include "daemon/status_channel.hpp"

#include <algorithm>
#include <sstream>

namespace thermal_guard {

namespace {

void write_outcome(std::ostringstream& oss, std::string_view key, const ControlOutcome& o) {
    oss << ",\"" << key << "\":{\"success\":" << (o.success ? "true" : "false");
    if (o.method) oss << R"(,"method":")" << to_string(*o.method) << '"';
    oss << R"(,"summary":")" << json_escape(o.summary()) << "\"}";
}

}  // namespace

std::string to_json(const DaemonStatus& status) {
    const auto& d = status.decision;
    std::ostringstream oss;
    oss << R"({"cycle":)" << status.cycle
        << R"(,"timestamp":")" << format_iso8601(status.timestamp) << '"'
        << R"(,"zone":")" << to_string(d.zone) << '"'
        << R"(,"profile":")" << to_string(d.profile) << '"'
        << R"(,"escalation_count":)" << d.escalation_count
        << R"(,"data_missing":)" << (d.data_missing ? "true" : "false");
    if (d.temperature_c) oss << R"(,"cpu_temp":)" << *d.temperature_c;
    oss << R"(,"priority":{"nice":)" << d.priority.nice;
    if (d.priority.max_cores) oss << R"(,"max_cores":)" << *d.priority.max_cores;
    oss << '}';
    if (status.applied_profile) {
        oss << R"(,"applied_profile":")" << to_string(*status.applied_profile) << '"';
    }
    if (status.last_application) {
        const auto& app = *status.last_application;
        oss << R"(,"frequency_khz":)" << app.frequency.khz;
        write_outcome(oss, "frequency", app.frequency_outcome);
        if (app.fan_outcome) write_outcome(oss, "fan", *app.fan_outcome);
        if (app.gpu_power_outcome) write_outcome(oss, "gpu_power", *app.gpu_power_outcome);
        write_outcome(oss, "platform_profile", app.platform_profile_outcome);
    }
    if (status.snapshot) oss << R"(,"readings":)" << status.snapshot->size();
    oss << R"(,"alerts":)" << status.alerts.size()
        << R"(,"notices":)" << status.notices.size() << '}';
    return oss.str();
}

// ─────────────────────────────────────────────
// StatusChannel
// ─────────────────────────────────────────────

StatusChannel::StatusChannel(Logger& logger) : logger_(logger) {}

void StatusChannel::publish(std::shared_ptr<const DaemonStatus> status) {
    latest_.store(status);
    published_.fetch_add(1);

    std::vector<Subscriber> targets;
    {
        std::lock_guard lock(subscribers_mutex_);
        targets.reserve(subscribers_.size());
        for (const auto& [id, sub] : subscribers_) targets.push_back(sub);
    }
    for (const auto& sub : targets) {
        try {
            sub(*status);
        } catch (const std::exception& e) {
            logger_.warn(std::string("status subscriber threw: ") + e.what());
        }
    }
}

std::shared_ptr<const DaemonStatus> StatusChannel::latest() const {
    return latest_.load();
}

StatusChannel::SubscriptionId StatusChannel::subscribe(Subscriber subscriber) {
    std::lock_guard lock(subscribers_mutex_);
    const auto id = next_id_++;
    subscribers_.emplace_back(id, std::move(subscriber));
    return id;
}

bool StatusChannel::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(subscribers_mutex_);
    auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == subscribers_.end()) return false;
    subscribers_.erase(it);
    return true;
}

}  // namespace thermal_guard
