/**
 * @file control_axis.hpp
 * @brief Ranked-fallback control axis over interchangeable methods.
 * @author Dimitris Kafetzis
 *
 * A control axis (CPU frequency, fan speed, platform power) owns an ordered
 * list of methods that can each drive the same hardware quantity through a
 * different interface. set() walks the list in priority order, re-probing
 * every method on every call, and stops at the first method that applies
 * successfully.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace thermal_guard {

// ─────────────────────────────────────────────
// IControlMethod<TargetT> (virtual, chosen at runtime)
// ─────────────────────────────────────────────

template <typename TargetT>
class IControlMethod {
public:
    virtual ~IControlMethod() = default;

    [[nodiscard]] virtual ControlMethodKind kind() const noexcept = 0;

    /// Lower values are tried first.
    [[nodiscard]] virtual int priority() const noexcept = 0;

    /// Capability check; called before every apply().
    [[nodiscard]] virtual bool is_available() = 0;

    virtual Result<void> apply(const TargetT& target) = 0;
};

// ─────────────────────────────────────────────
// ControlOutcome
// ─────────────────────────────────────────────

struct ControlOutcome {
    bool success{false};
    std::optional<ControlMethodKind> method;      ///< The method that succeeded
    std::vector<ControlMethodKind> attempted;     ///< Reported available, then apply() was tried
    std::vector<std::string> failures;            ///< "kind: reason" per failed method

    [[nodiscard]] std::string summary() const {
        if (success && method) return "ok via " + std::string(to_string(*method));
        if (failures.empty()) return "no method available";
        std::string out = "failed:";
        for (const auto& f : failures) out += " [" + f + "]";
        return out;
    }
};

// ─────────────────────────────────────────────
// ControlAxis<TargetT>
// ─────────────────────────────────────────────

template <typename TargetT>
class ControlAxis {
public:
    using Method = IControlMethod<TargetT>;

    ControlAxis(std::string name, Logger& logger)
        : name_(std::move(name)), logger_(logger) {}

    /// Insert keeping priority order; equal priorities keep insertion order.
    void add_method(std::unique_ptr<Method> method) {
        auto pos = std::upper_bound(methods_.begin(), methods_.end(), method->priority(),
            [](int prio, const std::unique_ptr<Method>& m) { return prio < m->priority(); });
        methods_.insert(pos, std::move(method));
    }

    /**
     * @brief Drive the axis to `target` using the first method that works.
     *
     * Never throws. A method that throws counts as failed. When every
     * method fails the hardware state is unspecified and the cached
     * last-successful method is left unchanged.
     */
    ControlOutcome set(const TargetT& target) {
        ControlOutcome outcome;
        for (const auto& method : methods_) {
            const auto kind = method->kind();
            try {
                if (!method->is_available()) {
                    outcome.failures.push_back(std::string(to_string(kind)) + ": unavailable");
                    continue;
                }
                outcome.attempted.push_back(kind);
                auto result = method->apply(target);
                if (result) {
                    if (last_successful_ != kind) {
                        logger_.info(name_ + " control now via " + std::string(to_string(kind)));
                    }
                    last_successful_ = kind;
                    outcome.success = true;
                    outcome.method = kind;
                    return outcome;
                }
                outcome.failures.push_back(std::string(to_string(kind)) + ": "
                                           + result.error().message);
                logger_.debug(name_ + " method " + std::string(to_string(kind))
                              + " failed: " + result.error().message);
            } catch (const std::exception& e) {
                outcome.failures.push_back(std::string(to_string(kind)) + ": " + e.what());
                logger_.warn(name_ + " method " + std::string(to_string(kind))
                             + " threw: " + e.what());
            }
        }
        logger_.warn(name_ + " control exhausted all " + std::to_string(methods_.size())
                     + " methods: " + outcome.summary());
        return outcome;
    }

    [[nodiscard]] std::optional<ControlMethodKind> last_successful() const noexcept {
        return last_successful_;
    }
    [[nodiscard]] size_t method_count() const noexcept { return methods_.size(); }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// Method kinds in the order set() tries them.
    [[nodiscard]] std::vector<ControlMethodKind> order() const {
        std::vector<ControlMethodKind> kinds;
        for (const auto& m : methods_) kinds.push_back(m->kind());
        return kinds;
    }

private:
    std::string name_;
    Logger& logger_;
    std::vector<std::unique_ptr<Method>> methods_;
    std::optional<ControlMethodKind> last_successful_;
};

}  // namespace thermal_guard
