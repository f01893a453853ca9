/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for ThermalGuard interfaces.
 * @author Dimitris Kafetzis
 *
 * The daemon loop is a template over its snapshot source so that tests can
 * drive it with scripted temperature sequences instead of real hardware.
 */

#pragma once

#include "core/types.hpp"

#include <concepts>
#include <memory>

namespace thermal_guard {

// ─────────────────────────────────────────────
// SnapshotSourceLike
// ─────────────────────────────────────────────

/**
 * @concept SnapshotSourceLike
 * @brief Constrains types that produce one SensorSnapshot per poll cycle.
 *
 * poll() must never throw and must return within its own deadline; an
 * empty snapshot is a valid result.
 */
template <typename T>
concept SnapshotSourceLike = requires(T source) {
    { source.poll() } -> std::same_as<std::shared_ptr<const SensorSnapshot>>;
};

}  // namespace thermal_guard
