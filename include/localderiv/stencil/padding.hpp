#pragma once
#include "../core/exceptions.hpp"
#include "../core/interval.hpp"
#include "stencil.hpp"
#include <expected>

namespace localderiv::stencil {

// Samples needed below min and above max of the requested region, same on every axis.
struct Margin {
  core::Index low = 0;
  core::Index high = 0;

  friend bool operator==(const Margin&, const Margin&) = default;
};

[[nodiscard]] auto margin_of(const Stencil& stencil) noexcept -> Margin;

// Smallest margin covering both.
[[nodiscard]] auto merge(Margin a, Margin b) noexcept -> Margin;

[[nodiscard]] auto pad(const core::Interval& interval, Margin margin) -> core::Interval;

/**
 * @brief Region a gradient evaluator reads for a requested region.
 *
 * central order o  : o/2 on both sides
 * forward order o  : 0 below, o above
 * backward order o : o below, 0 above
 *
 * Source bounds are not checked here.
 */
[[nodiscard]] auto gradient_padded_interval(const core::Interval& interval, DifferenceKind kind, int order)
    -> std::expected<core::Interval, core::ConfigurationError>;

// Central Hessian of order o: o/2 on both sides.
[[nodiscard]] auto hessian_padded_interval(const core::Interval& interval, int order)
    -> std::expected<core::Interval, core::ConfigurationError>;

} // namespace localderiv::stencil
