#pragma once
#include "../core/exceptions.hpp"
#include "stencil.hpp"
#include <expected>
#include <memory>
#include <span>

namespace localderiv::stencil {

using StencilPtr = std::shared_ptr<const Stencil>;

/**
 * @brief Lookup of the built-in finite-difference formulas.
 *
 * | derivative | kind              | orders     |
 * |------------|-------------------|------------|
 * | first      | central           | 2, 4, 6, 8 |
 * | first      | forward, backward | 1 .. 6     |
 * | second     | central           | 2, 4       |
 *
 * The tables are built once on first use and shared read-only by every caller.
 * Any other (kind, order) pair is a configuration error; there is no fallback.
 */
[[nodiscard]] auto first_derivative(DifferenceKind kind, int order)
    -> std::expected<StencilPtr, core::ConfigurationError>;

[[nodiscard]] auto second_derivative(DifferenceKind kind, int order)
    -> std::expected<StencilPtr, core::ConfigurationError>;

[[nodiscard]] auto lookup(Derivative derivative, DifferenceKind kind, int order)
    -> std::expected<StencilPtr, core::ConfigurationError>;

[[nodiscard]] auto supported_orders(Derivative derivative, DifferenceKind kind) noexcept -> std::span<const int>;

[[nodiscard]] auto is_supported(Derivative derivative, DifferenceKind kind, int order) noexcept -> bool;

} // namespace localderiv::stencil
