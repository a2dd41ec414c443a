#pragma once
#include "../access/access_concepts.hpp"
#include "../stencil/stencil.hpp"
#include <cstddef>

namespace localderiv::derivatives {

/**
 * @brief Moves a cursor by `delta` along `axis` for the lifetime of the object.
 *
 * The inverse move runs in the destructor, so the cursor is back at its entry
 * coordinate on every exit path, including a read that throws.
 */
template <access::ScalarCursor Cursor>
class ScopedDisplacement {
private:
  Cursor& cursor_;
  core::Index delta_;
  std::size_t axis_;

public:
  ScopedDisplacement(Cursor& cursor, core::Index delta, std::size_t axis) : cursor_(cursor), delta_(delta), axis_(axis) {
    cursor_.move(delta_, axis_);
  }

  ~ScopedDisplacement() { cursor_.move(-delta_, axis_); }

  ScopedDisplacement(const ScopedDisplacement&) = delete;
  ScopedDisplacement& operator=(const ScopedDisplacement&) = delete;
  ScopedDisplacement(ScopedDisplacement&&) = delete;
  ScopedDisplacement& operator=(ScopedDisplacement&&) = delete;
};

// Applies a 1-D stencil along `axis` around the cursor's current position.
template <access::ScalarCursor Cursor>
[[nodiscard]] auto sample_along(Cursor& cursor, const stencil::Stencil& stencil, std::size_t axis) -> double {
  double accumulator = 0.0;
  for (const auto& tap : stencil.taps()) {
    ScopedDisplacement<Cursor> shift(cursor, tap.offset, axis);
    accumulator += static_cast<double>(tap.numerator) * cursor.get();
  }
  return accumulator / static_cast<double>(stencil.divisor());
}

/**
 * @brief Mixed partial d2f / (dx_outer dx_inner) by nesting one first-derivative
 * stencil inside itself.
 *
 * For every tap of the stencil along `outer`, the same stencil is applied along
 * `inner` at the displaced position; the weighted sum is divided by divisor^2.
 * With the order-2 central stencil this is
 * (f(+1,+1) - f(+1,-1) - f(-1,+1) + f(-1,-1)) / 4.
 */
template <access::ScalarCursor Cursor>
[[nodiscard]] auto sample_mixed(Cursor& cursor, const stencil::Stencil& stencil, std::size_t outer, std::size_t inner)
    -> double {
  double accumulator = 0.0;
  for (const auto& outer_tap : stencil.taps()) {
    ScopedDisplacement<Cursor> outer_shift(cursor, outer_tap.offset, outer);
    double inner_sum = 0.0;
    for (const auto& inner_tap : stencil.taps()) {
      ScopedDisplacement<Cursor> inner_shift(cursor, inner_tap.offset, inner);
      inner_sum += static_cast<double>(inner_tap.numerator) * cursor.get();
    }
    accumulator += static_cast<double>(outer_tap.numerator) * inner_sum;
  }
  const auto divisor = static_cast<double>(stencil.divisor());
  return accumulator / (divisor * divisor);
}

} // namespace localderiv::derivatives
