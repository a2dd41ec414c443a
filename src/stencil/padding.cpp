#include "localderiv/stencil/padding.hpp"
#include "localderiv/stencil/stencil_table.hpp"
#include <algorithm>

namespace localderiv::stencil {

auto margin_of(const Stencil& stencil) noexcept -> Margin {
  return Margin{-stencil.min_offset(), stencil.max_offset()};
}

auto merge(Margin a, Margin b) noexcept -> Margin {
  return Margin{std::max(a.low, b.low), std::max(a.high, b.high)};
}

auto pad(const core::Interval& interval, Margin margin) -> core::Interval {
  return interval.expand(margin.low, margin.high);
}

auto gradient_padded_interval(const core::Interval& interval, DifferenceKind kind, int order)
    -> std::expected<core::Interval, core::ConfigurationError> {
  auto stencil = first_derivative(kind, order);
  if (!stencil) {
    return std::unexpected(stencil.error());
  }
  return pad(interval, margin_of(**stencil));
}

auto hessian_padded_interval(const core::Interval& interval, int order)
    -> std::expected<core::Interval, core::ConfigurationError> {
  auto diagonal = second_derivative(DifferenceKind::Central, order);
  if (!diagonal) {
    return std::unexpected(diagonal.error());
  }
  auto mixed = first_derivative(DifferenceKind::Central, order);
  if (!mixed) {
    return std::unexpected(mixed.error());
  }
  return pad(interval, merge(margin_of(**diagonal), margin_of(**mixed)));
}

} // namespace localderiv::stencil
