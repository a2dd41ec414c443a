#pragma once
#include "../core/constants.hpp"
#include "../core/exceptions.hpp"
#include "../stencil/padding.hpp"
#include "../stencil/stencil_table.hpp"
#include "positioned_evaluator.hpp"
#include "stencil_sampling.hpp"
#include <expected>
#include <format>

namespace localderiv::derivatives {

/**
 * @brief Hessian of a sampled scalar field at the current position.
 *
 * Diagonal entries use the central second-derivative stencil of the chosen
 * order. Off-diagonal entries nest the central first-derivative stencil of the
 * same order along both axes (4 reads at order 2, 16 at order 4); each mixed
 * partial is computed once and stored at (d, e) and (e, d), so the matrix is
 * exactly symmetric. Central differences only, orders 2 and 4.
 *
 * evaluate() returns the evaluator's n x n buffer, overwritten on every call.
 */
template <access::ScalarSource Source>
class HessianEvaluator : public PositionedEvaluator<Source> {
private:
  using Base = PositionedEvaluator<Source>;

  stencil::StencilPtr diagonal_;
  stencil::StencilPtr mixed_;

  HessianEvaluator(const Source& source, const core::Interval& interval, stencil::StencilPtr diagonal,
                   stencil::StencilPtr mixed)
      : Base(source, interval,
             stencil::pad(interval, stencil::merge(stencil::margin_of(*diagonal), stencil::margin_of(*mixed))),
             source.num_dimensions(), source.num_dimensions()),
        diagonal_(std::move(diagonal)), mixed_(std::move(mixed)) {}

public:
  [[nodiscard]] static auto create(const Source& source, const core::Interval& interval, int order)
      -> std::expected<HessianEvaluator, core::ConfigurationError> {
    auto diagonal = stencil::second_derivative(stencil::DifferenceKind::Central, order);
    if (!diagonal) {
      return std::unexpected(diagonal.error());
    }
    auto mixed = stencil::first_derivative(stencil::DifferenceKind::Central, order);
    if (!mixed) {
      return std::unexpected(mixed.error());
    }
    if (interval.num_dimensions() != source.num_dimensions()) {
      return std::unexpected(core::ConfigurationError(std::format(
          "region has {} axes but the source has {}", interval.num_dimensions(), source.num_dimensions())));
    }
    return HessianEvaluator(source, interval, std::move(diagonal.value()), std::move(mixed.value()));
  }
  static auto create(const Source&&, const core::Interval&, int)
      -> std::expected<HessianEvaluator, core::ConfigurationError> = delete;

  auto evaluate() -> const core::Matrix<double>& {
    const auto n = this->num_dimensions();
    for (std::size_t d = 0; d < n; ++d) {
      this->matrix_(d, d) = sample_along(this->cursor_, *diagonal_, d);

      for (std::size_t e = d + 1; e < n; ++e) {
        const double value = sample_mixed(this->cursor_, *mixed_, d, e);
        this->matrix_(d, e) = value;
        this->matrix_(e, d) = value;
      }
    }
    return this->matrix_;
  }

  [[nodiscard]] auto copy() const -> HessianEvaluator {
    HessianEvaluator fresh(*this->source_, this->interval_, diagonal_, mixed_);
    fresh.set_position(this->position());
    return fresh;
  }

  [[nodiscard]] auto kind() const noexcept -> stencil::DifferenceKind { return stencil::DifferenceKind::Central; }
  [[nodiscard]] auto accuracy_order() const noexcept -> int { return diagonal_->order(); }
  [[nodiscard]] auto diagonal_stencil() const noexcept -> const stencil::Stencil& { return *diagonal_; }
  [[nodiscard]] auto mixed_stencil() const noexcept -> const stencil::Stencil& { return *mixed_; }
};

namespace hessian {

// order in {2, 4}; padded by order / 2 on both sides.
template <access::ScalarSource Source>
[[nodiscard]] auto central_difference(const Source& source, const core::Interval& interval,
                                      int order = constants::orders::default_order)
    -> std::expected<HessianEvaluator<Source>, core::ConfigurationError> {
  return HessianEvaluator<Source>::create(source, interval, order);
}

template <access::BoundedScalarSource Source>
[[nodiscard]] auto central_difference(const Source& source, int order = constants::orders::default_order)
    -> std::expected<HessianEvaluator<Source>, core::ConfigurationError> {
  return central_difference(source, core::Interval(source.interval()), order);
}

// Evaluators refer to their source, which must outlive them: temporaries are refused.
template <access::ScalarSource Source>
void central_difference(const Source&&, const core::Interval&, int = constants::orders::default_order) = delete;
template <access::BoundedScalarSource Source>
void central_difference(const Source&&, int = constants::orders::default_order) = delete;

} // namespace hessian

} // namespace localderiv::derivatives
