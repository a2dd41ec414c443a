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
 * @brief Gradient of a sampled scalar field at the current position.
 *
 * One evaluator type serves every (kind, order): the stencil chosen at
 * construction carries the formula. evaluate() fills row d of an n x 1 buffer
 * with df/dx_d and returns that buffer; the same buffer is reused by every call,
 * so copy it to keep a result.
 */
template <access::ScalarSource Source>
class GradientEvaluator : public PositionedEvaluator<Source> {
private:
  using Base = PositionedEvaluator<Source>;

  stencil::StencilPtr stencil_;

  GradientEvaluator(const Source& source, const core::Interval& interval, stencil::StencilPtr formula)
      : Base(source, interval, stencil::pad(interval, stencil::margin_of(*formula)), source.num_dimensions(), 1),
        stencil_(std::move(formula)) {}

public:
  [[nodiscard]] static auto create(const Source& source, const core::Interval& interval,
                                   stencil::DifferenceKind kind, int order)
      -> std::expected<GradientEvaluator, core::ConfigurationError> {
    auto formula = stencil::first_derivative(kind, order);
    if (!formula) {
      return std::unexpected(formula.error());
    }
    if (interval.num_dimensions() != source.num_dimensions()) {
      return std::unexpected(core::ConfigurationError(std::format(
          "region has {} axes but the source has {}", interval.num_dimensions(), source.num_dimensions())));
    }
    return GradientEvaluator(source, interval, std::move(formula.value()));
  }
  static auto create(const Source&&, const core::Interval&, stencil::DifferenceKind, int)
      -> std::expected<GradientEvaluator, core::ConfigurationError> = delete;

  auto evaluate() -> const core::Matrix<double>& {
    for (std::size_t d = 0; d < this->num_dimensions(); ++d) {
      this->matrix_(d, 0) = sample_along(this->cursor_, *stencil_, d);
    }
    return this->matrix_;
  }

  // Independent evaluator on the same source, region and stencil, at the same position.
  [[nodiscard]] auto copy() const -> GradientEvaluator {
    GradientEvaluator fresh(*this->source_, this->interval_, stencil_);
    fresh.set_position(this->position());
    return fresh;
  }

  [[nodiscard]] auto kind() const noexcept -> stencil::DifferenceKind { return stencil_->kind(); }
  [[nodiscard]] auto accuracy_order() const noexcept -> int { return stencil_->order(); }
  [[nodiscard]] auto first_derivative_stencil() const noexcept -> const stencil::Stencil& { return *stencil_; }
};

namespace gradient {

template <access::ScalarSource Source>
[[nodiscard]] auto create(const Source& source, const core::Interval& interval, stencil::DifferenceKind kind,
                          int order) -> std::expected<GradientEvaluator<Source>, core::ConfigurationError> {
  return GradientEvaluator<Source>::create(source, interval, kind, order);
}

// order in {2, 4, 6, 8}; padded by order / 2 on both sides.
template <access::ScalarSource Source>
[[nodiscard]] auto central_difference(const Source& source, const core::Interval& interval,
                                      int order = constants::orders::default_order)
    -> std::expected<GradientEvaluator<Source>, core::ConfigurationError> {
  return create(source, interval, stencil::DifferenceKind::Central, order);
}

// order in {1, ..., 6}; padded by order above.
template <access::ScalarSource Source>
[[nodiscard]] auto forward_difference(const Source& source, const core::Interval& interval,
                                      int order = constants::orders::default_order)
    -> std::expected<GradientEvaluator<Source>, core::ConfigurationError> {
  return create(source, interval, stencil::DifferenceKind::Forward, order);
}

// order in {1, ..., 6}; padded by order below.
template <access::ScalarSource Source>
[[nodiscard]] auto backward_difference(const Source& source, const core::Interval& interval,
                                       int order = constants::orders::default_order)
    -> std::expected<GradientEvaluator<Source>, core::ConfigurationError> {
  return create(source, interval, stencil::DifferenceKind::Backward, order);
}

// Whole-source variants: the region is the source's own extent.
template <access::BoundedScalarSource Source>
[[nodiscard]] auto create(const Source& source, stencil::DifferenceKind kind, int order)
    -> std::expected<GradientEvaluator<Source>, core::ConfigurationError> {
  return create(source, core::Interval(source.interval()), kind, order);
}

template <access::BoundedScalarSource Source>
[[nodiscard]] auto central_difference(const Source& source, int order = constants::orders::default_order)
    -> std::expected<GradientEvaluator<Source>, core::ConfigurationError> {
  return central_difference(source, core::Interval(source.interval()), order);
}

template <access::BoundedScalarSource Source>
[[nodiscard]] auto forward_difference(const Source& source, int order = constants::orders::default_order)
    -> std::expected<GradientEvaluator<Source>, core::ConfigurationError> {
  return forward_difference(source, core::Interval(source.interval()), order);
}

template <access::BoundedScalarSource Source>
[[nodiscard]] auto backward_difference(const Source& source, int order = constants::orders::default_order)
    -> std::expected<GradientEvaluator<Source>, core::ConfigurationError> {
  return backward_difference(source, core::Interval(source.interval()), order);
}

// Evaluators refer to their source, which must outlive them: temporaries are refused.
template <access::ScalarSource Source>
void create(const Source&&, const core::Interval&, stencil::DifferenceKind, int) = delete;
template <access::ScalarSource Source>
void central_difference(const Source&&, const core::Interval&, int = constants::orders::default_order) = delete;
template <access::ScalarSource Source>
void forward_difference(const Source&&, const core::Interval&, int = constants::orders::default_order) = delete;
template <access::ScalarSource Source>
void backward_difference(const Source&&, const core::Interval&, int = constants::orders::default_order) = delete;
template <access::BoundedScalarSource Source>
void create(const Source&&, stencil::DifferenceKind, int) = delete;
template <access::BoundedScalarSource Source>
void central_difference(const Source&&, int = constants::orders::default_order) = delete;
template <access::BoundedScalarSource Source>
void forward_difference(const Source&&, int = constants::orders::default_order) = delete;
template <access::BoundedScalarSource Source>
void backward_difference(const Source&&, int = constants::orders::default_order) = delete;

} // namespace gradient

} // namespace localderiv::derivatives
