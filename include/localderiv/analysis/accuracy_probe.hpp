#pragma once
#include "../core/exceptions.hpp"
#include "../core/interval.hpp"
#include "../derivatives/gradient_evaluator.hpp"
#include "../derivatives/hessian_evaluator.hpp"
#include "../fields/analytic_field.hpp"
#include "running_statistics.hpp"
#include <algorithm>
#include <cmath>
#include <expected>
#include <format>
#include <string>
#include <vector>

namespace localderiv::analysis {

struct ComponentReport {
  std::string label; // "d/dx0", "d2/dx0dx1", ...
  RunningStatistics absolute_error;
};

struct ProbeReport {
  std::string operator_name; // "gradient" or "hessian"
  stencil::DifferenceKind kind = stencil::DifferenceKind::Central;
  int order = 0;
  double tolerance = 0.0;
  std::string region;

  std::size_t positions = 0;
  std::size_t position_mismatches = 0;  // evaluate() moved the evaluator
  std::size_t tolerance_violations = 0; // positions with any component above tolerance
  std::size_t asymmetric_entries = 0;   // Hessian only

  RunningStatistics overall;
  std::vector<ComponentReport> components;

  [[nodiscard]] auto passed() const noexcept -> bool {
    return position_mismatches == 0 && tolerance_violations == 0 && asymmetric_entries == 0;
  }
};

[[nodiscard]] auto gradient_component_labels(std::size_t n_dims) -> std::vector<std::string>;

// Upper triangle, diagonal included, row by row.
[[nodiscard]] auto hessian_component_labels(std::size_t n_dims) -> std::vector<std::string>;

[[nodiscard]] auto summarize(const ProbeReport& report) -> std::string;

namespace detail {

[[nodiscard]] auto check_probe_geometry(std::size_t evaluator_dims, const core::Interval& evaluator_region,
                                        const fields::AnalyticField& field, const core::Interval& region)
    -> std::expected<void, core::ConfigurationError>;

[[nodiscard]] auto make_report(std::string operator_name, stencil::DifferenceKind kind, int order, double tolerance,
                               const core::Interval& region, std::vector<std::string> labels) -> ProbeReport;

template <typename Evaluator>
[[nodiscard]] auto moved_during_evaluate(const Evaluator& evaluator, std::span<const core::Index> position) -> bool {
  for (std::size_t d = 0; d < position.size(); ++d) {
    if (evaluator.position(d) != position[d]) {
      return true;
    }
  }
  return false;
}

} // namespace detail

/**
 * @brief Evaluates the gradient at every position of `region` and compares it
 * with the field's analytic gradient.
 *
 * Also records whether evaluate() left the evaluator where it was. Read errors
 * from the source (core::AccessError) propagate to the caller.
 */
template <access::ScalarSource Source>
[[nodiscard]] auto probe(derivatives::GradientEvaluator<Source>& evaluator, const fields::AnalyticField& field,
                         const core::Interval& region, double tolerance)
    -> std::expected<ProbeReport, core::ConfigurationError> {
  if (auto ok = detail::check_probe_geometry(evaluator.num_dimensions(), evaluator.interval(), field, region); !ok) {
    return std::unexpected(ok.error());
  }

  const auto n = evaluator.num_dimensions();
  auto report = detail::make_report("gradient", evaluator.kind(), evaluator.accuracy_order(), tolerance, region,
                                    gradient_component_labels(n));

  core::for_each_position(region, [&](std::span<const core::Index> position) {
    evaluator.set_position(position);
    const auto& numeric = evaluator.evaluate();
    const auto exact = field.gradient(position);

    ++report.positions;
    if (detail::moved_during_evaluate(evaluator, position)) {
      ++report.position_mismatches;
    }

    bool violated = false;
    for (std::size_t d = 0; d < n; ++d) {
      const double error = std::abs(numeric(d, 0) - exact(static_cast<Eigen::Index>(d)));
      report.components[d].absolute_error.add(error);
      report.overall.add(error);
      violated = violated || error > tolerance;
    }
    if (violated) {
      ++report.tolerance_violations;
    }
  });

  return report;
}

/**
 * @brief Hessian counterpart of the gradient probe; also counts entries where
 * H(d, e) != H(e, d).
 */
template <access::ScalarSource Source>
[[nodiscard]] auto probe(derivatives::HessianEvaluator<Source>& evaluator, const fields::AnalyticField& field,
                         const core::Interval& region, double tolerance)
    -> std::expected<ProbeReport, core::ConfigurationError> {
  if (auto ok = detail::check_probe_geometry(evaluator.num_dimensions(), evaluator.interval(), field, region); !ok) {
    return std::unexpected(ok.error());
  }

  const auto n = evaluator.num_dimensions();
  auto report = detail::make_report("hessian", evaluator.kind(), evaluator.accuracy_order(), tolerance, region,
                                    hessian_component_labels(n));

  core::for_each_position(region, [&](std::span<const core::Index> position) {
    evaluator.set_position(position);
    const auto& numeric = evaluator.evaluate();
    const auto exact = field.hessian(position);

    ++report.positions;
    if (detail::moved_during_evaluate(evaluator, position)) {
      ++report.position_mismatches;
    }

    bool violated = false;
    std::size_t component = 0;
    for (std::size_t d = 0; d < n; ++d) {
      for (std::size_t e = d; e < n; ++e, ++component) {
        const double error =
            std::abs(numeric(d, e) - exact(static_cast<Eigen::Index>(d), static_cast<Eigen::Index>(e)));
        report.components[component].absolute_error.add(error);
        report.overall.add(error);
        violated = violated || error > tolerance;
        if (numeric(d, e) != numeric(e, d)) {
          ++report.asymmetric_entries;
        }
      }
    }
    if (violated) {
      ++report.tolerance_violations;
    }
  });

  return report;
}

} // namespace localderiv::analysis
