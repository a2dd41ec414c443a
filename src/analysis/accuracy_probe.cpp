#include "localderiv/analysis/accuracy_probe.hpp"

namespace localderiv::analysis {

auto gradient_component_labels(std::size_t n_dims) -> std::vector<std::string> {
  std::vector<std::string> labels;
  labels.reserve(n_dims);
  for (std::size_t d = 0; d < n_dims; ++d) {
    labels.push_back(std::format("d/dx{}", d));
  }
  return labels;
}

auto hessian_component_labels(std::size_t n_dims) -> std::vector<std::string> {
  std::vector<std::string> labels;
  labels.reserve(n_dims * (n_dims + 1) / 2);
  for (std::size_t d = 0; d < n_dims; ++d) {
    for (std::size_t e = d; e < n_dims; ++e) {
      labels.push_back(d == e ? std::format("d2/dx{}2", d) : std::format("d2/dx{}dx{}", d, e));
    }
  }
  return labels;
}

auto summarize(const ProbeReport& report) -> std::string {
  std::string out = std::format("{} {} order {} over {}: {} positions, max |error| {:.3e}, mean {:.3e} (tol {:.1e})",
                                report.operator_name, stencil::to_string(report.kind), report.order, report.region,
                                report.positions, report.overall.max(), report.overall.mean(), report.tolerance);
  if (report.tolerance_violations > 0) {
    out += std::format(", {} above tolerance", report.tolerance_violations);
  }
  if (report.position_mismatches > 0) {
    out += std::format(", {} position changes", report.position_mismatches);
  }
  if (report.asymmetric_entries > 0) {
    out += std::format(", {} asymmetric entries", report.asymmetric_entries);
  }
  return out;
}

namespace detail {

auto check_probe_geometry(std::size_t evaluator_dims, const core::Interval& evaluator_region,
                          const fields::AnalyticField& field, const core::Interval& region)
    -> std::expected<void, core::ConfigurationError> {
  if (field.num_dimensions() != evaluator_dims) {
    return std::unexpected(core::ConfigurationError(
        std::format("field has {} axes but the evaluator has {}", field.num_dimensions(), evaluator_dims)));
  }
  if (region.num_dimensions() != evaluator_dims) {
    return std::unexpected(core::ConfigurationError(
        std::format("probe region has {} axes but the evaluator has {}", region.num_dimensions(), evaluator_dims)));
  }
  if (!evaluator_region.contains(region)) {
    return std::unexpected(core::ConfigurationError(std::format("probe region {} is not inside evaluator region {}",
                                                                region.to_string(), evaluator_region.to_string())));
  }
  return {};
}

auto make_report(std::string operator_name, stencil::DifferenceKind kind, int order, double tolerance,
                 const core::Interval& region, std::vector<std::string> labels) -> ProbeReport {
  ProbeReport report;
  report.operator_name = std::move(operator_name);
  report.kind = kind;
  report.order = order;
  report.tolerance = tolerance;
  report.region = region.to_string();
  report.components.reserve(labels.size());
  for (auto& label : labels) {
    report.components.push_back(ComponentReport{std::move(label), RunningStatistics{}});
  }
  return report;
}

} // namespace detail

} // namespace localderiv::analysis
