#pragma once
#include "../access/array_image.hpp"
#include "../analysis/accuracy_probe.hpp"
#include "../fields/analytic_field.hpp"
#include "../io/config_types.hpp"
#include "../io/output/output_types.hpp"
#include "application_types.hpp"
#include <expected>
#include <memory>
#include <vector>

namespace localderiv::core {

/**
 * @brief Drives `localderiv_report`.
 *
 * Loads the YAML configuration, samples the analytic field into an image, runs
 * every configured evaluator over the region through the accuracy probe and
 * writes the report in the configured formats.
 */
class ApplicationRunner {
public:
  // Main application entry point
  [[nodiscard]] auto run(int argc, char* argv[]) -> ApplicationResult;

  // Builds the field described by the configuration, one axis per image axis.
  [[nodiscard]] static auto make_field(const io::Configuration& config)
      -> std::expected<std::unique_ptr<fields::AnalyticField>, ConfigurationError>;

  // Runs one configured evaluator over `region` of the image.
  [[nodiscard]] static auto run_probe(const access::ArrayImage& image, const fields::AnalyticField& field,
                                      const Interval& region, const io::RunConfig& run)
      -> std::expected<analysis::ProbeReport, ConfigurationError>;

private:
  // Parse command line arguments
  [[nodiscard]] auto parse_command_line(int argc, char* argv[]) -> std::expected<CommandLineArgs, ApplicationError>;

  auto display_usage(const std::string& program_name) const -> void;

  auto display_header() const -> void;

  auto display_run(const analysis::ProbeReport& report, bool verbose) const -> void;

  auto display_performance_summary(const PerformanceMetrics& metrics) const -> void;

  [[nodiscard]] auto build_dataset(const io::Configuration& config, const fields::AnalyticField& field,
                                   std::vector<analysis::ProbeReport> reports) const -> io::output::ReportDataset;

  // Convert ApplicationError to ApplicationResult
  auto handle_error(const ApplicationError& error) -> ApplicationResult;
};

} // namespace localderiv::core
