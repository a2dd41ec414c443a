#include "localderiv/core/application_runner.hpp"
#include "localderiv/core/constants.hpp"
#include "localderiv/core/expected_utils.hpp"
#include "localderiv/derivatives/gradient_evaluator.hpp"
#include "localderiv/derivatives/hessian_evaluator.hpp"
#include "localderiv/io/config_manager.hpp"
#include "localderiv/io/output/hdf5_writer.hpp"
#include "localderiv/io/output/output_writer.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>

namespace localderiv::core {

auto ApplicationRunner::run(int argc, char* argv[]) -> ApplicationResult {
  auto start_time = std::chrono::high_resolution_clock::now();
  PerformanceMetrics metrics;

  try {
    auto args_result = parse_command_line(argc, argv);
    if (!args_result) {
      return handle_error(args_result.error());
    }
    auto args = args_result.value();

    if (args.help_requested) {
      display_usage(argv[0]);
      return {true, constants::exit_codes::success, "Help displayed"};
    }

    display_header();

    // Load configuration
    std::cout << "Loading configuration from: " << args.config_file << std::endl;
    io::ConfigurationManager config_manager(
        std::vector<std::filesystem::path>{constants::defaults::config_directory});
    auto config_result = config_manager.load(args.config_file, io::ConfigOverrides{args.case_name});
    if (!config_result) {
      return handle_error({config_result.error().message(), constants::exit_codes::failure});
    }
    auto config = std::move(config_result.value());
    std::cout << "✓ Configuration loaded: " << config_manager.config_file_path().string() << " (" << config.runs.size()
              << " runs)" << std::endl;

    // Sample the field
    auto image_result = access::ArrayImage::create(config.image.dimensions);
    if (!image_result) {
      return handle_error({image_result.error().message(), constants::exit_codes::failure});
    }
    auto image = std::move(image_result.value());

    auto field_result = make_field(config);
    if (!field_result) {
      return handle_error({field_result.error().message(), constants::exit_codes::failure});
    }
    const auto& field = *field_result.value();

    if (auto fill_result = fields::fill_image(image, field); !fill_result) {
      return handle_error({fill_result.error().message(), constants::exit_codes::failure});
    }
    std::cout << "✓ Field sampled: " << field.description() << " on " << image.interval().to_string() << std::endl;

    auto region_result = Interval::create_min_max(config.region.min, config.region.max);
    if (!region_result) {
      return handle_error({region_result.error().message(), constants::exit_codes::failure});
    }
    const auto region = std::move(region_result.value());

    // Probe every configured evaluator
    std::cout << "\n=== EVALUATING " << region.num_elements() << " POSITIONS OVER " << region.to_string()
              << " ===" << std::endl;
    auto probe_start = std::chrono::high_resolution_clock::now();

    std::vector<analysis::ProbeReport> reports;
    reports.reserve(config.runs.size());
    for (std::size_t i = 0; i < config.runs.size(); ++i) {
      const auto& run = config.runs[i];
      std::expected<analysis::ProbeReport, ConfigurationError> report_result;
      try {
        report_result = run_probe(image, field, region, run);
      } catch (LocalDerivException& e) {
        e.add_context(std::format("runs[{}] {} {} order {}", i, io::to_string(run.op), stencil::to_string(run.kind),
                                  run.order));
        throw;
      }
      if (!report_result) {
        return handle_error({report_result.error().message(), constants::exit_codes::failure});
      }
      display_run(report_result.value(), config.verbose);
      reports.push_back(std::move(report_result.value()));
    }

    auto probe_end = std::chrono::high_resolution_clock::now();
    metrics.probe_time = std::chrono::duration_cast<std::chrono::milliseconds>(probe_end - probe_start);

    const bool all_passed = std::ranges::all_of(reports, [](const auto& report) { return report.passed(); });

    // Write output files
    std::cout << "\n=== WRITING OUTPUT FILES ===" << std::endl;
    if (config.verbose) {
      if (auto version = io::output::hdf5::check_version()) {
        std::cout << "  HDF5 library version: " << version.value() << std::endl;
      }
    }

    auto writer_result = io::output::OutputWriter::create(config.output);
    if (!writer_result) {
      return handle_error({writer_result.error().message(), constants::exit_codes::failure});
    }
    auto writer = std::move(writer_result.value());

    auto output_start = std::chrono::high_resolution_clock::now();
    auto output_result = writer.write_report(build_dataset(config, field, std::move(reports)));
    auto output_end = std::chrono::high_resolution_clock::now();
    if (!output_result) {
      return handle_error({output_result.error().message(), constants::exit_codes::failure});
    }
    metrics.output_time = std::chrono::duration_cast<std::chrono::milliseconds>(output_end - output_start);
    metrics.output_files = std::move(output_result.value());

    for (const auto& file_path : metrics.output_files) {
      std::cout << "  " << file_path.string() << std::endl;
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    metrics.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    display_performance_summary(metrics);

    if (!all_passed) {
      std::cerr << "\n✗ At least one run exceeded its tolerance" << std::endl;
      return {false, constants::exit_codes::tolerance_violated, "Tolerance violated"};
    }

    std::cout << "\n=== ALL RUNS WITHIN TOLERANCE ===" << std::endl;
    return {true, constants::exit_codes::success, "Success"};

  } catch (const LocalDerivException& e) {
    return handle_error(ApplicationError{e.full_message(), constants::exit_codes::failure});
  } catch (const std::exception& e) {
    return handle_error(ApplicationError{"Unexpected error: " + std::string(e.what()), constants::exit_codes::failure});
  }
}

auto ApplicationRunner::make_field(const io::Configuration& config)
    -> std::expected<std::unique_ptr<fields::AnalyticField>, ConfigurationError> {

  const auto n_dims = config.image.dimensions.size();

  switch (config.field.type) {
  case io::FieldConfig::Type::Separable: {
    if (config.field.profiles.size() != n_dims) {
      return std::unexpected(ConfigurationError(
          std::format("field has {} profiles but the image has {} axes", config.field.profiles.size(), n_dims)));
    }
    std::vector<fields::Profile> profiles;
    profiles.reserve(n_dims);
    for (auto type : config.field.profiles) {
      profiles.push_back(fields::Profile{type, config.field.constant});
    }
    return std::make_unique<fields::SeparableProductField>(std::move(profiles));
  }

  case io::FieldConfig::Type::QuadraticForm: {
    if (config.field.sigma.size() != 2) {
      return std::unexpected(ConfigurationError("quadratic_form needs sigma: [sx, sy]"));
    }
    auto created = expected_utils::as_configuration_error(
        fields::QuadraticFormField::rotated_gaussian_form(config.field.theta, config.field.sigma[0],
                                                          config.field.sigma[1], config.field.center, n_dims),
        "field");
    if (!created) {
      return std::unexpected(created.error());
    }
    return std::make_unique<fields::QuadraticFormField>(std::move(created.value()));
  }
  }

  return std::unexpected(ConfigurationError("unknown field type"));
}

auto ApplicationRunner::run_probe(const access::ArrayImage& image, const fields::AnalyticField& field,
                                  const Interval& region, const io::RunConfig& run)
    -> std::expected<analysis::ProbeReport, ConfigurationError> {

  switch (run.op) {
  case io::RunConfig::Operator::Gradient: {
    auto evaluator = derivatives::gradient::create(image, region, run.kind, run.order);
    if (!evaluator) {
      return std::unexpected(evaluator.error());
    }
    return analysis::probe(evaluator.value(), field, region, run.tolerance);
  }

  case io::RunConfig::Operator::Hessian: {
    if (run.kind != stencil::DifferenceKind::Central) {
      return std::unexpected(ConfigurationError(
          std::format("hessian supports central differences only, got {}", stencil::to_string(run.kind))));
    }
    auto evaluator = derivatives::hessian::central_difference(image, region, run.order);
    if (!evaluator) {
      return std::unexpected(evaluator.error());
    }
    return analysis::probe(evaluator.value(), field, region, run.tolerance);
  }
  }

  return std::unexpected(ConfigurationError("unknown operator"));
}

auto ApplicationRunner::parse_command_line(int argc, char* argv[])
    -> std::expected<CommandLineArgs, ApplicationError> {

  constexpr int min_required_args = 2;
  constexpr int case_name_arg_index = 2;

  if (argc < min_required_args) {
    display_usage(argc > 0 ? argv[0] : "localderiv_report");
    return std::unexpected(ApplicationError{"Insufficient arguments provided", constants::exit_codes::failure});
  }

  CommandLineArgs args;
  const std::string first = argv[1];
  if (first == "-h" || first == "--help") {
    args.help_requested = true;
    return args;
  }
  args.config_file = first;

  if (argc > case_name_arg_index) {
    args.case_name = argv[case_name_arg_index];
  }

  return args;
}

auto ApplicationRunner::display_usage(const std::string& program_name) const -> void {
  std::cerr << "Usage: " << program_name << " <config_file.yaml> [case_name]\n";
}

auto ApplicationRunner::display_header() const -> void {
  std::cout << "=== LocalDeriv Finite-Difference Accuracy Report ===" << std::endl;
}

auto ApplicationRunner::display_run(const analysis::ProbeReport& report, bool verbose) const -> void {
  std::cout << (report.passed() ? "  ✓ " : "  ✗ ") << analysis::summarize(report) << std::endl;
  if (!verbose) {
    return;
  }
  for (const auto& component : report.components) {
    const auto& stats = component.absolute_error;
    std::cout << std::format("      {:>12}  mean {:.3e}  std {:.3e}  max {:.3e}", component.label, stats.mean(),
                             stats.standard_deviation(), stats.max())
              << std::endl;
  }
}

auto ApplicationRunner::display_performance_summary(const PerformanceMetrics& metrics) const -> void {
  std::cout << "\n=== PERFORMANCE SUMMARY ===" << std::endl;
  std::cout << "Total runtime: " << metrics.total_time.count() << " ms" << std::endl;
  std::cout << "  Evaluation: " << metrics.probe_time.count() << " ms" << std::endl;
  std::cout << "  Output: " << metrics.output_time.count() << " ms" << std::endl;
}

auto ApplicationRunner::build_dataset(const io::Configuration& config, const fields::AnalyticField& field,
                                      std::vector<analysis::ProbeReport> reports) const
    -> io::output::ReportDataset {
  io::output::ReportDataset dataset;
  dataset.metadata.creation_time = std::chrono::system_clock::now();
  dataset.metadata.case_name = config.output.case_name;
  dataset.metadata.field_description = field.description();
  dataset.metadata.image_dimensions = config.image.dimensions;
  dataset.metadata.region_min = config.region.min;
  dataset.metadata.region_max = config.region.max;
  dataset.runs = std::move(reports);
  return dataset;
}

auto ApplicationRunner::handle_error(const ApplicationError& error) -> ApplicationResult {
  std::cerr << "Error: " << error.message << std::endl;
  return {false, error.exit_code, error.message};
}

} // namespace localderiv::core
