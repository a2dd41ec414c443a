#include "localderiv/io/output/csv_writer.hpp"
#include <sstream>

namespace localderiv::io::output {

namespace {

auto join(std::span<const core::Index> values) -> std::string {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    out += std::format("{}{}", i == 0 ? "" : " ", values[i]);
  }
  return out;
}

} // namespace

auto CSVWriter::write(const std::filesystem::path& file_path,
                      const ReportDataset& dataset) const -> std::expected<void, OutputError> {

  try {
    if (file_path.has_parent_path()) {
      std::filesystem::create_directories(file_path.parent_path());
    }

    std::ofstream file(file_path);
    if (!file.is_open()) {
      return std::unexpected(FileWriteError(file_path, "Cannot open file for writing"));
    }

    if (csv_config_.include_headers) {
      write_metadata(file, dataset.metadata);
      write_row(file, create_header());
    }

    for (std::size_t r = 0; r < dataset.runs.size(); ++r) {
      const auto& run = dataset.runs[r];
      const std::vector<std::string> prefix = {std::to_string(r), run.operator_name,
                                               std::string(stencil::to_string(run.kind)), std::to_string(run.order),
                                               format_value(run.tolerance)};

      for (const auto& component : run.components) {
        auto row = prefix;
        row.push_back(component.label);
        row.push_back(std::to_string(component.absolute_error.count()));
        row.push_back(format_value(component.absolute_error.mean()));
        row.push_back(format_value(component.absolute_error.standard_deviation()));
        row.push_back(format_value(component.absolute_error.max()));
        row.push_back("");
        write_row(file, row);
      }

      auto row = prefix;
      row.push_back("all");
      row.push_back(std::to_string(run.overall.count()));
      row.push_back(format_value(run.overall.mean()));
      row.push_back(format_value(run.overall.standard_deviation()));
      row.push_back(format_value(run.overall.max()));
      row.push_back(run.passed() ? "pass" : "fail");
      write_row(file, row);
    }

    if (!file) {
      return std::unexpected(FileWriteError(file_path, "Write failed"));
    }
    return {};

  } catch (const std::exception& e) {
    return std::unexpected(OutputError(std::format("CSV write failed: {}", e.what())));
  }
}

auto CSVWriter::format_value(double value) const -> std::string {
  std::ostringstream oss;
  if (csv_config_.scientific_notation) {
    oss << std::scientific;
  } else {
    oss << std::fixed;
  }
  oss << std::setprecision(csv_config_.precision) << value;
  return oss.str();
}

auto CSVWriter::create_header() const -> std::vector<std::string> {
  return {"run",   "operator",       "kind",          "order",         "tolerance", "component",
          "count", "mean_abs_error", "std_abs_error", "max_abs_error", "verdict"};
}

void CSVWriter::write_metadata(std::ofstream& file, const ReportMetadata& metadata) const {
  file << "# localderiv " << metadata.localderiv_version << csv_config_.line_ending;
  file << "# case: " << metadata.case_name << csv_config_.line_ending;
  file << "# created: " << format_timestamp(metadata.creation_time) << csv_config_.line_ending;
  file << "# field: " << metadata.field_description << csv_config_.line_ending;
  file << "# image: " << join(metadata.image_dimensions) << csv_config_.line_ending;
  file << "# region min: " << join(metadata.region_min) << " max: " << join(metadata.region_max)
       << csv_config_.line_ending;
}

void CSVWriter::write_row(std::ofstream& file, const std::vector<std::string>& row) const {
  for (std::size_t j = 0; j < row.size(); ++j) {
    if (j > 0)
      file << csv_config_.delimiter;
    file << row[j];
  }
  file << csv_config_.line_ending;
}

} // namespace localderiv::io::output
