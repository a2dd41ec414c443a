#pragma once
#include "output_writer.hpp"
#include <fstream>
#include <iomanip>
#include <string>
#include <vector>

namespace localderiv::io::output {

// CSV-specific configuration
struct CSVConfig {
  char delimiter = ',';
  int precision = 6;
  bool include_headers = true;
  bool scientific_notation = true;
  std::string line_ending = "\n";
};

/**
 * @brief One summary table per report.
 *
 * Commented metadata lines, then one row per (run, component) plus an "all" row
 * per run carrying the pooled statistics and the run verdict.
 */
class CSVWriter : public FormatWriter {
private:
  CSVConfig csv_config_;

  [[nodiscard]] auto format_value(double value) const -> std::string;

  [[nodiscard]] auto create_header() const -> std::vector<std::string>;

  void write_metadata(std::ofstream& file, const ReportMetadata& metadata) const;

  void write_row(std::ofstream& file, const std::vector<std::string>& row) const;

public:
  explicit CSVWriter(CSVConfig config = {}) : csv_config_(std::move(config)) {}

  [[nodiscard]] auto write(const std::filesystem::path& file_path,
                           const ReportDataset& dataset) const -> std::expected<void, OutputError> override;

  [[nodiscard]] auto get_extension() const noexcept -> std::string_view override { return ".csv"; }
};

} // namespace localderiv::io::output
