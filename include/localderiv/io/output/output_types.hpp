#pragma once
#include "../../analysis/accuracy_probe.hpp"
#include "../../core/containers.hpp"
#include "../../core/exceptions.hpp"
#include "../config_types.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace localderiv::io::output {

// Metadata container
struct ReportMetadata {
  std::string localderiv_version = "1.0.0";
  std::chrono::system_clock::time_point creation_time;
  std::string case_name;
  std::string field_description;
  std::vector<core::Index> image_dimensions;
  std::vector<core::Index> region_min;
  std::vector<core::Index> region_max;
};

// Complete output dataset: one probe report per configured run
struct ReportDataset {
  ReportMetadata metadata;
  std::vector<analysis::ProbeReport> runs;
};

// Output error types
class OutputError : public core::LocalDerivException {
public:
  explicit OutputError(std::string_view message, std::source_location location = std::source_location::current())
      : LocalDerivException(std::format("Output Error: {}", message), location) {}
};

class FileWriteError : public OutputError {
private:
  std::filesystem::path file_path_;

public:
  explicit FileWriteError(const std::filesystem::path& path, std::string_view message,
                          std::source_location location = std::source_location::current())
      : OutputError(std::format("File '{}': {}", path.string(), message), location), file_path_(path) {}

  [[nodiscard]] auto file_path() const noexcept -> const std::filesystem::path& { return file_path_; }
};

class UnsupportedFormatError : public OutputError {
public:
  explicit UnsupportedFormatError(OutputConfig::Format format,
                                  std::source_location location = std::source_location::current())
      : OutputError(std::format("Unsupported output format: {}", to_string(format)), location) {}
};

// ISO-8601 UTC timestamp, as stored in every output format.
[[nodiscard]] auto format_timestamp(std::chrono::system_clock::time_point time) -> std::string;

} // namespace localderiv::io::output
