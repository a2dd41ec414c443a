#pragma once
#include "output_types.hpp"
#include <expected>
#include <memory>
#include <string_view>

namespace localderiv::io::output {

// Abstract base class for format-specific writers
class FormatWriter {
public:
  virtual ~FormatWriter() = default;

  [[nodiscard]] virtual auto write(const std::filesystem::path& file_path,
                                   const ReportDataset& dataset) const -> std::expected<void, OutputError> = 0;

  [[nodiscard]] virtual auto get_extension() const noexcept -> std::string_view = 0;
};

// Factory for creating format-specific writers
class WriterFactory {
public:
  [[nodiscard]] static auto create_writer(OutputConfig::Format format)
      -> std::expected<std::unique_ptr<FormatWriter>, UnsupportedFormatError>;
};

// Writes one report in every configured format under <directory>/<case_name><extension>
class OutputWriter {
private:
  OutputConfig config_;
  std::vector<std::unique_ptr<FormatWriter>> writers_;

  [[nodiscard]] auto generate_file_path(const FormatWriter& writer) const -> std::filesystem::path;

public:
  // Fails when a configured format has no writer.
  [[nodiscard]] static auto create(OutputConfig config) -> std::expected<OutputWriter, UnsupportedFormatError>;

  [[nodiscard]] auto write_report(const ReportDataset& dataset)
      -> std::expected<std::vector<std::filesystem::path>, OutputError>;

private:
  explicit OutputWriter(OutputConfig config) : config_(std::move(config)) {}
};

} // namespace localderiv::io::output
