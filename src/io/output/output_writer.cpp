#include "localderiv/io/output/output_writer.hpp"
#include "localderiv/io/output/csv_writer.hpp"
#include "localderiv/io/output/hdf5_writer.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace localderiv::io::output {

auto format_timestamp(std::chrono::system_clock::time_point time) -> std::string {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  auto tm = *std::gmtime(&time_t);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

// WriterFactory implementation
auto WriterFactory::create_writer(OutputConfig::Format format)
    -> std::expected<std::unique_ptr<FormatWriter>, UnsupportedFormatError> {

  switch (format) {
  case OutputConfig::Format::CSV:
    return std::make_unique<CSVWriter>();

  case OutputConfig::Format::HDF5:
    return std::make_unique<HDF5Writer>();

  default:
    return std::unexpected(UnsupportedFormatError(format));
  }
}

// OutputWriter implementation
auto OutputWriter::create(OutputConfig config) -> std::expected<OutputWriter, UnsupportedFormatError> {
  OutputWriter writer(std::move(config));

  for (auto format : writer.config_.formats) {
    auto format_writer = WriterFactory::create_writer(format);
    if (!format_writer) {
      return std::unexpected(format_writer.error());
    }
    writer.writers_.push_back(std::move(format_writer.value()));
  }

  return writer;
}

auto OutputWriter::generate_file_path(const FormatWriter& writer) const -> std::filesystem::path {
  return std::filesystem::path(config_.directory) / (config_.case_name + std::string(writer.get_extension()));
}

auto OutputWriter::write_report(const ReportDataset& dataset)
    -> std::expected<std::vector<std::filesystem::path>, OutputError> {

  std::error_code ec;
  std::filesystem::create_directories(config_.directory, ec);
  if (ec) {
    return std::unexpected(
        FileWriteError(config_.directory, std::format("cannot create output directory: {}", ec.message())));
  }

  std::vector<std::filesystem::path> written_files;
  written_files.reserve(writers_.size());

  for (const auto& writer : writers_) {
    const auto file_path = generate_file_path(*writer);

    if (auto write_result = writer->write(file_path, dataset); !write_result) {
      return std::unexpected(FileWriteError(file_path, write_result.error().message()));
    }

    written_files.push_back(file_path);
  }

  return written_files;
}

} // namespace localderiv::io::output
