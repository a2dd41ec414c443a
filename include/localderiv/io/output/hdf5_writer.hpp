#pragma once
#include "output_writer.hpp"
#include <hdf5.h>
#include <string>
#include <string_view>
#include <vector>

namespace localderiv::io::output {

// HDF5-specific configuration
struct HDF5Config {
  int compression_level = 6;      // 0-9, higher = better compression
  bool use_shuffle_filter = true; // Reorder bytes for better compression
  std::size_t chunk_size = 1024;  // Chunk size for datasets
};

// RAII wrapper for HDF5 handles
template <typename HandleType, auto CloseFunc> class HDF5Handle {
private:
  HandleType handle_;

public:
  explicit HDF5Handle(HandleType handle) : handle_(handle) {
    if (handle_ < 0) {
      throw OutputError("Invalid HDF5 handle");
    }
  }

  ~HDF5Handle() {
    if (handle_ >= 0) {
      CloseFunc(handle_);
    }
  }

  // Move semantics only
  HDF5Handle(HDF5Handle&& other) noexcept : handle_(other.handle_) { other.handle_ = -1; }

  HDF5Handle& operator=(HDF5Handle&& other) noexcept {
    if (this != &other) {
      if (handle_ >= 0) {
        CloseFunc(handle_);
      }
      handle_ = other.handle_;
      other.handle_ = -1;
    }
    return *this;
  }

  HDF5Handle(const HDF5Handle&) = delete;
  HDF5Handle& operator=(const HDF5Handle&) = delete;

  [[nodiscard]] auto get() const noexcept -> HandleType { return handle_; }
  [[nodiscard]] auto valid() const noexcept -> bool { return handle_ >= 0; }

  // Implicit conversion for C API
  operator HandleType() const noexcept { return handle_; }
};

using FileHandle = HDF5Handle<hid_t, H5Fclose>;
using GroupHandle = HDF5Handle<hid_t, H5Gclose>;
using DatasetHandle = HDF5Handle<hid_t, H5Dclose>;
using DataspaceHandle = HDF5Handle<hid_t, H5Sclose>;
using PropertyHandle = HDF5Handle<hid_t, H5Pclose>;
using TypeHandle = HDF5Handle<hid_t, H5Tclose>;
using AttributeHandle = HDF5Handle<hid_t, H5Aclose>;

/**
 * @brief Report layout:
 *
 *   /metadata            attributes localderiv_version, case_name, creation_time, field;
 *                        datasets image_dimensions, region_min, region_max
 *   /runs/run_000 ...    attributes operator, kind; scalar datasets order, tolerance,
 *                        positions, position_mismatches, tolerance_violations,
 *                        asymmetric_entries, passed, max_error, mean_error, std_error;
 *                        datasets component_labels, component_mean, component_std,
 *                        component_max
 */
class HDF5Writer : public FormatWriter {
private:
  HDF5Config hdf5_config_;

  [[nodiscard]] auto
  create_file(const std::filesystem::path& file_path) const -> std::expected<FileHandle, OutputError>;

  [[nodiscard]] auto write_metadata(FileHandle& file,
                                    const ReportMetadata& metadata) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_runs(FileHandle& file, const std::vector<analysis::ProbeReport>& runs) const
      -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_run(GroupHandle& run_group,
                               const analysis::ProbeReport& run) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto create_group(hid_t parent,
                                  const std::string& name) const -> std::expected<GroupHandle, OutputError>;

  [[nodiscard]] auto write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_scalar(hid_t parent, const std::string& name, double value,
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  // Scalar string attribute on a group or dataset.
  [[nodiscard]] auto write_string(hid_t parent, const std::string& name,
                                  const std::string& value) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto
  write_string_array(hid_t parent, const std::string& name,
                     const std::vector<std::string>& values) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto create_chunked_properties(std::size_t size) const -> std::expected<PropertyHandle, OutputError>;

public:
  explicit HDF5Writer(HDF5Config config = {}) : hdf5_config_(config) {}

  [[nodiscard]] auto write(const std::filesystem::path& file_path,
                           const ReportDataset& dataset) const -> std::expected<void, OutputError> override;

  [[nodiscard]] auto get_extension() const noexcept -> std::string_view override { return ".h5"; }
};

namespace hdf5 {

// Check HDF5 version compatibility
[[nodiscard]] auto check_version() -> std::expected<std::string, OutputError>;

// Validate HDF5 file
[[nodiscard]] auto validate_file(const std::filesystem::path& file_path) -> std::expected<void, OutputError>;

} // namespace hdf5

} // namespace localderiv::io::output
