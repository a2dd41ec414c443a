#include "localderiv/io/output/hdf5_writer.hpp"
#include <algorithm>
#include <cstring>

namespace localderiv::io::output {

namespace {

auto to_doubles(const std::vector<core::Index>& values) -> std::vector<double> {
  std::vector<double> out;
  out.reserve(values.size());
  for (auto v : values) {
    out.push_back(static_cast<double>(v));
  }
  return out;
}

} // namespace

auto HDF5Writer::write(const std::filesystem::path& file_path,
                       const ReportDataset& dataset) const -> std::expected<void, OutputError> {

  try {
    auto file_result = create_file(file_path);
    if (!file_result) {
      return std::unexpected(file_result.error());
    }
    auto file = std::move(file_result.value());

    if (auto meta_result = write_metadata(file, dataset.metadata); !meta_result) {
      return std::unexpected(meta_result.error());
    }

    if (auto runs_result = write_runs(file, dataset.runs); !runs_result) {
      return std::unexpected(runs_result.error());
    }

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(OutputError(std::format("HDF5 write failed: {}", e.what())));
  }
}

auto HDF5Writer::create_file(const std::filesystem::path& file_path) const -> std::expected<FileHandle, OutputError> {

  auto fapl = H5Pcreate(H5P_FILE_ACCESS);
  if (fapl < 0) {
    return std::unexpected(OutputError("Failed to create file access property list"));
  }
  PropertyHandle access(fapl);

  if (H5Pset_fclose_degree(access, H5F_CLOSE_STRONG) < 0) {
    return std::unexpected(OutputError("Failed to set file close degree"));
  }

  auto file_id = H5Fcreate(file_path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, access);
  if (file_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create HDF5 file: {}", file_path.string())));
  }

  return FileHandle(file_id);
}

auto HDF5Writer::write_metadata(FileHandle& file,
                                const ReportMetadata& metadata) const -> std::expected<void, OutputError> {

  auto metadata_group_result = create_group(file, "metadata");
  if (!metadata_group_result) {
    return std::unexpected(metadata_group_result.error());
  }
  auto metadata_group = std::move(metadata_group_result.value());

  if (auto result = write_string(metadata_group, "localderiv_version", metadata.localderiv_version); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_string(metadata_group, "case_name", metadata.case_name); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_string(metadata_group, "creation_time", format_timestamp(metadata.creation_time));
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_string(metadata_group, "field", metadata.field_description); !result) {
    return std::unexpected(result.error());
  }

  if (auto result = write_vector(metadata_group, "image_dimensions", to_doubles(metadata.image_dimensions),
                                 "Pixels per axis, axis 0 first");
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(metadata_group, "region_min", to_doubles(metadata.region_min)); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(metadata_group, "region_max", to_doubles(metadata.region_max)); !result) {
    return std::unexpected(result.error());
  }

  return {};
}

auto HDF5Writer::write_runs(FileHandle& file, const std::vector<analysis::ProbeReport>& runs) const
    -> std::expected<void, OutputError> {

  auto runs_group_result = create_group(file, "runs");
  if (!runs_group_result) {
    return std::unexpected(runs_group_result.error());
  }
  auto runs_group = std::move(runs_group_result.value());

  for (std::size_t i = 0; i < runs.size(); ++i) {
    auto run_group_result = create_group(runs_group, std::format("run_{:03d}", i));
    if (!run_group_result) {
      return std::unexpected(run_group_result.error());
    }
    auto run_group = std::move(run_group_result.value());

    if (auto result = write_run(run_group, runs[i]); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_run(GroupHandle& run_group,
                           const analysis::ProbeReport& run) const -> std::expected<void, OutputError> {

  if (auto result = write_string(run_group, "operator", run.operator_name); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_string(run_group, "kind", std::string(stencil::to_string(run.kind))); !result) {
    return std::unexpected(result.error());
  }

  const std::vector<std::pair<std::string, double>> scalars = {
      {"order", static_cast<double>(run.order)},
      {"tolerance", run.tolerance},
      {"positions", static_cast<double>(run.positions)},
      {"position_mismatches", static_cast<double>(run.position_mismatches)},
      {"tolerance_violations", static_cast<double>(run.tolerance_violations)},
      {"asymmetric_entries", static_cast<double>(run.asymmetric_entries)},
      {"passed", run.passed() ? 1.0 : 0.0},
      {"max_error", run.overall.max()},
      {"mean_error", run.overall.mean()},
      {"std_error", run.overall.standard_deviation()}};

  for (const auto& [name, value] : scalars) {
    if (auto result = write_scalar(run_group, name, value); !result) {
      return std::unexpected(result.error());
    }
  }

  std::vector<std::string> labels;
  std::vector<double> means;
  std::vector<double> stds;
  std::vector<double> maxima;
  for (const auto& component : run.components) {
    labels.push_back(component.label);
    means.push_back(component.absolute_error.mean());
    stds.push_back(component.absolute_error.standard_deviation());
    maxima.push_back(component.absolute_error.max());
  }

  if (auto result = write_string_array(run_group, "component_labels", labels); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(run_group, "component_mean", means, "Mean absolute error"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(run_group, "component_std", stds, "Standard deviation of the absolute error");
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(run_group, "component_max", maxima, "Maximum absolute error"); !result) {
    return std::unexpected(result.error());
  }

  return {};
}

// Utility function implementations
auto HDF5Writer::create_group(hid_t parent, const std::string& name) const -> std::expected<GroupHandle, OutputError> {

  auto group_id = H5Gcreate2(parent, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (group_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create group '{}'", name)));
  }

  return GroupHandle(group_id);
}

auto HDF5Writer::write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                              const std::string& description) const -> std::expected<void, OutputError> {

  if (data.empty()) {
    return {}; // Skip empty datasets
  }

  hsize_t dims = data.size();
  auto space_id = H5Screate_simple(1, &dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto prop_result = create_chunked_properties(data.size());
  if (!prop_result) {
    return std::unexpected(prop_result.error());
  }
  auto props = std::move(prop_result.value());

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, props, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  auto status = H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data());
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write data for '{}'", name)));
  }

  if (!description.empty()) {
    if (auto result = write_string(dataset, "description", description); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_scalar(hid_t parent, const std::string& name, double value,
                              const std::string& description) const -> std::expected<void, OutputError> {

  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create scalar dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create scalar dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  auto status = H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, &value);
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write scalar value for '{}'", name)));
  }

  if (!description.empty()) {
    if (auto result = write_string(dataset, "description", description); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_string(hid_t parent, const std::string& name,
                              const std::string& value) const -> std::expected<void, OutputError> {

  auto str_type = H5Tcopy(H5T_C_S1);
  if (str_type < 0) {
    return std::unexpected(OutputError("Failed to create string type"));
  }
  TypeHandle string_type(str_type);

  // HDF5 rejects zero-size string types.
  if (H5Tset_size(string_type, std::max<std::size_t>(value.length(), 1)) < 0 ||
      H5Tset_strpad(string_type, H5T_STR_NULLTERM) < 0) {
    return std::unexpected(OutputError(std::format("Failed to size string type for '{}'", name)));
  }

  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for string '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto attr_id = H5Acreate2(parent, name.c_str(), string_type, space, H5P_DEFAULT, H5P_DEFAULT);
  if (attr_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create string attribute '{}'", name)));
  }
  AttributeHandle attribute(attr_id);

  std::string buffer = value.empty() ? std::string(1, '\0') : value;
  if (H5Awrite(attribute, string_type, buffer.c_str()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write string attribute '{}'", name)));
  }

  return {};
}

auto HDF5Writer::write_string_array(hid_t parent, const std::string& name,
                                    const std::vector<std::string>& values) const -> std::expected<void, OutputError> {

  if (values.empty()) {
    return {}; // Skip empty arrays
  }

  std::size_t max_len = 0;
  for (const auto& str : values) {
    max_len = std::max(max_len, str.length());
  }
  ++max_len; // For null terminator

  auto str_type = H5Tcopy(H5T_C_S1);
  if (str_type < 0) {
    return std::unexpected(OutputError("Failed to create string type"));
  }
  TypeHandle string_type(str_type);

  if (H5Tset_size(string_type, max_len) < 0 || H5Tset_strpad(string_type, H5T_STR_NULLTERM) < 0) {
    return std::unexpected(OutputError(std::format("Failed to size string type for '{}'", name)));
  }

  hsize_t dims = values.size();
  auto space_id = H5Screate_simple(1, &dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for string array '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto dataset_id = H5Dcreate2(parent, name.c_str(), string_type, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create string array dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  std::vector<char> buffer(values.size() * max_len, '\0');
  for (std::size_t i = 0; i < values.size(); ++i) {
    std::memcpy(&buffer[i * max_len], values[i].data(), values[i].size());
  }

  auto status = H5Dwrite(dataset, string_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data());
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write string array data for '{}'", name)));
  }

  return {};
}

auto HDF5Writer::create_chunked_properties(std::size_t size) const -> std::expected<PropertyHandle, OutputError> {

  auto plist_id = H5Pcreate(H5P_DATASET_CREATE);
  if (plist_id < 0) {
    return std::unexpected(OutputError("Failed to create dataset property list"));
  }
  PropertyHandle props(plist_id);

  if (hdf5_config_.compression_level <= 0) {
    return props;
  }

  // Chunk size must be <= data size
  hsize_t chunk_size = std::max<std::size_t>(std::min(size, hdf5_config_.chunk_size), 1);

  if (H5Pset_chunk(props, 1, &chunk_size) < 0) {
    return std::unexpected(OutputError("Failed to set chunking"));
  }

  if (hdf5_config_.use_shuffle_filter && H5Pset_shuffle(props) < 0) {
    return std::unexpected(OutputError("Failed to set shuffle filter"));
  }
  if (H5Pset_deflate(props, static_cast<unsigned>(hdf5_config_.compression_level)) < 0) {
    return std::unexpected(OutputError("Failed to set deflate filter"));
  }

  return props;
}

namespace hdf5 {

auto check_version() -> std::expected<std::string, OutputError> {
  unsigned majnum, minnum, relnum;
  if (H5get_libversion(&majnum, &minnum, &relnum) < 0) {
    return std::unexpected(OutputError("Failed to get HDF5 version"));
  }

  return std::format("{}.{}.{}", majnum, minnum, relnum);
}

auto validate_file(const std::filesystem::path& file_path) -> std::expected<void, OutputError> {

  if (!std::filesystem::exists(file_path)) {
    return std::unexpected(OutputError(std::format("File does not exist: {}", file_path.string())));
  }

  auto result = H5Fis_hdf5(file_path.c_str());
  if (result <= 0) {
    return std::unexpected(OutputError(std::format("Not a valid HDF5 file: {}", file_path.string())));
  }

  return {};
}

} // namespace hdf5

} // namespace localderiv::io::output
