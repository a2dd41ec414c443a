#include "localderiv/io/yaml_parser.hpp"
#include "localderiv/core/exceptions.hpp"
#include "localderiv/core/expected_utils.hpp"
#include "localderiv/core/interval.hpp"
#include "localderiv/stencil/padding.hpp"
#include "localderiv/stencil/stencil_table.hpp"

namespace localderiv::io {

auto to_string(RunConfig::Operator op) noexcept -> std::string_view {
  switch (op) {
  case RunConfig::Operator::Gradient:
    return "gradient";
  case RunConfig::Operator::Hessian:
    return "hessian";
  }
  return "unknown";
}

auto to_string(OutputConfig::Format format) noexcept -> std::string_view {
  switch (format) {
  case OutputConfig::Format::CSV:
    return "csv";
  case OutputConfig::Format::HDF5:
    return "hdf5";
  }
  return "unknown";
}

auto YamlParser::load() -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::LoadFile(file_path_);
    return {};
  } catch (const YAML::BadFile&) {
    return std::unexpected(core::FileError{"Failed to open YAML file", file_path_});
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  } catch (const std::exception& e) {
    return std::unexpected(core::FileError{std::format("Unexpected error during YAML load: {}", e.what()), file_path_});
  }
}

auto YamlParser::load_string(const std::string& content) -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::Load(content);
    return {};
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  }
}

auto YamlParser::parse() const -> std::expected<Configuration, core::ConfigurationError> {
  try {
    if (!root_ || root_.IsNull()) {
      return std::unexpected(core::ConfigurationError("No YAML content loaded. Call load() first."));
    }

    for (const auto* section : {"image", "field", "region", "runs"}) {
      if (!root_[section]) {
        return std::unexpected(core::ConfigurationError(std::format("Missing required '{}' section.", section)));
      }
    }

    Configuration config;

    LOCALDERIV_TRY_ASSIGN(config.image, parse_image_config(root_["image"]));
    const auto n_dims = config.image.dimensions.size();

    LOCALDERIV_TRY_ASSIGN(config.field, parse_field_config(root_["field"]));
    if (config.field.type == FieldConfig::Type::Separable && config.field.profiles.size() != n_dims) {
      return std::unexpected(core::ValidationError(
          "field.profiles", std::format("expected {} profiles (one per axis), got {}", n_dims,
                                        config.field.profiles.size())));
    }
    if (config.field.type == FieldConfig::Type::QuadraticForm && n_dims < 2) {
      return std::unexpected(core::ValidationError("field.type", "quadratic_form needs an image with >= 2 axes"));
    }

    LOCALDERIV_TRY_ASSIGN(config.region, parse_region_config(root_["region"]));
    if (config.region.min.size() != n_dims) {
      return std::unexpected(core::ValidationError(
          "region", std::format("expected {} coordinates, got {}", n_dims, config.region.min.size())));
    }

    const auto& runs_node = root_["runs"];
    if (!runs_node.IsSequence() || runs_node.size() == 0) {
      return std::unexpected(core::ValidationError("runs", "must be a non-empty sequence"));
    }
    for (std::size_t i = 0; i < runs_node.size(); ++i) {
      auto run = parse_run_config(runs_node[i]);
      if (!run) {
        return std::unexpected(core::ConfigurationError(std::format("In 'runs[{}]': {}", i, run.error().message())));
      }
      config.runs.push_back(run.value());
    }

    if (root_["output"]) {
      LOCALDERIV_TRY_ASSIGN(config.output, parse_output_config(root_["output"]));
    }

    if (root_["verbose"]) {
      LOCALDERIV_TRY_ASSIGN(config.verbose, extract_value<bool>(root_, "verbose"));
    }

    // Every run must read only pixels the image has.
    core::Interval image_extent;
    LOCALDERIV_TRY_ASSIGN(image_extent, core::expected_utils::as_configuration_error(
                                            core::Interval::from_dimensions(config.image.dimensions), "image"));
    core::Interval region;
    LOCALDERIV_TRY_ASSIGN(region, core::expected_utils::as_configuration_error(
                                      core::Interval::create_min_max(config.region.min, config.region.max), "region"));

    for (std::size_t i = 0; i < config.runs.size(); ++i) {
      const auto& run = config.runs[i];
      auto padded = run.op == RunConfig::Operator::Gradient
                        ? stencil::gradient_padded_interval(region, run.kind, run.order)
                        : stencil::hessian_padded_interval(region, run.order);
      if (!padded) {
        return std::unexpected(padded.error());
      }
      if (!image_extent.contains(padded.value())) {
        return std::unexpected(core::ConfigurationError(
            std::format("runs[{}] ({} {} order {}) reads {} which exceeds the image {}", i, to_string(run.op),
                        stencil::to_string(run.kind), run.order, padded->to_string(), image_extent.to_string())));
      }
    }

    return config;

  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("YAML parsing error: {}", e.what())));
  }
}

auto YamlParser::parse_image_config(const YAML::Node& node) const
    -> std::expected<ImageConfig, core::ConfigurationError> {
  ImageConfig config;

  LOCALDERIV_TRY_ASSIGN(config.dimensions, extract_value<std::vector<core::Index>>(node, "dimensions"));
  if (config.dimensions.empty()) {
    return std::unexpected(core::ValidationError("image.dimensions", "must list at least one axis"));
  }
  for (auto size : config.dimensions) {
    if (size <= 0) {
      return std::unexpected(core::ValidationError("image.dimensions", std::format("sizes must be > 0, got {}", size)));
    }
  }
  return config;
}

auto YamlParser::parse_field_config(const YAML::Node& node) const
    -> std::expected<FieldConfig, core::ConfigurationError> {
  FieldConfig config;

  LOCALDERIV_TRY_ASSIGN(config.type, extract_enum(node, "type", enum_mappings::field_types));

  switch (config.type) {
  case FieldConfig::Type::Separable: {
    std::vector<std::string> names;
    LOCALDERIV_TRY_ASSIGN(names, extract_value<std::vector<std::string>>(node, "profiles"));
    for (auto& name : names) {
      fields::Profile::Type profile{};
      LOCALDERIV_TRY_ASSIGN(profile, to_enum(std::move(name), "profiles", enum_mappings::profiles));
      config.profiles.push_back(profile);
    }
    if (node["constant"]) {
      LOCALDERIV_TRY_ASSIGN(config.constant, extract_value<double>(node, "constant"));
    }
    break;
  }
  case FieldConfig::Type::QuadraticForm: {
    if (node["theta"]) {
      LOCALDERIV_TRY_ASSIGN(config.theta, extract_value<double>(node, "theta"));
    }
    LOCALDERIV_TRY_ASSIGN(config.sigma, extract_value<std::vector<double>>(node, "sigma"));
    LOCALDERIV_TRY_ASSIGN(config.center, extract_value<std::vector<double>>(node, "center"));
    if (config.sigma.size() != 2 || config.sigma[0] <= 0.0 || config.sigma[1] <= 0.0) {
      return std::unexpected(core::ValidationError("field.sigma", "expected two positive widths [sx, sy]"));
    }
    if (config.center.size() != 2) {
      return std::unexpected(core::ValidationError("field.center", "expected two coordinates [px, py]"));
    }
    break;
  }
  }

  return config;
}

auto YamlParser::parse_region_config(const YAML::Node& node) const
    -> std::expected<RegionConfig, core::ConfigurationError> {
  RegionConfig config;

  LOCALDERIV_TRY_ASSIGN(config.min, extract_value<std::vector<core::Index>>(node, "min"));
  LOCALDERIV_TRY_ASSIGN(config.max, extract_value<std::vector<core::Index>>(node, "max"));
  if (config.min.size() != config.max.size()) {
    return std::unexpected(core::ValidationError(
        "region", std::format("min has {} coordinates but max has {}", config.min.size(), config.max.size())));
  }
  for (std::size_t d = 0; d < config.min.size(); ++d) {
    if (config.min[d] > config.max[d]) {
      return std::unexpected(core::ValidationError(
          "region", std::format("min > max on axis {} ({} > {})", d, config.min[d], config.max[d])));
    }
  }
  return config;
}

auto YamlParser::parse_run_config(const YAML::Node& node) const -> std::expected<RunConfig, core::ConfigurationError> {
  RunConfig config;

  LOCALDERIV_TRY_ASSIGN(config.op, extract_enum(node, "operator", enum_mappings::operators));
  if (node["kind"]) {
    LOCALDERIV_TRY_ASSIGN(config.kind, extract_enum(node, "kind", enum_mappings::difference_kinds));
  }
  if (node["order"]) {
    LOCALDERIV_TRY_ASSIGN(config.order, extract_value<int>(node, "order"));
  }
  LOCALDERIV_TRY_ASSIGN(config.tolerance, extract_value<double>(node, "tolerance"));
  if (!(config.tolerance > 0.0)) {
    return std::unexpected(core::ValidationError("tolerance", std::format("must be > 0, got {}", config.tolerance)));
  }

  if (config.op == RunConfig::Operator::Hessian && config.kind != stencil::DifferenceKind::Central) {
    return std::unexpected(core::ValidationError(
        "kind", std::format("hessian supports central differences only, got {}", stencil::to_string(config.kind))));
  }

  const auto derivative =
      config.op == RunConfig::Operator::Gradient ? stencil::Derivative::First : stencil::Derivative::Second;
  if (!stencil::is_supported(derivative, config.kind, config.order)) {
    // lookup() formats the list of valid orders.
    auto rejected = stencil::lookup(derivative, config.kind, config.order);
    if (!rejected) {
      return std::unexpected(rejected.error());
    }
  }

  return config;
}

auto YamlParser::parse_output_config(const YAML::Node& node) const
    -> std::expected<OutputConfig, core::ConfigurationError> {
  OutputConfig config;

  try {
    if (node["directory"]) {
      LOCALDERIV_TRY_ASSIGN(config.directory, extract_value<std::string>(node, "directory"));
    }
    if (node["case_name"]) {
      LOCALDERIV_TRY_ASSIGN(config.case_name, extract_value<std::string>(node, "case_name"));
    }
    if (node["formats"]) {
      std::vector<std::string> names;
      LOCALDERIV_TRY_ASSIGN(names, extract_value<std::vector<std::string>>(node, "formats"));
      config.formats.clear();
      for (auto& name : names) {
        OutputConfig::Format format{};
        LOCALDERIV_TRY_ASSIGN(format, to_enum(std::move(name), "formats", enum_mappings::output_formats));
        if (std::ranges::find(config.formats, format) == config.formats.end()) {
          config.formats.push_back(format);
        }
      }
    }
    return config;

  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("In 'output' section: {}", e.what())));
  }
}

} // namespace localderiv::io
