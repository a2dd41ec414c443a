#pragma once
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include <algorithm>
#include <cctype>
#include <concepts>
#include <expected>
#include <format>
#include <string>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace localderiv::io {

class YamlParser {
private:
  YAML::Node root_;
  std::string file_path_;

  template <typename T>
  [[nodiscard]] auto extract_value(const YAML::Node& node,
                                   std::string_view key) const -> std::expected<T, core::ConfigurationError>;

  template <typename EnumType>
  [[nodiscard]] auto extract_enum(const YAML::Node& node, std::string_view key,
                                  const std::unordered_map<std::string, EnumType>& mapping) const
      -> std::expected<EnumType, core::ConfigurationError>;

  template <typename EnumType>
  [[nodiscard]] auto to_enum(std::string value, std::string_view key,
                             const std::unordered_map<std::string, EnumType>& mapping) const
      -> std::expected<EnumType, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_image_config(const YAML::Node& node) const -> std::expected<ImageConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_field_config(const YAML::Node& node) const -> std::expected<FieldConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_region_config(const YAML::Node& node) const -> std::expected<RegionConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_run_config(const YAML::Node& node) const -> std::expected<RunConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_output_config(const YAML::Node& node) const -> std::expected<OutputConfig, core::ConfigurationError>;

public:
  explicit YamlParser(std::string file_path) : file_path_(std::move(file_path)) {}

  [[nodiscard]] auto load() -> std::expected<void, core::FileError>;

  // Parses an in-memory document instead of the file.
  [[nodiscard]] auto load_string(const std::string& content) -> std::expected<void, core::FileError>;

  [[nodiscard]] auto parse() const -> std::expected<Configuration, core::ConfigurationError>;
};

// Implementation of template methods
template <typename T>
auto YamlParser::extract_value(const YAML::Node& node,
                               std::string_view key) const -> std::expected<T, core::ConfigurationError> {
  try {
    if (!node[std::string(key)]) {
      return std::unexpected(core::ConfigurationError(std::format("Required field '{}' is missing", key)));
    }

    if constexpr (std::same_as<T, std::vector<double>> || std::same_as<T, std::vector<core::Index>> ||
                  std::same_as<T, std::vector<std::string>>) {
      auto sequence = node[std::string(key)];
      if (!sequence.IsSequence()) {
        return std::unexpected(core::ConfigurationError(std::format("Field '{}' must be a sequence", key)));
      }
      T result;
      result.reserve(sequence.size());

      for (const auto& item : sequence) {
        result.push_back(item.as<typename T::value_type>());
      }
      return result;
    } else {
      return node[std::string(key)].as<T>();
    }
  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("Failed to parse field '{}': {}", key, e.what())));
  }
}

template <typename EnumType>
auto YamlParser::to_enum(std::string value, std::string_view key,
                         const std::unordered_map<std::string, EnumType>& mapping) const
    -> std::expected<EnumType, core::ConfigurationError> {
  std::ranges::transform(value, value.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  auto it = mapping.find(value);
  if (it == mapping.end()) {
    std::vector<std::string> options;
    for (const auto& [option, _] : mapping) {
      options.push_back(option);
    }
    std::ranges::sort(options);
    std::string valid_options;
    for (const auto& option : options) {
      valid_options += option + ", ";
    }
    valid_options = valid_options.substr(0, valid_options.length() - 2);

    return std::unexpected(core::ConfigurationError(
        std::format("Invalid value '{}' for field '{}'. Valid options: {}", value, key, valid_options)));
  }

  return it->second;
}

template <typename EnumType>
auto YamlParser::extract_enum(const YAML::Node& node, std::string_view key,
                              const std::unordered_map<std::string, EnumType>& mapping) const
    -> std::expected<EnumType, core::ConfigurationError> {
  auto str_result = extract_value<std::string>(node, key);
  if (!str_result) {
    return std::unexpected(str_result.error());
  }
  return to_enum(std::move(str_result.value()), key, mapping);
}

// Enum mappings
namespace enum_mappings {

inline const std::unordered_map<std::string, FieldConfig::Type> field_types = {
    {"separable", FieldConfig::Type::Separable},
    {"separable_product", FieldConfig::Type::Separable},
    {"quadratic_form", FieldConfig::Type::QuadraticForm},
    {"quadratic", FieldConfig::Type::QuadraticForm}};

inline const std::unordered_map<std::string, fields::Profile::Type> profiles = {
    {"reciprocal", fields::Profile::Type::Reciprocal},
    {"constant", fields::Profile::Type::Constant},
    {"linear", fields::Profile::Type::Linear},
    {"quadratic", fields::Profile::Type::Quadratic}};

inline const std::unordered_map<std::string, RunConfig::Operator> operators = {
    {"gradient", RunConfig::Operator::Gradient},
    {"hessian", RunConfig::Operator::Hessian}};

inline const std::unordered_map<std::string, stencil::DifferenceKind> difference_kinds = {
    {"central", stencil::DifferenceKind::Central},
    {"forward", stencil::DifferenceKind::Forward},
    {"backward", stencil::DifferenceKind::Backward}};

inline const std::unordered_map<std::string, OutputConfig::Format> output_formats = {
    {"csv", OutputConfig::Format::CSV},
    {"hdf5", OutputConfig::Format::HDF5},
    {"h5", OutputConfig::Format::HDF5}};

} // namespace enum_mappings

} // namespace localderiv::io
