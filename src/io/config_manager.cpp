#include "localderiv/io/config_manager.hpp"
#include <format>

namespace localderiv::io {

auto ConfigurationManager::resolve_config_path(std::string_view config_file) const
    -> std::expected<std::filesystem::path, core::FileError> {
  const std::filesystem::path requested(config_file);

  if (std::filesystem::is_regular_file(requested)) {
    return std::filesystem::absolute(requested);
  }

  std::string searched = std::filesystem::absolute(requested).parent_path().string();
  if (requested.is_relative()) {
    for (const auto& directory : search_directories_) {
      const auto candidate = directory / requested;
      if (std::filesystem::is_regular_file(candidate)) {
        return std::filesystem::absolute(candidate);
      }
      searched += ", " + directory.string();
    }
  }

  return std::unexpected(
      core::FileError{std::format("could not locate config file (searched: {})", searched), std::string(config_file)});
}

auto ConfigurationManager::apply_overrides(Configuration& config, const ConfigOverrides& overrides)
    -> std::expected<void, core::ConfigurationError> {
  if (overrides.case_name) {
    const auto& name = *overrides.case_name;
    // The case name becomes the stem of every output file.
    if (name.empty() || name == "." || name == ".." || name.find_first_of("/\\") != std::string::npos) {
      return std::unexpected(core::ValidationError(
          "case_name", std::format("'{}' is not a valid output file stem", name)));
    }
    config.output.case_name = name;
  }
  return {};
}

auto ConfigurationManager::load(std::string_view config_file, const ConfigOverrides& overrides)
    -> std::expected<Configuration, core::ConfigurationError> {

  auto path_result = resolve_config_path(config_file);
  if (!path_result) {
    return std::unexpected(
        core::ConfigurationError(std::format("Failed to resolve config path: {}", path_result.error().message())));
  }
  config_file_path_ = path_result.value();

  parser_ = std::make_unique<YamlParser>(config_file_path_.string());

  if (auto load_result = parser_->load(); !load_result) {
    return std::unexpected(
        core::ConfigurationError(std::format("Failed to load YAML file: {}", load_result.error().message())));
  }

  auto parse_result = parser_->parse();
  if (!parse_result) {
    return std::unexpected(parse_result.error());
  }
  auto config = std::move(parse_result.value());

  if (auto applied = apply_overrides(config, overrides); !applied) {
    return std::unexpected(applied.error());
  }

  current_config_ = config;
  return config;
}

} // namespace localderiv::io
