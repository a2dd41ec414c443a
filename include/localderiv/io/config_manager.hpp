#pragma once
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include "yaml_parser.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace localderiv::io {

// Values given on the command line that take precedence over the file.
struct ConfigOverrides {
  std::optional<std::string> case_name;
};

/**
 * @brief Locates, parses and finalizes a report configuration.
 *
 * A relative path that does not exist as given is looked up in each search
 * directory in turn, so `localderiv_report default.yaml` finds a file under
 * `config/`. Overrides are applied after parsing and validated like the file.
 */
class ConfigurationManager {
private:
  std::vector<std::filesystem::path> search_directories_;
  std::unique_ptr<YamlParser> parser_;
  std::optional<Configuration> current_config_;
  std::filesystem::path config_file_path_;

  [[nodiscard]] auto
  resolve_config_path(std::string_view config_file) const -> std::expected<std::filesystem::path, core::FileError>;

  [[nodiscard]] static auto apply_overrides(Configuration& config, const ConfigOverrides& overrides)
      -> std::expected<void, core::ConfigurationError>;

public:
  explicit ConfigurationManager(std::vector<std::filesystem::path> search_directories = {})
      : search_directories_(std::move(search_directories)) {}

  [[nodiscard]] auto load(std::string_view config_file, const ConfigOverrides& overrides = {})
      -> std::expected<Configuration, core::ConfigurationError>;

  [[nodiscard]] auto config_file_path() const noexcept -> const std::filesystem::path& { return config_file_path_; }
  [[nodiscard]] auto search_directories() const noexcept -> const std::vector<std::filesystem::path>& {
    return search_directories_;
  }
};

} // namespace localderiv::io
