#pragma once
#include "../core/exceptions.hpp"
#include "../engine/derivative_engine.hpp"
#include "config_types.hpp"
#include "yaml_parser.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>

namespace findiff::io {

class ConfigurationManager {
private:
  std::unique_ptr<YamlParser> parser_;
  std::optional<Configuration> current_config_;
  std::filesystem::path config_file_path_;

  [[nodiscard]] auto
  resolve_config_path(std::string_view config_file) const -> std::expected<std::filesystem::path, core::FileError>;

public:
  explicit ConfigurationManager() = default;

  [[nodiscard]] auto load(std::string_view config_file) -> std::expected<Configuration, core::ConfigurationError>;

  [[nodiscard]] auto load_from_string(std::string_view content)
      -> std::expected<Configuration, core::ConfigurationError>;

  [[nodiscard]] auto current() const noexcept -> const std::optional<Configuration>& { return current_config_; }
};

/**
 * @brief Build request options from a parsed configuration
 *
 * Instantiates the named analyses and the success policy. Sizes and methods are
 * validated later by the engine, before any function call.
 */
[[nodiscard]] auto make_options(const Configuration& config)
    -> std::expected<engine::DerivativeOptions, core::ConfigurationError>;

} // namespace findiff::io
