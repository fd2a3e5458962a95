#pragma once
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include <algorithm>
#include <cctype>
#include <concepts>
#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

namespace findiff::io {

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

  [[nodiscard]] auto
  parse_derivative_config(const YAML::Node& node) const -> std::expected<DerivativeConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_success_config(const YAML::Node& node) const -> std::expected<SuccessConfig, core::ConfigurationError>;

  [[nodiscard]] auto parse_directions(const YAML::Node& node) const
      -> std::expected<std::vector<DirectionConfig>, core::ConfigurationError>;

public:
  explicit YamlParser(std::string file_path) : file_path_(std::move(file_path)) {}

  [[nodiscard]] auto load() -> std::expected<void, core::FileError>;

  // Parse an in-memory document instead of the file
  [[nodiscard]] auto load_from_string(std::string_view content) -> std::expected<void, core::ConfigurationError>;

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

    if constexpr (std::same_as<T, std::vector<double>> || std::same_as<T, std::vector<std::string>>) {
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
auto YamlParser::extract_enum(const YAML::Node& node, std::string_view key,
                              const std::unordered_map<std::string, EnumType>& mapping) const
    -> std::expected<EnumType, core::ConfigurationError> {
  auto str_result = extract_value<std::string>(node, key);
  if (!str_result) {
    return std::unexpected(str_result.error());
  }

  auto str_value = str_result.value();
  std::ranges::transform(str_value, str_value.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  auto it = mapping.find(str_value);
  if (it == mapping.end()) {
    std::string valid_options;
    for (const auto& [option, _] : mapping) {
      valid_options += option + ", ";
    }
    valid_options = valid_options.substr(0, valid_options.length() - 2);

    return std::unexpected(core::ConfigurationError(
        std::format("Invalid value '{}' for field '{}'. Valid options: {}", str_value, key, valid_options)));
  }

  return it->second;
}

// Enum mappings
namespace enum_mappings {

inline const std::unordered_map<std::string, SuccessConfig::Policy> success_policies = {
    {"consistency", SuccessConfig::Policy::Consistency}};

inline const std::unordered_map<std::string, success::GroupingKey> grouping_keys = {
    {"size", success::GroupingKey::Size},
    {"method", success::GroupingKey::Id},
    {"id", success::GroupingKey::Id},
    {"none", success::GroupingKey::None}};

inline const std::unordered_map<std::string, computation::FailurePolicy> failure_policies = {
    {"fail_fast", computation::FailurePolicy::FailFast},
    {"failfast", computation::FailurePolicy::FailFast},
    {"partial", computation::FailurePolicy::Partial}};

} // namespace enum_mappings

} // namespace findiff::io
