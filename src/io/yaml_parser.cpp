#include "findiff/io/yaml_parser.hpp"
#include "findiff/core/constants.hpp"
#include "findiff/core/expected_utils.hpp"

#include <unordered_set>

namespace findiff::io {

auto YamlParser::load() -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::LoadFile(file_path_);
    return {};
  } catch (const YAML::BadFile& e) {
    return std::unexpected(core::FileError{"Failed to open YAML file", file_path_});
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  } catch (const std::exception& e) {
    return std::unexpected(core::FileError{std::format("Unexpected error during YAML load: {}", e.what()), file_path_});
  }
}

auto YamlParser::load_from_string(std::string_view content) -> std::expected<void, core::ConfigurationError> {
  try {
    root_ = YAML::Load(std::string(content));
    return {};
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::ConfigurationError(std::format("YAML parsing error: {}", e.what())));
  }
}

auto YamlParser::parse() const -> std::expected<Configuration, core::ConfigurationError> {
  try {
    if (!root_ || root_.IsNull()) {
      return std::unexpected(core::ConfigurationError("No YAML content loaded. Call load() first."));
    }

    if (!root_["derivative"]) {
      return std::unexpected(core::ConfigurationError("Missing required 'derivative' section."));
    }

    Configuration config;

    auto derivative_result = parse_derivative_config(root_["derivative"]);
    if (!derivative_result) {
      return std::unexpected(derivative_result.error());
    }
    config.derivative = std::move(derivative_result.value());

    if (root_["derivative"]["verbose"]) {
      auto verbose = extract_value<bool>(root_["derivative"], "verbose");
      if (!verbose) {
        return std::unexpected(verbose.error());
      }
      config.verbose = verbose.value();
    }

    return config;

  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("YAML parsing error: {}", e.what())));
  }
}

auto YamlParser::parse_derivative_config(const YAML::Node& node) const
    -> std::expected<DerivativeConfig, core::ConfigurationError> {

  DerivativeConfig config;

  FINDIFF_TRY_ASSIGN(config.sizes, extract_value<std::vector<double>>(node, "sizes"));
  FINDIFF_TRY_ASSIGN(config.methods, extract_value<std::vector<std::string>>(node, "methods"));
  for (auto& method : config.methods) {
    std::ranges::transform(method, method.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  }

  if (node["directions"]) {
    auto directions = parse_directions(node["directions"]);
    if (!directions) {
      return std::unexpected(directions.error());
    }
    config.directions = std::move(directions.value());
  }

  if (node["analyses"]) {
    FINDIFF_TRY_ASSIGN(config.analyses, extract_value<std::vector<std::string>>(node, "analyses"));
  }

  if (node["success"]) {
    auto success = parse_success_config(node["success"]);
    if (!success) {
      return std::unexpected(success.error());
    }
    config.success = success.value();
  }

  if (node["failure_policy"]) {
    auto policy = extract_enum(node, "failure_policy", enum_mappings::failure_policies);
    if (!policy) {
      return std::unexpected(policy.error());
    }
    config.failure_policy = policy.value();
  }

  return config;
}

auto YamlParser::parse_success_config(const YAML::Node& node) const
    -> std::expected<SuccessConfig, core::ConfigurationError> {

  SuccessConfig config;

  if (node["policy"]) {
    auto policy = extract_enum(node, "policy", enum_mappings::success_policies);
    if (!policy) {
      return std::unexpected(policy.error());
    }
    config.policy = policy.value();
  }

  if (node["rtol"]) {
    auto rtol = extract_value<double>(node, "rtol");
    if (!rtol) {
      return std::unexpected(rtol.error());
    }
    config.rtol = rtol.value();
  }

  if (node["atol"]) {
    auto atol = extract_value<double>(node, "atol");
    if (!atol) {
      return std::unexpected(atol.error());
    }
    config.atol = atol.value();
  }

  if (node["group_by"]) {
    auto key = extract_enum(node, "group_by", enum_mappings::grouping_keys);
    if (!key) {
      return std::unexpected(key.error());
    }
    config.group_by = key.value();
  }

  return config;
}

auto YamlParser::parse_directions(const YAML::Node& node) const
    -> std::expected<std::vector<DirectionConfig>, core::ConfigurationError> {

  if (!node.IsSequence()) {
    return std::unexpected(core::ConfigurationError("Field 'directions' must be a sequence"));
  }

  std::vector<DirectionConfig> directions;
  std::unordered_set<std::string> seen_ids;

  for (std::size_t i = 0; i < node.size(); ++i) {
    const auto entry = node[i];
    DirectionConfig direction;

    auto id = extract_value<std::string>(entry, "id");
    if (!id) {
      return std::unexpected(
          core::ConfigurationError(std::format("Direction #{}: {}", i, id.error().message())));
    }
    direction.id = std::move(id.value());

    if (!seen_ids.insert(direction.id).second) {
      return std::unexpected(
          core::ValidationError("directions", std::format("duplicate direction identifier '{}'", direction.id)));
    }

    auto vector = extract_value<std::vector<double>>(entry, "vector");
    if (!vector) {
      return std::unexpected(
          core::ConfigurationError(std::format("Direction '{}': {}", direction.id, vector.error().message())));
    }
    direction.vector = std::move(vector.value());

    directions.push_back(std::move(direction));
  }

  return directions;
}

} // namespace findiff::io
