#include "findiff/io/config_manager.hpp"
#include "findiff/analysis/analysis_interface.hpp"
#include "findiff/core/expected_utils.hpp"
#include "findiff/success/consistency.hpp"

namespace findiff::io {

auto ConfigurationManager::resolve_config_path(std::string_view config_file) const
    -> std::expected<std::filesystem::path, core::FileError> {
  std::filesystem::path path_candidate(config_file);

  if (!std::filesystem::exists(path_candidate)) {
    return std::unexpected(core::FileError{"could not locate config file", std::string(config_file)});
  }
  return std::filesystem::absolute(path_candidate);
}

auto ConfigurationManager::load(std::string_view config_file)
    -> std::expected<Configuration, core::ConfigurationError> {

  auto path_result = resolve_config_path(config_file);
  if (!path_result) {
    return std::unexpected(
        core::ConfigurationError(std::format("Failed to resolve config path: {}", path_result.error().message())));
  }

  config_file_path_ = path_result.value();

  parser_ = std::make_unique<YamlParser>(config_file_path_.string());

  auto load_result = parser_->load();
  if (!load_result) {
    return std::unexpected(
        core::ConfigurationError(std::format("Failed to load YAML file: {}", load_result.error().message())));
  }

  auto parse_result = parser_->parse();
  if (!parse_result) {
    return std::unexpected(parse_result.error());
  }

  current_config_ = std::move(parse_result.value());

  return *current_config_;
}

auto ConfigurationManager::load_from_string(std::string_view content)
    -> std::expected<Configuration, core::ConfigurationError> {

  parser_ = std::make_unique<YamlParser>("<memory>");

  FINDIFF_TRY_VOID(parser_->load_from_string(content));

  auto parse_result = parser_->parse();
  if (!parse_result) {
    return std::unexpected(parse_result.error());
  }

  current_config_ = std::move(parse_result.value());

  return *current_config_;
}

auto make_options(const Configuration& config) -> std::expected<engine::DerivativeOptions, core::ConfigurationError> {
  const auto& derivative = config.derivative;

  engine::DerivativeOptions options;
  options.sizes = derivative.sizes;
  options.methods = derivative.methods;
  options.failure_policy = derivative.failure_policy;
  options.verbose = config.verbose;

  if (derivative.directions) {
    std::vector<differences::Direction> directions;
    directions.reserve(derivative.directions->size());
    for (const auto& direction : *derivative.directions) {
      core::MathVector<double> vector = Eigen::Map<const core::MathVector<double>>(
          direction.vector.data(), static_cast<Eigen::Index>(direction.vector.size()));
      directions.push_back(differences::Direction{direction.id, std::move(vector)});
    }
    options.directions = std::move(directions);
  }

  for (const auto& id : derivative.analyses) {
    auto analysis = analysis::make_analysis(id);
    if (!analysis) {
      return std::unexpected(analysis.error());
    }
    options.analyses.push_back(std::move(analysis.value()));
  }

  switch (derivative.success.policy) {
  case SuccessConfig::Policy::Consistency: {
    auto consistency =
        success::Consistency::create(derivative.success.rtol, derivative.success.atol, derivative.success.group_by);
    if (!consistency) {
      return std::unexpected(consistency.error());
    }
    options.success_evaluator = std::make_shared<const success::Consistency>(consistency.value());
    break;
  }
  }

  return options;
}

} // namespace findiff::io
