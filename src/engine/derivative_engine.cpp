#include "findiff/engine/derivative_engine.hpp"
#include "findiff/core/constants.hpp"
#include "findiff/core/expected_utils.hpp"
#include "findiff/success/consistency.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <format>
#include <iostream>

namespace findiff::engine {

namespace {

auto format_value(const std::optional<core::MathVector<double>>& value) -> std::string {
  if (!value) {
    return "none";
  }
  std::string out = "[";
  for (Eigen::Index i = 0; i < value->size(); ++i) {
    out += std::format("{}{:.10g}", i == 0 ? "" : ", ", (*value)(i));
  }
  return out + "]";
}

} // namespace

DerivativeEngine::DerivativeEngine(std::shared_ptr<const differences::MethodRegistry> registry)
    : registry_(std::move(registry)) {}

auto DerivativeEngine::validate_sizes(const std::vector<double>& sizes) const
    -> std::expected<void, core::ConfigurationError> {
  if (sizes.empty()) {
    return std::unexpected(core::ValidationError("sizes", "at least one step size is required"));
  }
  for (std::size_t i = 0; i < sizes.size(); ++i) {
    if (!std::isfinite(sizes[i]) || sizes[i] <= 0.0) {
      return std::unexpected(
          core::ValidationError("sizes", std::format("step size {} must be positive and finite", sizes[i])));
    }
    if (std::find(sizes.begin(), sizes.begin() + static_cast<std::ptrdiff_t>(i), sizes[i]) !=
        sizes.begin() + static_cast<std::ptrdiff_t>(i)) {
      return std::unexpected(core::ValidationError("sizes", std::format("step size {} is requested twice", sizes[i])));
    }
  }
  return {};
}

auto DerivativeEngine::differentiate(const core::VectorFunction& function, const core::Point& point,
                                     const DerivativeOptions& options) const
    -> std::expected<derivative::Derivative, RequestError> {

  const bool verbose = options.verbose || (std::getenv(constants::environment::verbose_variable) != nullptr);

  // Every check happens before the target function is called
  if (!function) {
    return std::unexpected(RequestError(core::ConfigurationError("Target function is empty")));
  }
  if (!registry_) {
    return std::unexpected(RequestError(core::ConfigurationError("Method registry is missing")));
  }
  if (point.size() == 0) {
    return std::unexpected(RequestError(core::ValidationError("point", "must have at least one component")));
  }
  if (!point.allFinite()) {
    return std::unexpected(RequestError(core::ValidationError("point", "has non-finite components")));
  }

  if (auto sizes_ok = validate_sizes(options.sizes); !sizes_ok) {
    return std::unexpected(RequestError(sizes_ok.error()));
  }

  auto methods = differences::resolve_methods(*registry_, options.methods);
  if (!methods) {
    return std::unexpected(RequestError(methods.error()));
  }

  auto directions = differences::DirectionSet::resolve(options.directions, static_cast<std::size_t>(point.size()));
  if (!directions) {
    return std::unexpected(RequestError(directions.error()));
  }

  for (const auto& analysis : options.analyses) {
    if (!analysis) {
      return std::unexpected(RequestError(core::ValidationError("analyses", "contains a null analysis")));
    }
  }

  std::shared_ptr<const success::SuccessEvaluator> evaluator = options.success_evaluator;
  if (!evaluator) {
    evaluator = std::make_shared<const success::Consistency>();
  }

  if (verbose) {
    std::cout << std::format("[DERIVATIVE] {} direction(s) x {} size(s) x {} method(s), {} analysis(es), policy '{}'",
                             directions->size(), options.sizes.size(), methods->size(), options.analyses.size(),
                             evaluator->name())
              << std::endl;
  }

  // Raw estimates
  const computation::ComputationOrchestrator orchestrator(options.failure_policy, verbose);
  auto computed = orchestrator.run(function, point, *directions, options.sizes, *methods);
  if (!computed) {
    return std::unexpected(RequestError(computed.error()));
  }
  auto entries = std::move(computed.value()).release();

  // Derived estimates and success evaluation, direction by direction
  std::vector<derivative::DirectionalDerivative> results;
  results.reserve(directions->size());
  for (std::size_t i = 0; i < directions->size(); ++i) {
    derivative::DirectionalDerivative directional;
    directional.direction = (*directions)[i];
    directional.computer_results = std::move(entries[i].results);
    directional.missing = std::move(entries[i].missing);
    directional.analysis_results = analysis::run_analyses(options.analyses, directional.computer_results);

    auto outcome = evaluator->evaluate(directional.direction, directional.pooled_estimates());
    directional.success = outcome.success;
    directional.value = std::move(outcome.value);

    if (verbose) {
      std::cout << std::format("[DERIVATIVE] direction '{}': {} ({} raw, {} derived, {} missing) value {}",
                               directional.direction.id, directional.success ? "consistent" : "inconsistent",
                               directional.computer_results.size(), directional.analysis_results.size(),
                               directional.missing.size(), format_value(directional.value))
                << std::endl;
    }

    results.push_back(std::move(directional));
  }

  return derivative::assemble(std::move(results));
}

auto differentiate(const core::VectorFunction& function, const core::Point& point, const DerivativeOptions& options)
    -> std::expected<derivative::Derivative, RequestError> {
  const DerivativeEngine engine;
  return engine.differentiate(function, point, options);
}

auto differentiate_scalar(const core::ScalarFunction& function, const core::Point& point,
                          const DerivativeOptions& options) -> std::expected<derivative::Derivative, RequestError> {
  if (!function) {
    return std::unexpected(RequestError(core::ConfigurationError("Target function is empty")));
  }
  return differentiate(core::as_vector_function(function), point, options);
}

} // namespace findiff::engine
