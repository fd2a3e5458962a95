#pragma once
#include "../analysis/analysis_interface.hpp"
#include "../computation/computation_orchestrator.hpp"
#include "../core/containers.hpp"
#include "../core/exceptions.hpp"
#include "../derivative/derivative.hpp"
#include "../differences/direction_set.hpp"
#include "../differences/method_registry.hpp"
#include "../success/success_evaluator.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace findiff::engine {

/**
 * @brief Request-level error
 *
 * Wraps either a configuration problem detected before any function call or an
 * evaluation failure of the target function.
 */
class RequestError : public core::FindiffException {
public:
  enum class Kind { Configuration, Evaluation };

  // Message, location and context chain are kept from the cause
  explicit RequestError(const core::ConfigurationError& cause) : FindiffException(cause), kind_(Kind::Configuration) {}

  explicit RequestError(const core::EvaluationError& cause) : FindiffException(cause), kind_(Kind::Evaluation) {}

  [[nodiscard]] auto kind() const noexcept -> Kind { return kind_; }
  [[nodiscard]] auto is_configuration_error() const noexcept -> bool { return kind_ == Kind::Configuration; }
  [[nodiscard]] auto is_evaluation_error() const noexcept -> bool { return kind_ == Kind::Evaluation; }

private:
  Kind kind_;
};

struct DerivativeOptions {
  std::vector<double> sizes;
  std::vector<std::string> methods;
  std::optional<std::vector<differences::Direction>> directions; // Standard basis when empty
  analysis::AnalysisList analyses;
  std::shared_ptr<const success::SuccessEvaluator> success_evaluator; // Default Consistency when null
  computation::FailurePolicy failure_policy = computation::FailurePolicy::FailFast;
  bool verbose = false;
};

/**
 * @brief Entry point of a derivative request
 *
 * Validates the whole request before the first function call, then runs
 * computation, analyses and success evaluation direction by direction.
 */
class DerivativeEngine {
public:
  explicit DerivativeEngine(std::shared_ptr<const differences::MethodRegistry> registry =
                                differences::MethodRegistry::builtin());

  [[nodiscard]] auto differentiate(const core::VectorFunction& function, const core::Point& point,
                                   const DerivativeOptions& options) const
      -> std::expected<derivative::Derivative, RequestError>;

  [[nodiscard]] auto registry() const noexcept -> const differences::MethodRegistry& { return *registry_; }

private:
  std::shared_ptr<const differences::MethodRegistry> registry_;

  [[nodiscard]] auto validate_sizes(const std::vector<double>& sizes) const
      -> std::expected<void, core::ConfigurationError>;
};

// Convenience entry points using the built-in registry
[[nodiscard]] auto differentiate(const core::VectorFunction& function, const core::Point& point,
                                 const DerivativeOptions& options) -> std::expected<derivative::Derivative, RequestError>;

// Scalar target functions; the value vector then holds one entry per direction
[[nodiscard]] auto differentiate_scalar(const core::ScalarFunction& function, const core::Point& point,
                                        const DerivativeOptions& options)
    -> std::expected<derivative::Derivative, RequestError>;

} // namespace findiff::engine
