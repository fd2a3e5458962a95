#pragma once
#include "../computation/result_types.hpp"
#include "../core/containers.hpp"
#include "../core/exceptions.hpp"
#include "direction_set.hpp"
#include "method_registry.hpp"
#include <expected>

namespace findiff::differences {

/**
 * @brief Evaluates one finite-difference estimate of a directional derivative
 *
 * The point is never modified; perturbed points are built as copies.
 * Any exception raised by the target function, or an output whose dimension
 * differs from the other evaluations of the request, is reported as an EvaluationError.
 */
class DifferenceComputer {
public:
  /**
   * @brief Evaluate the target function at the unperturbed point
   * @param function Target function
   * @param point Evaluation point
   * @return f(point) or an error
   */
  [[nodiscard]] auto evaluate_base(const core::VectorFunction& function, const core::Point& point) const
      -> std::expected<core::MathVector<double>, core::EvaluationError>;

  /**
   * @brief Compute one estimate
   * @param function Target function
   * @param point Evaluation point
   * @param direction Direction of differentiation
   * @param size Step length h
   * @param method Stencil and its identifier
   * @param base_value Cached f(point), used for zero-offset stencil points when given
   * @param expected_dimension Output dimension every evaluation must match, 0 when not yet known
   * @return Estimate tagged with the method id and size, or an error
   */
  [[nodiscard]] auto compute(const core::VectorFunction& function, const core::Point& point,
                             const Direction& direction, double size, const ResolvedMethod& method,
                             const core::MathVector<double>* base_value = nullptr,
                             Eigen::Index expected_dimension = 0) const
      -> std::expected<computation::ComputerResult, core::EvaluationError>;

private:
  [[nodiscard]] auto evaluate_at(const core::VectorFunction& function, const core::Point& point,
                                 std::string_view where, Eigen::Index expected_dimension) const
      -> std::expected<core::MathVector<double>, core::EvaluationError>;
};

} // namespace findiff::differences
