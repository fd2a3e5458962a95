#include "findiff/differences/difference_computer.hpp"
#include "findiff/core/expected_utils.hpp"
#include <format>

namespace findiff::differences {

auto DifferenceComputer::evaluate_at(const core::VectorFunction& function, const core::Point& point,
                                     std::string_view where, Eigen::Index expected_dimension) const
    -> std::expected<core::MathVector<double>, core::EvaluationError> {

  auto value = core::expected_utils::with_context<core::EvaluationError>(
      [&]() -> core::MathVector<double> { return function(point); },
      std::format("target function raised at {}", where));
  if (!value) {
    return std::unexpected(value.error());
  }

  if (value->size() == 0) {
    return std::unexpected(core::EvaluationError(std::format("target function returned an empty value at {}", where)));
  }
  if (expected_dimension > 0 && value->size() != expected_dimension) {
    return std::unexpected(core::EvaluationError(std::format(
        "target function returned {} components at {} but {} elsewhere", value->size(), where,
        expected_dimension)));
  }
  return value;
}

auto DifferenceComputer::evaluate_base(const core::VectorFunction& function, const core::Point& point) const
    -> std::expected<core::MathVector<double>, core::EvaluationError> {
  return evaluate_at(function, point, "the base point", 0);
}

auto DifferenceComputer::compute(const core::VectorFunction& function, const core::Point& point,
                                 const Direction& direction, double size, const ResolvedMethod& method,
                                 const core::MathVector<double>* base_value, Eigen::Index expected_dimension) const
    -> std::expected<computation::ComputerResult, core::EvaluationError> {

  Eigen::Index dimension = base_value ? base_value->size() : expected_dimension;
  core::MathVector<double> accumulated;

  for (const auto& stencil_point : method.stencil.points) {
    core::MathVector<double> f_value;

    if (stencil_point.offset == 0.0 && base_value) {
      f_value = *base_value;
    } else {
      const core::Point perturbed = point + (stencil_point.offset * size) * direction.vector;
      auto evaluation = evaluate_at(
          function, perturbed,
          std::format("direction '{}', size {}, method '{}', offset {}", direction.id, size, method.id,
                      stencil_point.offset),
          dimension);
      if (!evaluation) {
        return std::unexpected(evaluation.error());
      }
      f_value = std::move(evaluation.value());
    }

    if (accumulated.size() == 0) {
      dimension = f_value.size();
      accumulated = core::MathVector<double>::Zero(dimension);
    }
    accumulated += stencil_point.weight * f_value;
  }

  computation::ComputerResult result;
  result.id = method.id;
  result.value = accumulated / size;
  result.metadata.size = size;
  return result;
}

} // namespace findiff::differences
