#pragma once
#include "../computation/result_types.hpp"
#include "../core/containers.hpp"
#include "../differences/direction_set.hpp"
#include "../success/success_evaluator.hpp"
#include <optional>
#include <string>
#include <vector>

namespace findiff::derivative {

// Per-direction aggregate with full provenance
struct DirectionalDerivative {
  differences::Direction direction;
  bool success = false;
  std::optional<core::MathVector<double>> value;
  std::vector<computation::ComputerResult> computer_results;
  std::vector<computation::AnalysisResult> analysis_results;
  std::vector<computation::MissingComputation> missing;

  // Raw results followed by derived ones
  [[nodiscard]] auto pooled_estimates() const -> computation::EstimatePool;
};

// Row of the concise view
struct ConciseRow {
  std::string direction_id;
  bool success;
  std::optional<core::MathVector<double>> value;
};

// Row of the full view
struct FullRow {
  std::string direction_id;
  bool success;
  std::optional<core::MathVector<double>> value;
  const std::vector<computation::ComputerResult>* computer_results;
  const std::vector<computation::AnalysisResult>* analysis_results;
  const std::vector<computation::MissingComputation>* missing;
};

/**
 * @brief Final output of a derivative request
 *
 * Frozen once assembled: only const accessors are exposed. The full-view rows
 * point into this object and must not outlive it.
 */
class Derivative {
private:
  std::vector<DirectionalDerivative> directions_;
  Eigen::Index output_dimension_;

public:
  Derivative(std::vector<DirectionalDerivative> directions, Eigen::Index output_dimension)
      : directions_(std::move(directions)), output_dimension_(output_dimension) {}

  [[nodiscard]] auto directions() const noexcept -> const std::vector<DirectionalDerivative>& { return directions_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return directions_.size(); }
  [[nodiscard]] auto operator[](std::size_t i) const -> const DirectionalDerivative& { return directions_[i]; }
  [[nodiscard]] auto find(std::string_view direction_id) const -> const DirectionalDerivative*;

  [[nodiscard]] auto output_dimension() const noexcept -> Eigen::Index { return output_dimension_; }

  // Logical AND over the per-direction successes
  [[nodiscard]] auto success() const noexcept -> bool;

  // Per-direction values concatenated in direction order; NaN for failed directions
  [[nodiscard]] auto value() const -> core::MathVector<double>;

  // output_dimension x n_directions; NaN columns for failed directions
  [[nodiscard]] auto jacobian() const -> core::MathMatrix<double>;

  [[nodiscard]] auto concise_view() const -> std::vector<ConciseRow>;

  [[nodiscard]] auto full_view() const -> std::vector<FullRow>;
};

/**
 * @brief Assemble the Derivative from per-direction provenance and outcomes
 *
 * The output dimension is taken from the first result found; a request in which
 * every combination went missing reports an output dimension of 1.
 */
[[nodiscard]] auto assemble(std::vector<DirectionalDerivative> directions) -> Derivative;

} // namespace findiff::derivative
