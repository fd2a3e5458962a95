#pragma once
#include "../core/containers.hpp"
#include "../core/exceptions.hpp"
#include "../differences/difference_computer.hpp"
#include "../differences/direction_set.hpp"
#include "../differences/method_registry.hpp"
#include "result_types.hpp"
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace findiff::computation {

enum class FailurePolicy {
  FailFast, // First evaluation error aborts the request
  Partial   // Failing combinations are recorded as missing and skipped
};

// Results generated for one direction, in size-then-method order
struct DirectionComputation {
  std::string direction_id;
  std::vector<ComputerResult> results;
  std::vector<MissingComputation> missing;
};

/**
 * @brief Per-direction collections of raw estimates, in direction order
 */
class ComputationMap {
private:
  std::vector<DirectionComputation> entries_;

public:
  ComputationMap() = default;
  explicit ComputationMap(std::vector<DirectionComputation> entries) : entries_(std::move(entries)) {}

  [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
  [[nodiscard]] auto operator[](std::size_t i) const -> const DirectionComputation& { return entries_[i]; }
  [[nodiscard]] auto find(std::string_view direction_id) const -> const DirectionComputation*;

  // Moves the collections out once the request moves on to analysis
  [[nodiscard]] auto release() && -> std::vector<DirectionComputation> { return std::move(entries_); }
};

/**
 * @brief Cartesian expansion driver: direction x size x method
 *
 * Every combination is evaluated. f(x) is evaluated once per run and shared by
 * all stencils sampling the unperturbed point.
 */
class ComputationOrchestrator {
public:
  explicit ComputationOrchestrator(FailurePolicy policy = FailurePolicy::FailFast, bool verbose = false) noexcept
      : policy_(policy), verbose_(verbose) {}

  [[nodiscard]] auto run(const core::VectorFunction& function, const core::Point& point,
                         const differences::DirectionSet& directions, std::span<const double> sizes,
                         std::span<const differences::ResolvedMethod> methods) const
      -> std::expected<ComputationMap, core::EvaluationError>;

  [[nodiscard]] auto policy() const noexcept -> FailurePolicy { return policy_; }

private:
  FailurePolicy policy_;
  bool verbose_;
  differences::DifferenceComputer computer_;
};

} // namespace findiff::computation
