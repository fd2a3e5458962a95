#pragma once
#include "../computation/result_types.hpp"
#include "../core/containers.hpp"
#include "../differences/direction_set.hpp"
#include <optional>
#include <string>

namespace findiff::success {

// Outcome of evaluating one direction; a failed direction carries no value
struct SuccessOutcome {
  bool success = false;
  std::optional<core::MathVector<double>> value;
};

// Abstract interface for success policies
class SuccessEvaluator {
public:
  virtual ~SuccessEvaluator() = default;

  [[nodiscard]] virtual auto name() const -> std::string = 0;

  // Decide success and accepted value from the pooled raw and derived estimates of one direction
  [[nodiscard]] virtual auto evaluate(const differences::Direction& direction,
                                      const computation::EstimatePool& estimates) const -> SuccessOutcome = 0;
};

} // namespace findiff::success
