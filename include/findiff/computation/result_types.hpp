#pragma once
#include "../core/containers.hpp"
#include <string>
#include <vector>

namespace findiff::computation {

// Parameters a result was generated with
struct ResultMetadata {
  double size = 0.0;
};

// One estimate of the directional derivative (length = output dimension of the function)
struct Estimate {
  std::string id;                 // Method id for raw results, analysis id for derived ones
  core::MathVector<double> value;
  ResultMetadata metadata;
};

// Raw finite-difference estimate produced by the DifferenceComputer
struct ComputerResult : Estimate {
  [[nodiscard]] auto method_id() const noexcept -> const std::string& { return id; }
};

// Secondary estimate produced by an analysis
struct AnalysisResult : Estimate {
  [[nodiscard]] auto analysis_id() const noexcept -> const std::string& { return id; }
};

// Combination skipped in partial-results mode
struct MissingComputation {
  double size;
  std::string method_id;
  std::string reason;
};

// Non-owning view over the estimates of one direction
using EstimatePool = std::vector<const Estimate*>;

} // namespace findiff::computation
