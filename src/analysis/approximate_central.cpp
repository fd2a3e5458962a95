#include "findiff/analysis/approximate_central.hpp"
#include "findiff/core/constants.hpp"
#include <algorithm>

namespace findiff::analysis {

auto ApproximateCentral::id() const -> std::string { return std::string(constants::analysis_ids::approximate_central); }

auto ApproximateCentral::derive(std::span<const computation::ComputerResult> results) const
    -> std::vector<computation::AnalysisResult> {

  // Sizes in first-appearance order
  std::vector<double> sizes;
  for (const auto& result : results) {
    if (std::ranges::find(sizes, result.metadata.size) == sizes.end()) {
      sizes.push_back(result.metadata.size);
    }
  }

  std::vector<computation::AnalysisResult> derived;
  for (double size : sizes) {
    const computation::ComputerResult* forward = nullptr;
    const computation::ComputerResult* backward = nullptr;

    for (const auto& result : results) {
      if (result.metadata.size != size) {
        continue;
      }
      if (!forward && result.method_id() == constants::method_ids::forward) {
        forward = &result;
      } else if (!backward && result.method_id() == constants::method_ids::backward) {
        backward = &result;
      }
    }

    if (!forward || !backward || forward->value.size() != backward->value.size()) {
      continue;
    }

    computation::AnalysisResult central;
    central.id = id();
    central.value = 0.5 * (forward->value + backward->value);
    central.metadata.size = size;
    derived.push_back(std::move(central));
  }

  return derived;
}

} // namespace findiff::analysis
