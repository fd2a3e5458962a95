#include "findiff/analysis/analysis_interface.hpp"
#include "findiff/analysis/approximate_central.hpp"
#include "findiff/core/constants.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>

namespace findiff::analysis {

auto run_analyses(const AnalysisList& analyses, std::span<const computation::ComputerResult> results)
    -> std::vector<computation::AnalysisResult> {
  std::vector<computation::AnalysisResult> derived;
  for (const auto& analysis : analyses) {
    auto produced = analysis->derive(results);
    std::ranges::move(produced, std::back_inserter(derived));
  }
  return derived;
}

auto make_analysis(std::string_view id) -> std::expected<std::shared_ptr<const Analysis>, core::ConfigurationError> {
  std::string lowered(id);
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == constants::analysis_ids::approximate_central) {
    return std::make_shared<const ApproximateCentral>();
  }

  return std::unexpected(core::ConfigurationError(
      std::format("Unknown analysis '{}'. Valid options: {}", id, constants::analysis_ids::approximate_central)));
}

} // namespace findiff::analysis
