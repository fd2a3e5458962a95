#pragma once
#include "../computation/result_types.hpp"
#include "../core/exceptions.hpp"
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace findiff::analysis {

// Abstract interface for secondary estimators
class Analysis {
public:
  virtual ~Analysis() = default;

  // Identifier carried by every result this analysis emits
  [[nodiscard]] virtual auto id() const -> std::string = 0;

  // Derive zero or more estimates from the raw results of one direction
  [[nodiscard]] virtual auto derive(std::span<const computation::ComputerResult> results) const
      -> std::vector<computation::AnalysisResult> = 0;
};

using AnalysisList = std::vector<std::shared_ptr<const Analysis>>;

// Apply each analysis in order and concatenate their outputs
[[nodiscard]] auto run_analyses(const AnalysisList& analyses, std::span<const computation::ComputerResult> results)
    -> std::vector<computation::AnalysisResult>;

// Factory for analyses named in configuration files
[[nodiscard]] auto make_analysis(std::string_view id) -> std::expected<std::shared_ptr<const Analysis>, core::ConfigurationError>;

} // namespace findiff::analysis
