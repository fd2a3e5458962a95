#pragma once
#include "analysis_interface.hpp"

namespace findiff::analysis {

/**
 * @brief Central-difference estimate synthesized from forward and backward results
 *
 * For every size that has both a forward and a backward result, emits their
 * arithmetic mean tagged with that size. Sizes missing either method emit nothing.
 */
class ApproximateCentral final : public Analysis {
public:
  [[nodiscard]] auto id() const -> std::string override;

  [[nodiscard]] auto derive(std::span<const computation::ComputerResult> results) const
      -> std::vector<computation::AnalysisResult> override;
};

} // namespace findiff::analysis
