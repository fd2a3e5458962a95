#pragma once
#include "../core/constants.hpp"
#include "../core/exceptions.hpp"
#include "success_evaluator.hpp"
#include <expected>
#include <string>
#include <vector>

namespace findiff::success {

enum class GroupingKey {
  Size, // One group per step size
  Id,   // One group per method or analysis id
  None  // Every estimate in a single group
};

// Per-group diagnostics
struct GroupSummary {
  std::string key;
  std::size_t members = 0;
  bool consistent = false;
  core::MathVector<double> representative; // Mean of members, empty when inconsistent
};

/**
 * @brief Tolerance-based cross validation of estimates
 *
 * Two values a and b agree when, for every component,
 *   |a - b| <= atol + rtol * max(|a|, |b|)
 * Non-finite components never agree.
 *
 * Estimates are partitioned by the grouping key. A group is consistent when all
 * pairs of its members agree; its representative is the mean of its members.
 * Inconsistent groups are discarded. The direction succeeds when at least one
 * consistent group remains and all representatives agree pairwise; the accepted
 * value is then the mean of the representatives.
 */
class Consistency final : public SuccessEvaluator {
private:
  double rtol_;
  double atol_;
  GroupingKey key_;

  [[nodiscard]] auto group_key(const computation::Estimate& estimate) const -> std::string;

  [[nodiscard]] auto all_pairs_close(const std::vector<const core::MathVector<double>*>& values) const -> bool;

public:
  explicit Consistency(double rtol = constants::tolerance::default_rtol,
                       double atol = constants::tolerance::default_atol, GroupingKey key = GroupingKey::Size) noexcept
      : rtol_(rtol), atol_(atol), key_(key) {}

  // Validating constructor: tolerances must be finite and non-negative
  [[nodiscard]] static auto create(double rtol, double atol, GroupingKey key = GroupingKey::Size)
      -> std::expected<Consistency, core::ConfigurationError>;

  [[nodiscard]] auto name() const -> std::string override { return "consistency"; }

  [[nodiscard]] auto evaluate(const differences::Direction& direction,
                              const computation::EstimatePool& estimates) const -> SuccessOutcome override;

  [[nodiscard]] auto summarize_groups(const computation::EstimatePool& estimates) const -> std::vector<GroupSummary>;

  [[nodiscard]] auto is_close(const core::MathVector<double>& a, const core::MathVector<double>& b) const -> bool;

  [[nodiscard]] auto rtol() const noexcept -> double { return rtol_; }
  [[nodiscard]] auto atol() const noexcept -> double { return atol_; }
  [[nodiscard]] auto grouping_key() const noexcept -> GroupingKey { return key_; }
};

} // namespace findiff::success
