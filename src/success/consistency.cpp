#include "findiff/success/consistency.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace findiff::success {

namespace {

auto mean_of(const std::vector<const core::MathVector<double>*>& values) -> core::MathVector<double> {
  core::MathVector<double> sum = core::MathVector<double>::Zero(values.front()->size());
  for (const auto* value : values) {
    sum += *value;
  }
  return sum / static_cast<double>(values.size());
}

} // namespace

auto Consistency::create(double rtol, double atol, GroupingKey key)
    -> std::expected<Consistency, core::ConfigurationError> {
  if (!std::isfinite(rtol) || rtol < 0.0) {
    return std::unexpected(core::ValidationError("rtol", std::format("must be finite and non-negative, got {}", rtol)));
  }
  if (!std::isfinite(atol) || atol < 0.0) {
    return std::unexpected(core::ValidationError("atol", std::format("must be finite and non-negative, got {}", atol)));
  }
  return Consistency(rtol, atol, key);
}

auto Consistency::is_close(const core::MathVector<double>& a, const core::MathVector<double>& b) const -> bool {
  if (a.size() != b.size()) {
    return false;
  }
  for (Eigen::Index i = 0; i < a.size(); ++i) {
    const double tolerance = atol_ + rtol_ * std::max(std::abs(a(i)), std::abs(b(i)));
    // Written so that NaN fails the comparison
    if (!(std::abs(a(i) - b(i)) <= tolerance)) {
      return false;
    }
  }
  return true;
}

auto Consistency::all_pairs_close(const std::vector<const core::MathVector<double>*>& values) const -> bool {
  if (values.size() == 1) {
    return values.front()->allFinite();
  }
  for (std::size_t i = 0; i < values.size(); ++i) {
    for (std::size_t j = i + 1; j < values.size(); ++j) {
      if (!is_close(*values[i], *values[j])) {
        return false;
      }
    }
  }
  return true;
}

auto Consistency::group_key(const computation::Estimate& estimate) const -> std::string {
  switch (key_) {
  case GroupingKey::Size:
    return std::format("{}", estimate.metadata.size);
  case GroupingKey::Id:
    return estimate.id;
  case GroupingKey::None:
    return "all";
  }
  return "all";
}

auto Consistency::summarize_groups(const computation::EstimatePool& estimates) const -> std::vector<GroupSummary> {
  // Groups in first-appearance order
  std::vector<std::string> keys;
  std::vector<std::vector<const core::MathVector<double>*>> members;
  for (const auto* estimate : estimates) {
    auto key = group_key(*estimate);
    auto it = std::ranges::find(keys, key);
    if (it == keys.end()) {
      keys.push_back(std::move(key));
      members.push_back({&estimate->value});
    } else {
      members[static_cast<std::size_t>(it - keys.begin())].push_back(&estimate->value);
    }
  }

  std::vector<GroupSummary> summaries;
  summaries.reserve(keys.size());
  for (std::size_t g = 0; g < keys.size(); ++g) {
    GroupSummary summary;
    summary.key = keys[g];
    summary.members = members[g].size();
    summary.consistent = all_pairs_close(members[g]);
    if (summary.consistent) {
      summary.representative = mean_of(members[g]);
    }
    summaries.push_back(std::move(summary));
  }
  return summaries;
}

auto Consistency::evaluate(const differences::Direction& /*direction*/,
                           const computation::EstimatePool& estimates) const -> SuccessOutcome {
  const auto groups = summarize_groups(estimates);

  std::vector<const core::MathVector<double>*> representatives;
  for (const auto& group : groups) {
    if (group.consistent) {
      representatives.push_back(&group.representative);
    }
  }

  if (representatives.empty() || !all_pairs_close(representatives)) {
    return SuccessOutcome{false, std::nullopt};
  }
  return SuccessOutcome{true, mean_of(representatives)};
}

} // namespace findiff::success
