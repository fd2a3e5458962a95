#include "findiff/derivative/derivative.hpp"
#include <algorithm>
#include <limits>

namespace findiff::derivative {

auto DirectionalDerivative::pooled_estimates() const -> computation::EstimatePool {
  computation::EstimatePool pool;
  pool.reserve(computer_results.size() + analysis_results.size());
  for (const auto& result : computer_results) {
    pool.push_back(&result);
  }
  for (const auto& result : analysis_results) {
    pool.push_back(&result);
  }
  return pool;
}

auto Derivative::find(std::string_view direction_id) const -> const DirectionalDerivative* {
  auto it = std::ranges::find_if(directions_, [&](const DirectionalDerivative& d) { return d.direction.id == direction_id; });
  return it == directions_.end() ? nullptr : &*it;
}

auto Derivative::success() const noexcept -> bool {
  return std::ranges::all_of(directions_, [](const DirectionalDerivative& d) { return d.success; });
}

auto Derivative::jacobian() const -> core::MathMatrix<double> {
  core::MathMatrix<double> jac(output_dimension_, static_cast<Eigen::Index>(directions_.size()));
  for (std::size_t j = 0; j < directions_.size(); ++j) {
    const auto& d = directions_[j];
    const auto col = static_cast<Eigen::Index>(j);
    if (d.success && d.value && d.value->size() == output_dimension_) {
      jac.col(col) = *d.value;
    } else {
      jac.col(col).setConstant(std::numeric_limits<double>::quiet_NaN());
    }
  }
  return jac;
}

auto Derivative::value() const -> core::MathVector<double> {
  // Column-major storage: direction-major concatenation
  const auto jac = jacobian();
  return Eigen::Map<const core::MathVector<double>>(jac.data(), jac.size());
}

auto Derivative::concise_view() const -> std::vector<ConciseRow> {
  std::vector<ConciseRow> rows;
  rows.reserve(directions_.size());
  for (const auto& d : directions_) {
    rows.push_back(ConciseRow{d.direction.id, d.success, d.value});
  }
  return rows;
}

auto Derivative::full_view() const -> std::vector<FullRow> {
  std::vector<FullRow> rows;
  rows.reserve(directions_.size());
  for (const auto& d : directions_) {
    rows.push_back(FullRow{d.direction.id, d.success, d.value, &d.computer_results, &d.analysis_results, &d.missing});
  }
  return rows;
}

auto assemble(std::vector<DirectionalDerivative> directions) -> Derivative {
  Eigen::Index output_dimension = 0;
  for (const auto& d : directions) {
    if (!d.computer_results.empty()) {
      output_dimension = d.computer_results.front().value.size();
      break;
    }
  }
  if (output_dimension == 0) {
    output_dimension = 1;
  }
  return Derivative(std::move(directions), output_dimension);
}

} // namespace findiff::derivative
