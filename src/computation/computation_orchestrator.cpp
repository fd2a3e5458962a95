#include "findiff/computation/computation_orchestrator.hpp"
#include <algorithm>
#include <format>
#include <iostream>
#include <optional>

namespace findiff::computation {

auto ComputationMap::find(std::string_view direction_id) const -> const DirectionComputation* {
  auto it = std::ranges::find(entries_, direction_id, &DirectionComputation::direction_id);
  return it == entries_.end() ? nullptr : &*it;
}

auto ComputationOrchestrator::run(const core::VectorFunction& function, const core::Point& point,
                                  const differences::DirectionSet& directions, std::span<const double> sizes,
                                  std::span<const differences::ResolvedMethod> methods) const
    -> std::expected<ComputationMap, core::EvaluationError> {

  const bool needs_base = std::ranges::any_of(
      methods, [](const differences::ResolvedMethod& m) { return m.stencil.uses_base_point(); });

  // f(x) is size and direction invariant: evaluate it once
  std::optional<core::MathVector<double>> base_value;
  std::optional<core::EvaluationError> base_error;
  if (needs_base) {
    auto base = computer_.evaluate_base(function, point);
    if (base) {
      base_value = std::move(base.value());
    } else if (policy_ == FailurePolicy::FailFast) {
      auto error = std::move(base.error());
      error.add_context("base point");
      return std::unexpected(std::move(error));
    } else {
      base_error = base.error();
    }
  }

  // Pinned by the first evaluation; every later one must match it
  Eigen::Index output_dimension = base_value ? base_value->size() : 0;

  std::vector<DirectionComputation> entries;
  entries.reserve(directions.size());

  for (const auto& direction : directions) {
    DirectionComputation entry;
    entry.direction_id = direction.id;
    entry.results.reserve(sizes.size() * methods.size());

    for (double size : sizes) {
      for (const auto& method : methods) {
        if (base_error && method.stencil.uses_base_point()) {
          if (verbose_) {
            std::cout << std::format("[COMPUTATION] Skipping direction '{}', size {}, method '{}': {}", direction.id,
                                     size, method.id, base_error->message())
                      << std::endl;
          }
          entry.missing.push_back(MissingComputation{size, method.id, base_error->message()});
          continue;
        }

        auto result = computer_.compute(function, point, direction, size, method,
                                        base_value ? &*base_value : nullptr, output_dimension);
        if (!result) {
          if (policy_ == FailurePolicy::FailFast) {
            auto error = std::move(result.error());
            error.add_context(std::format("direction '{}'", direction.id));
            return std::unexpected(std::move(error));
          }
          if (verbose_) {
            std::cout << std::format("[COMPUTATION] Skipping direction '{}', size {}, method '{}': {}", direction.id,
                                     size, method.id, result.error().message())
                      << std::endl;
          }
          entry.missing.push_back(MissingComputation{size, method.id, result.error().message()});
          continue;
        }
        if (output_dimension == 0) {
          output_dimension = result->value.size();
        }
        entry.results.push_back(std::move(result.value()));
      }
    }

    entries.push_back(std::move(entry));
  }

  return ComputationMap(std::move(entries));
}

} // namespace findiff::computation
