#include "findiff/differences/direction_set.hpp"
#include <cmath>
#include <format>
#include <unordered_set>

namespace findiff::differences {

auto DirectionSet::standard_basis(std::size_t dimension) -> std::expected<DirectionSet, core::ConfigurationError> {
  if (dimension == 0) {
    return std::unexpected(core::ConfigurationError("Cannot build a standard basis for a zero-dimensional point"));
  }

  std::vector<Direction> basis;
  basis.reserve(dimension);
  for (std::size_t i = 0; i < dimension; ++i) {
    core::MathVector<double> e = core::MathVector<double>::Zero(static_cast<Eigen::Index>(dimension));
    e(static_cast<Eigen::Index>(i)) = 1.0;
    basis.push_back(Direction{std::to_string(i), std::move(e)});
  }
  return DirectionSet(std::move(basis));
}

auto DirectionSet::from_directions(std::vector<Direction> directions, std::size_t dimension)
    -> std::expected<DirectionSet, core::ConfigurationError> {
  if (directions.empty()) {
    return std::unexpected(core::ValidationError("directions", "at least one direction is required"));
  }

  std::unordered_set<std::string> seen_ids;
  for (const auto& direction : directions) {
    if (direction.id.empty()) {
      return std::unexpected(core::ValidationError("directions", "direction identifiers must not be empty"));
    }
    if (!seen_ids.insert(direction.id).second) {
      return std::unexpected(
          core::ValidationError("directions", std::format("duplicate direction identifier '{}'", direction.id)));
    }
    if (static_cast<std::size_t>(direction.vector.size()) != dimension) {
      return std::unexpected(core::ValidationError(
          "directions", std::format("direction '{}' has dimension {} but the point has dimension {}", direction.id,
                                    direction.vector.size(), dimension)));
    }
    if (!direction.vector.allFinite()) {
      return std::unexpected(
          core::ValidationError("directions", std::format("direction '{}' has non-finite components", direction.id)));
    }
  }

  return DirectionSet(std::move(directions));
}

auto DirectionSet::resolve(const std::optional<std::vector<Direction>>& directions, std::size_t dimension)
    -> std::expected<DirectionSet, core::ConfigurationError> {
  if (directions) {
    return from_directions(*directions, dimension);
  }
  return standard_basis(dimension);
}

} // namespace findiff::differences
