#pragma once
#include "../core/containers.hpp"
#include "../core/exceptions.hpp"
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace findiff::differences {

struct Direction {
  std::string id;
  core::MathVector<double> vector;
};

/**
 * @brief Resolves the vectors along which the derivative is probed
 *
 * Without explicit directions the set is the standard basis e_0..e_{n-1},
 * identified by their index ("0", "1", ...).
 */
class DirectionSet {
private:
  std::vector<Direction> directions_;

  explicit DirectionSet(std::vector<Direction> directions) : directions_(std::move(directions)) {}

public:
  [[nodiscard]] static auto standard_basis(std::size_t dimension) -> std::expected<DirectionSet, core::ConfigurationError>;

  [[nodiscard]] static auto from_directions(std::vector<Direction> directions, std::size_t dimension)
      -> std::expected<DirectionSet, core::ConfigurationError>;

  // Explicit directions when given, standard basis otherwise
  [[nodiscard]] static auto resolve(const std::optional<std::vector<Direction>>& directions, std::size_t dimension)
      -> std::expected<DirectionSet, core::ConfigurationError>;

  [[nodiscard]] auto size() const noexcept -> std::size_t { return directions_.size(); }
  [[nodiscard]] auto empty() const noexcept -> bool { return directions_.empty(); }
  [[nodiscard]] auto operator[](std::size_t i) const -> const Direction& { return directions_[i]; }
  [[nodiscard]] auto directions() const noexcept -> const std::vector<Direction>& { return directions_; }

  [[nodiscard]] auto begin() const noexcept { return directions_.begin(); }
  [[nodiscard]] auto end() const noexcept { return directions_.end(); }
};

} // namespace findiff::differences
