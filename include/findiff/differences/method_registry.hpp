#pragma once
#include "../core/exceptions.hpp"
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace findiff::differences {

enum class MethodKind { Forward, Backward, Central, FivePointCentral };

[[nodiscard]] auto method_id(MethodKind kind) noexcept -> std::string_view;

[[nodiscard]] auto parse_method_kind(std::string_view id) -> std::expected<MethodKind, core::ConfigurationError>;

// One sampling point of a stencil: f(x + offset * h * d) weighted by weight
struct StencilPoint {
  double offset;
  double weight;
};

/**
 * @brief Finite-difference stencil
 *
 * The directional derivative estimate is sum_k weight_k * f(x + offset_k * h * d) / h.
 */
struct Stencil {
  std::vector<StencilPoint> points;

  [[nodiscard]] auto uses_base_point() const noexcept -> bool;
};

/**
 * @brief Lookup table from method identifier to stencil
 *
 * Filled once at construction time and shared read-only between requests.
 */
class MethodRegistry {
private:
  std::map<std::string, Stencil, std::less<>> stencils_;

public:
  MethodRegistry() = default;

  // Registry holding forward, backward, central and central5
  [[nodiscard]] static auto with_builtin_methods() -> MethodRegistry;

  // Shared immutable instance of the built-in registry
  [[nodiscard]] static auto builtin() -> std::shared_ptr<const MethodRegistry>;

  [[nodiscard]] auto register_method(std::string id, Stencil stencil) -> std::expected<void, core::ConfigurationError>;

  [[nodiscard]] auto find(std::string_view id) const -> std::expected<const Stencil*, core::ConfigurationError>;

  [[nodiscard]] auto contains(std::string_view id) const -> bool { return stencils_.find(id) != stencils_.end(); }

  [[nodiscard]] auto method_ids() const -> std::vector<std::string>;

  [[nodiscard]] auto size() const noexcept -> std::size_t { return stencils_.size(); }
};

// Method id paired with the stencil it was resolved to
struct ResolvedMethod {
  std::string id;
  Stencil stencil;
};

// Look up every requested id, rejecting unregistered or repeated ones
[[nodiscard]] auto resolve_methods(const MethodRegistry& registry, const std::vector<std::string>& ids)
    -> std::expected<std::vector<ResolvedMethod>, core::ConfigurationError>;

} // namespace findiff::differences
