#include "findiff/differences/method_registry.hpp"
#include "findiff/core/constants.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <ranges>

namespace findiff::differences {

namespace {

namespace ids = constants::method_ids;

auto builtin_stencil(MethodKind kind) -> Stencil {
  switch (kind) {
  case MethodKind::Forward:
    return Stencil{{{1.0, 1.0}, {0.0, -1.0}}};
  case MethodKind::Backward:
    return Stencil{{{0.0, 1.0}, {-1.0, -1.0}}};
  case MethodKind::Central:
    return Stencil{{{1.0, 0.5}, {-1.0, -0.5}}};
  case MethodKind::FivePointCentral:
    return Stencil{{{-2.0, constants::five_point::outer_weight},
                    {-1.0, -constants::five_point::inner_weight},
                    {1.0, constants::five_point::inner_weight},
                    {2.0, -constants::five_point::outer_weight}}};
  }
  return Stencil{};
}

} // namespace

auto method_id(MethodKind kind) noexcept -> std::string_view {
  switch (kind) {
  case MethodKind::Forward:
    return ids::forward;
  case MethodKind::Backward:
    return ids::backward;
  case MethodKind::Central:
    return ids::central;
  case MethodKind::FivePointCentral:
    return ids::five_point_central;
  }
  return "unknown";
}

auto parse_method_kind(std::string_view id) -> std::expected<MethodKind, core::ConfigurationError> {
  std::string lowered(id);
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  for (auto kind : {MethodKind::Forward, MethodKind::Backward, MethodKind::Central, MethodKind::FivePointCentral}) {
    if (method_id(kind) == lowered) {
      return kind;
    }
  }
  return std::unexpected(core::ConfigurationError(std::format(
      "Unknown method kind '{}'. Valid options: {}, {}, {}, {}", id, ids::forward, ids::backward, ids::central,
      ids::five_point_central)));
}

auto Stencil::uses_base_point() const noexcept -> bool {
  return std::ranges::any_of(points, [](const StencilPoint& p) { return p.offset == 0.0; });
}

auto MethodRegistry::with_builtin_methods() -> MethodRegistry {
  MethodRegistry registry;
  for (auto kind : {MethodKind::Forward, MethodKind::Backward, MethodKind::Central, MethodKind::FivePointCentral}) {
    registry.stencils_.emplace(std::string(method_id(kind)), builtin_stencil(kind));
  }
  return registry;
}

auto MethodRegistry::builtin() -> std::shared_ptr<const MethodRegistry> {
  static const auto instance = std::make_shared<const MethodRegistry>(with_builtin_methods());
  return instance;
}

auto MethodRegistry::register_method(std::string id, Stencil stencil) -> std::expected<void, core::ConfigurationError> {
  if (id.empty()) {
    return std::unexpected(core::ConfigurationError("Method identifier must not be empty"));
  }
  if (stencil.points.empty()) {
    return std::unexpected(core::ConfigurationError(std::format("Stencil for method '{}' has no points", id)));
  }
  for (const auto& point : stencil.points) {
    if (!std::isfinite(point.offset) || !std::isfinite(point.weight)) {
      return std::unexpected(
          core::ConfigurationError(std::format("Stencil for method '{}' has non-finite offsets or weights", id)));
    }
  }
  if (contains(id)) {
    return std::unexpected(core::ConfigurationError(std::format("Method '{}' is already registered", id)));
  }

  stencils_.emplace(std::move(id), std::move(stencil));
  return {};
}

auto MethodRegistry::find(std::string_view id) const -> std::expected<const Stencil*, core::ConfigurationError> {
  auto it = stencils_.find(id);
  if (it == stencils_.end()) {
    std::string valid_options;
    for (const auto& [option, _] : stencils_) {
      valid_options += option + ", ";
    }
    if (!valid_options.empty()) {
      valid_options = valid_options.substr(0, valid_options.length() - 2);
    }
    return std::unexpected(core::ConfigurationError(
        std::format("Method '{}' is not registered. Valid options: {}", id, valid_options)));
  }
  return &it->second;
}

auto MethodRegistry::method_ids() const -> std::vector<std::string> {
  std::vector<std::string> ids;
  ids.reserve(stencils_.size());
  for (const auto& id : stencils_ | std::views::keys) {
    ids.push_back(id);
  }
  return ids;
}

auto resolve_methods(const MethodRegistry& registry, const std::vector<std::string>& ids)
    -> std::expected<std::vector<ResolvedMethod>, core::ConfigurationError> {
  if (ids.empty()) {
    return std::unexpected(core::ValidationError("methods", "at least one method is required"));
  }

  std::vector<ResolvedMethod> resolved;
  resolved.reserve(ids.size());
  for (const auto& id : ids) {
    if (std::ranges::any_of(resolved, [&](const ResolvedMethod& m) { return m.id == id; })) {
      return std::unexpected(core::ValidationError("methods", std::format("method '{}' is requested twice", id)));
    }
    auto stencil = registry.find(id);
    if (!stencil) {
      return std::unexpected(stencil.error());
    }
    resolved.push_back(ResolvedMethod{id, *stencil.value()});
  }
  return resolved;
}

} // namespace findiff::differences
