#pragma once

#include <string_view>

namespace findiff::constants {

// ================================================================================================
// CONSISTENCY TOLERANCES
// ================================================================================================

namespace tolerance {
/// Default relative tolerance between two estimates
inline constexpr double default_rtol = 1e-5;

/// Default absolute tolerance between two estimates
inline constexpr double default_atol = 1e-8;
}  // namespace tolerance

// ================================================================================================
// METHOD AND ANALYSIS IDENTIFIERS
// ================================================================================================

namespace method_ids {
inline constexpr std::string_view forward = "forward";
inline constexpr std::string_view backward = "backward";
inline constexpr std::string_view central = "central";
inline constexpr std::string_view five_point_central = "central5";
}  // namespace method_ids

namespace analysis_ids {
inline constexpr std::string_view approximate_central = "approximate_central";
}  // namespace analysis_ids

// ================================================================================================
// FIVE-POINT CENTRAL STENCIL O(h^4)
// ================================================================================================

namespace five_point {
inline constexpr double outer_weight = 1.0 / 12.0;
inline constexpr double inner_weight = 8.0 / 12.0;
}  // namespace five_point

// ================================================================================================
// ENVIRONMENT
// ================================================================================================

namespace environment {
/// Setting this variable turns on verbose logging for every request
inline constexpr const char* verbose_variable = "FINDIFF_VERBOSE";
}  // namespace environment

} // namespace findiff::constants
