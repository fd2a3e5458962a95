#pragma once
#include "../computation/computation_orchestrator.hpp"
#include "../core/constants.hpp"
#include "../success/consistency.hpp"
#include <optional>
#include <string>
#include <vector>

namespace findiff::io {

struct DirectionConfig {
  std::string id;
  std::vector<double> vector;
};

struct SuccessConfig {
  enum class Policy { Consistency };
  Policy policy = Policy::Consistency;
  double rtol = constants::tolerance::default_rtol;
  double atol = constants::tolerance::default_atol;
  success::GroupingKey group_by = success::GroupingKey::Size;
};

struct DerivativeConfig {
  std::vector<double> sizes;
  std::vector<std::string> methods;
  std::optional<std::vector<DirectionConfig>> directions; // Standard basis when absent
  std::vector<std::string> analyses;
  SuccessConfig success{};
  computation::FailurePolicy failure_policy = computation::FailurePolicy::FailFast;
};

struct Configuration {
  DerivativeConfig derivative;
  bool verbose = false;
};

} // namespace findiff::io
