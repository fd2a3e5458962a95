#include "test_helpers.hpp"
#include <findiff/computation/computation_orchestrator.hpp>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace findiff;

namespace {

auto resolve(const std::vector<std::string>& ids) -> std::vector<differences::ResolvedMethod> {
  return differences::resolve_methods(*differences::MethodRegistry::builtin(), ids).value();
}

} // namespace

int main() {
  int calls = 0;
  core::VectorFunction quadratic = [&](const core::MathVector<double>& x) {
    ++calls;
    core::MathVector<double> out(1);
    out(0) = x.squaredNorm();
    return out;
  };

  const core::Point point = Eigen::Vector2d(1.0, -1.0);
  const auto directions = differences::DirectionSet::standard_basis(2).value();
  const std::vector<double> sizes{0.5, 0.25};
  const auto methods = resolve({"forward", "backward"});

  // Every combination is evaluated, ordered size then method within each direction.
  const computation::ComputationOrchestrator orchestrator;
  test::expect(orchestrator.policy() == computation::FailurePolicy::FailFast, "fail-fast by default");
  auto computed = orchestrator.run(quadratic, point, directions, sizes, methods);
  test::expect(computed.has_value(), "fail-fast run succeeds");
  if (computed) {
    test::expect(computed->size() == 2, "one entry per direction");
    const auto& first = (*computed)[0];
    test::expect(first.direction_id == "0", "entries follow direction order");
    test::expect(first.results.size() == 4, "sizes x methods results");
    test::expect(first.results[0].method_id() == "forward" && first.results[0].metadata.size == 0.5, "order 0");
    test::expect(first.results[1].method_id() == "backward" && first.results[1].metadata.size == 0.5, "order 1");
    test::expect(first.results[2].method_id() == "forward" && first.results[2].metadata.size == 0.25, "order 2");
    test::expect(first.results[3].method_id() == "backward" && first.results[3].metadata.size == 0.25, "order 3");
    test::expect(first.results[0].value(0) == 2.5, "forward on x0^2 at 1 with h=0.5");
    test::expect(first.missing.empty(), "nothing missing");
    test::expect(computed->find("1") != nullptr && computed->find("z") == nullptr, "lookup by direction id");
  }
  // f(x) once, plus one perturbed point per combination
  test::expect(calls == 1 + 2 * 2 * 2, "f(x) is evaluated once per run");

  // Fail-fast: one failing point aborts the request.
  core::VectorFunction fragile = [](const core::MathVector<double>& x) -> core::MathVector<double> {
    if (x(1) < -1.3) {
      throw std::runtime_error("negative branch");
    }
    core::MathVector<double> out(1);
    out(0) = x.sum();
    return out;
  };
  auto aborted = orchestrator.run(fragile, point, directions, sizes, methods);
  test::expect(!aborted.has_value(), "fail-fast propagates the evaluation error");

  // Partial mode: the failing combination is recorded and the rest continues.
  const computation::ComputationOrchestrator partial(computation::FailurePolicy::Partial);
  test::expect(partial.policy() == computation::FailurePolicy::Partial, "partial policy kept");
  auto salvaged = partial.run(fragile, point, directions, sizes, methods);
  test::expect(salvaged.has_value(), "partial run succeeds");
  if (salvaged) {
    test::expect((*salvaged)[0].results.size() == 4, "direction 0 untouched");
    const auto& second = (*salvaged)[1];
    test::expect(second.results.size() == 3, "one combination skipped");
    test::expect(second.missing.size() == 1, "one combination recorded missing");
    if (second.missing.size() == 1) {
      test::expect(second.missing[0].method_id == "backward" && second.missing[0].size == 0.5, "missing combination");
      test::expect(second.missing[0].reason.find("negative branch") != std::string::npos, "reason recorded");
    }
  }

  // Partial mode with a failing base point: stencils without f(x) still run.
  core::VectorFunction no_base = [&](const core::MathVector<double>& x) -> core::MathVector<double> {
    if (x == point) {
      throw std::runtime_error("singular at the base point");
    }
    core::MathVector<double> out(1);
    out(0) = x(0);
    return out;
  };
  auto mixed = partial.run(no_base, point, directions, sizes, resolve({"forward", "central"}));
  test::expect(mixed.has_value(), "partial run with failing base succeeds");
  if (mixed) {
    test::expect((*mixed)[0].results.size() == 2, "central results kept");
    test::expect((*mixed)[0].missing.size() == 2, "forward results missing");
    test::expect((*mixed)[0].results[0].method_id() == "central", "only central computed");
  }
  test::expect(!orchestrator.run(no_base, point, directions, sizes, resolve({"forward"})).has_value(),
               "fail-fast with failing base aborts");

  // Verbose partial runs log every skipped combination, base-point failures included.
  std::ostringstream log;
  auto* previous = std::cout.rdbuf(log.rdbuf());
  const computation::ComputationOrchestrator verbose_partial(computation::FailurePolicy::Partial, true);
  auto logged = verbose_partial.run(no_base, point, directions, sizes, resolve({"forward"}));
  std::cout.rdbuf(previous);
  test::expect(logged && (*logged)[0].missing.size() == 2, "base failure marks forward missing");
  std::size_t skip_lines = 0;
  for (auto at = log.str().find("[COMPUTATION] Skipping"); at != std::string::npos;
       at = log.str().find("[COMPUTATION] Skipping", at + 1)) {
    ++skip_lines;
  }
  test::expect(skip_lines == 4, "one log line per skipped combination");
  test::expect(log.str().find("singular at the base point") != std::string::npos, "base failure reason logged");

  // Output dimension must agree across directions even when f(x) is never sampled.
  core::VectorFunction ragged = [](const core::MathVector<double>& x) -> core::MathVector<double> {
    return core::MathVector<double>::Ones(x(1) != 1.0 ? 2 : 1);
  };
  const core::Point ones = Eigen::Vector2d(1.0, 1.0);
  const std::vector<double> one_size{1e-3};
  auto mismatched = orchestrator.run(ragged, ones, directions, one_size, resolve({"central"}));
  test::expect(!mismatched.has_value(), "dimension change across directions is an evaluation error");
  if (!mismatched) {
    test::expect(mismatched.error().full_message().find("direction '1'") != std::string::npos,
                 "failing direction named in the context");
  }
  auto ragged_partial = partial.run(ragged, ones, directions, one_size, resolve({"central"}));
  test::expect(ragged_partial.has_value(), "partial run with ragged output succeeds");
  if (ragged_partial) {
    test::expect((*ragged_partial)[0].results.size() == 1, "first direction pins the dimension");
    test::expect((*ragged_partial)[1].results.empty() && (*ragged_partial)[1].missing.size() == 1,
                 "mismatched direction recorded missing");
  }

  return test::finish();
}
