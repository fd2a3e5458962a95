#include "test_helpers.hpp"
#include <findiff/differences/difference_computer.hpp>
#include <stdexcept>
#include <string>

using namespace findiff;

int main() {
  const auto registry = differences::MethodRegistry::with_builtin_methods();
  const differences::DifferenceComputer computer;

  // Linear function: forward, backward and central are exact for any step size.
  // Dyadic sizes and integer coefficients keep the arithmetic exact.
  Eigen::Vector3d gradient(3.0, -2.0, 5.0);
  core::VectorFunction linear = [&](const core::MathVector<double>& x) {
    core::MathVector<double> out(1);
    out(0) = gradient.dot(x) + 7.0;
    return out;
  };
  const core::Point point = Eigen::Vector3d(1.0, 2.0, -4.0);
  const core::Point point_copy = point;

  auto basis = differences::DirectionSet::standard_basis(3);
  test::expect(basis.has_value(), "standard basis resolves");
  if (!basis) {
    return test::finish();
  }

  for (const auto& id : {"forward", "backward", "central"}) {
    auto stencil = registry.find(id);
    const differences::ResolvedMethod method{id, *stencil.value()};
    for (double size : {0.5, 0.0625, 0x1p-20}) {
      for (const auto& direction : *basis) {
        auto result = computer.compute(linear, point, direction, size, method);
        test::expect(result.has_value(), "linear estimate computed");
        if (!result) {
          continue;
        }
        const auto index = static_cast<Eigen::Index>(std::stoi(direction.id));
        test::expect(result->value(0) == gradient(index), "linear estimate is exact");
        test::expect(result->method_id() == id, "result tagged with method");
        test::expect(result->metadata.size == size, "result tagged with size");
      }
    }
  }
  test::expect(point == point_copy, "point is not modified");

  // The five-point weights are not dyadic, so only rounding error remains.
  const differences::ResolvedMethod five_point{"central5", *registry.find("central5").value()};
  for (const auto& direction : *basis) {
    auto result = computer.compute(linear, point, direction, 0.0625, five_point);
    const auto index = static_cast<Eigen::Index>(std::stoi(direction.id));
    test::expect(result && test::near(result->value(0), gradient(index), 1e-12), "five-point linear estimate");
  }

  // Forward and backward follow their stencils on a quadratic.
  core::VectorFunction square = [](const core::MathVector<double>& x) {
    core::MathVector<double> out(1);
    out(0) = x(0) * x(0);
    return out;
  };
  const core::Point one = core::MathVector<double>::Constant(1, 1.0);
  const differences::Direction e0{"x", core::MathVector<double>::Constant(1, 1.0)};
  auto forward = computer.compute(square, one, e0, 0.5, {"forward", *registry.find("forward").value()});
  auto backward = computer.compute(square, one, e0, 0.5, {"backward", *registry.find("backward").value()});
  test::expect(forward && forward->value(0) == 2.5, "forward on x^2 is 2 + h");
  test::expect(backward && backward->value(0) == 1.5, "backward on x^2 is 2 - h");

  // A non-unit direction scales the estimate.
  const differences::Direction twice{"2x", core::MathVector<double>::Constant(1, 2.0)};
  auto scaled = computer.compute(square, one, twice, 0.25, {"central", *registry.find("central").value()});
  test::expect(scaled && scaled->value(0) == 4.0, "direction magnitude scales the estimate");

  // The cached base value replaces the f(x) evaluation.
  int calls = 0;
  core::VectorFunction counting = [&](const core::MathVector<double>& x) {
    ++calls;
    return square(x);
  };
  const core::MathVector<double> base = square(one);
  auto cached = computer.compute(counting, one, e0, 0.5, {"forward", *registry.find("forward").value()}, &base);
  test::expect(cached.has_value() && calls == 1, "cached f(x) saves one call");

  // Exceptions from the function become evaluation errors.
  core::VectorFunction throwing = [](const core::MathVector<double>& x) -> core::MathVector<double> {
    if (x(0) > 1.0) {
      throw std::domain_error("outside the domain");
    }
    return x;
  };
  auto failed = computer.compute(throwing, one, e0, 0.5, {"forward", *registry.find("forward").value()});
  test::expect(!failed.has_value(), "throwing function fails the estimate");
  if (!failed) {
    test::expect(failed.error().message().find("outside the domain") != std::string::npos, "cause is kept");
  }

  // Output dimension changing between points is malformed.
  core::VectorFunction ragged = [](const core::MathVector<double>& x) {
    return core::MathVector<double>::Zero(x(0) > 1.0 ? 2 : 1).eval();
  };
  const core::MathVector<double> ragged_base = ragged(one);
  auto malformed = computer.compute(ragged, one, e0, 0.5, {"forward", *registry.find("forward").value()}, &ragged_base);
  test::expect(!malformed.has_value(), "dimension mismatch is an evaluation error");

  const differences::ResolvedMethod central{"central", *registry.find("central").value()};
  auto pinned = computer.compute(square, one, e0, 0.5, central, nullptr, 3);
  test::expect(!pinned.has_value(), "output must match the pinned dimension");
  test::expect(computer.compute(square, one, e0, 0.5, central, nullptr, 1).has_value(), "matching dimension accepted");

  // Values thrown that are not std::exception are reported too.
  core::VectorFunction throws_int = [](const core::MathVector<double>&) -> core::MathVector<double> { throw 42; };
  auto unknown = computer.compute(throws_int, one, e0, 0.5, central);
  test::expect(!unknown.has_value(), "non-standard exception fails the estimate");
  if (!unknown) {
    test::expect(unknown.error().message().find("unknown exception") != std::string::npos, "unknown cause reported");
  }

  core::VectorFunction empty = [](const core::MathVector<double>&) { return core::MathVector<double>(); };
  test::expect(!computer.evaluate_base(empty, one).has_value(), "empty output is an evaluation error");

  return test::finish();
}
