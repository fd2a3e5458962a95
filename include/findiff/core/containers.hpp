#pragma once
#include <Eigen/Dense>
#include <functional>

namespace findiff::core {

template <typename Scalar = double>
using MathVector = Eigen::Vector<Scalar, Eigen::Dynamic>;

template <typename Scalar = double>
using MathMatrix = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;

using Point = MathVector<double>;

// Target function: point -> value of output dimension m >= 1
using VectorFunction = std::function<MathVector<double>(const MathVector<double>&)>;

using ScalarFunction = std::function<double(const MathVector<double>&)>;

// Wrap a scalar function so it yields a one-component vector
[[nodiscard]] inline auto as_vector_function(ScalarFunction f) -> VectorFunction {
  return [f = std::move(f)](const MathVector<double>& x) -> MathVector<double> {
    MathVector<double> out(1);
    out(0) = f(x);
    return out;
  };
}

} // namespace findiff::core
