#include "gauss_newton_regression/gauss_newton_regression.hpp"
#include "gauss_newton_regression/linear_solver.hpp"
#include "gauss_newton_regression/regression_error.hpp"

#include <ros/console.h>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace gauss_newton_regression {

GaussNewtonRegression::GaussNewtonRegression(const Model& model) : model_(model) {}

void GaussNewtonRegression::checkSamples(const std::vector<double>& x, const std::vector<double>& y,
                                         const std::vector<double>& coefficients) const {
  if (x.size() != y.size()) {
    std::ostringstream ss;
    ss << "x and y differ in length (" << x.size() << " vs " << y.size() << ")";
    throw InvalidArgument(ss.str());
  }
  if (x.empty()) throw InvalidArgument("no sample points");
  if (static_cast<int>(coefficients.size()) != model_.parameterCount()) {
    std::ostringstream ss;
    ss << model_.name() << " takes " << model_.parameterCount()
       << " coefficients, got " << coefficients.size();
    throw InvalidArgument(ss.str());
  }
  // nan, infを含むサンプル・係数は受け付けない
  for (size_t i=0;i<x.size();i++) {
    if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
      std::ostringstream ss;
      ss << "non-finite sample at index " << i << " (x=" << x[i] << ", y=" << y[i] << ")";
      throw InvalidArgument(ss.str());
    }
  }
  for (size_t k=0;k<coefficients.size();k++) {
    if (!std::isfinite(coefficients[k])) {
      std::ostringstream ss;
      ss << "non-finite coefficient at index " << k;
      throw InvalidArgument(ss.str());
    }
  }
}

/*
 * ヤコビ行列 (n x m)
 *  [ df(x_0)/dc_0  df(x_0)/dc_1  ...  df(x_0)/dc_m ]
 *  [     ...           ...                ...      ]
 *  [ df(x_n)/dc_0  df(x_n)/dc_1  ...  df(x_n)/dc_m ]
 */
Matrix GaussNewtonRegression::jacobian(const std::vector<double>& x, const std::vector<double>& coefficients) const {
  const int m = model_.parameterCount();
  Matrix result(x.size(), m);
  for (size_t row=0;row<x.size();row++) {
    for (int column=0;column<m;column++) {
      result(row, column) = model_.partialDerivative(x[row], column, coefficients);
    }
  }
  return result;
}

// 残差 (n x 1)
Matrix GaussNewtonRegression::errorMatrix(const std::vector<double>& x, const std::vector<double>& y,
                                          const std::vector<double>& coefficients) const {
  Matrix result(x.size(), 1);
  for (size_t row=0;row<x.size();row++) {
    result(row, 0) = y[row] - model_.evaluate(x[row], coefficients);
  }
  return result;
}

std::vector<double> GaussNewtonRegression::refine(const std::vector<double>& x, const std::vector<double>& y,
                                                  const std::vector<double>& coefficients) const {
  checkSamples(x, y, coefficients);

  Matrix J = jacobian(x, coefficients);
  Matrix Jt = transpose(J);
  Matrix r = errorMatrix(x, y, coefficients);

  // 正規方程式 J^T J * delta = J^T r
  Matrix delta = solve(multiply(Jt, J), multiply(Jt, r));

  // nan, infが含まれていたら更新しない
  if (!delta.allFinite()) {
    throw SingularMatrix("normal equations produced a non-finite step", -1);
  }

  std::vector<double> result = coefficients;
  for (size_t k=0;k<result.size();k++) result[k] += delta(k, 0);

  ROS_DEBUG_STREAM_NAMED("gauss_newton_regression", model_.name() << ": refine n=" << x.size()
                         << " m=" << result.size() << " |delta|max=" << delta.cwiseAbs().maxCoeff());
  return result;
}

double GaussNewtonRegression::rSquared(const std::vector<double>& x, const std::vector<double>& y,
                                       const std::vector<double>& coefficients) const {
  checkSamples(x, y, coefficients);

  // 平均の丸め誤差でTSSが0にならないことがあるので、データそのもので判定する
  if (std::all_of(y.begin(), y.end(), [&](double v){ return v == y[0]; })) {
    throw DegenerateData("R-squared undefined: all y values are equal");
  }

  double average = 0.0;
  for (size_t i=0;i<y.size();i++) average += y[i];
  average /= y.size();

  double total_sum_of_squares = 0.0;
  double residual_sum_of_squares = 0.0;
  for (size_t i=0;i<y.size();i++) {
    double error = y[i] - model_.evaluate(x[i], coefficients);
    total_sum_of_squares += std::pow(y[i] - average, 2);
    residual_sum_of_squares += error * error;
  }

  if (total_sum_of_squares == 0.0) {
    throw DegenerateData("R-squared undefined: all y values are equal");
  }
  return 1.0 - residual_sum_of_squares / total_sum_of_squares;
}

std::vector<double> GaussNewtonRegression::residuals(const std::vector<double>& x, const std::vector<double>& y,
                                                     const std::vector<double>& coefficients) const {
  checkSamples(x, y, coefficients);
  Matrix r = errorMatrix(x, y, coefficients);
  return std::vector<double>(r.data(), r.data() + r.rows());
}

double GaussNewtonRegression::evaluate(double x, const std::vector<double>& coefficients) const {
  return model_.evaluate(x, coefficients);
}

} // namespace gauss_newton_regression
