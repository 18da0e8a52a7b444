#ifndef GAUSS_NEWTON_REGRESSION_MATRIX_OPS_HPP
#define GAUSS_NEWTON_REGRESSION_MATRIX_OPS_HPP

#include "eigen3/Eigen/Dense"

namespace gauss_newton_regression {

  typedef Eigen::MatrixXd Matrix;

  // M^T
  Matrix transpose(const Matrix& matrix);

  // A * B  cols(A) != rows(B) ならInvalidArgument (切り詰め・パディングはしない)
  Matrix multiply(const Matrix& matrix, const Matrix& multiplicand);

} // namespace gauss_newton_regression

#endif // GAUSS_NEWTON_REGRESSION_MATRIX_OPS_HPP
