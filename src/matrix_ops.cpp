#include "gauss_newton_regression/matrix_ops.hpp"
#include "gauss_newton_regression/regression_error.hpp"

#include <sstream>

namespace gauss_newton_regression {

Matrix transpose(const Matrix& matrix) {
  Matrix result(matrix.cols(), matrix.rows());
  for (int row=0;row<matrix.cols();row++) {
    for (int column=0;column<matrix.rows();column++) {
      result(row, column) = matrix(column, row);
    }
  }
  return result;
}

Matrix multiply(const Matrix& matrix, const Matrix& multiplicand) {
  if (matrix.cols() != multiplicand.rows()) {
    std::ostringstream ss;
    ss << "cannot multiply " << matrix.rows() << "x" << matrix.cols()
       << " by " << multiplicand.rows() << "x" << multiplicand.cols();
    throw InvalidArgument(ss.str());
  }

  // result[i][j] = sum_k A[i][k] * B[k][j]
  Matrix result = Matrix::Zero(matrix.rows(), multiplicand.cols());
  for (int row=0;row<matrix.rows();row++) {
    for (int column=0;column<multiplicand.cols();column++) {
      for (int index=0;index<matrix.cols();index++) {
        result(row, column) += matrix(row, index) * multiplicand(index, column);
      }
    }
  }
  return result;
}

} // namespace gauss_newton_regression
