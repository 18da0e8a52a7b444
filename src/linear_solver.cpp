#include "gauss_newton_regression/linear_solver.hpp"
#include "gauss_newton_regression/regression_error.hpp"

#include <ros/console.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <vector>

namespace gauss_newton_regression {

Matrix solve(const Matrix& matrix, const Matrix& answers) {
  const int degree = matrix.rows();
  if (matrix.cols() != degree) {
    std::ostringstream ss;
    ss << "solve: matrix must be square, got " << matrix.rows() << "x" << matrix.cols();
    throw InvalidArgument(ss.str());
  }
  if (answers.rows() != degree || answers.cols() != 1) {
    std::ostringstream ss;
    ss << "solve: answers must be " << degree << "x1, got " << answers.rows() << "x" << answers.cols();
    throw InvalidArgument(ss.str());
  }

  // 拡大行列 [M | A]
  Matrix work(degree, degree+1);
  work.leftCols(degree) = matrix;
  work.col(degree) = answers.col(0);

  // 列ごとのピボットのしきい値 (元の列の最大絶対値 * 16 * degree * eps)
  // 重複データなどで消去後に丸め誤差だけ残った値はピボットにしない
  std::vector<double> pivot_threshold(degree, 0.0);
  for (int column=0;column<degree;column++) {
    pivot_threshold[column] = matrix.col(column).cwiseAbs().maxCoeff()
      * 16.0 * degree * std::numeric_limits<double>::epsilon();
  }

  std::vector<bool> is_done(degree, false);
  std::vector<int> order(degree, -1); // 列 -> ピボット行

  // 前進消去 (列の順番とピボット行の順番は一致しなくてよい)
  for (int column=0;column<degree;column++) {
    // まだ終わっていなくて、この列が0でない行を探す
    int active_row = 0;
    while (active_row < degree && (is_done[active_row] || std::fabs(work(active_row, column)) <= pivot_threshold[column])) {
      active_row++;
    }
    if (active_row == degree) {
      ROS_DEBUG_STREAM_NAMED("gauss_newton_regression", "solve: no pivot for column " << column);
      std::ostringstream ss;
      ss << "singular matrix: no pivot for column " << column;
      throw SingularMatrix(ss.str(), column);
    }
    order[column] = active_row;

    // 正規化 -> この列の値が1になる
    double first_term = work(active_row, column);
    for (int sub_column=column;sub_column<=degree;sub_column++) {
      work(active_row, sub_column) /= first_term;
    }
    is_done[active_row] = true;

    // 終わっていない行からこの列を消す
    for (int row=0;row<degree;row++) {
      if (is_done[row] || work(row, column) == 0.0) continue;
      double factor = work(row, column);
      for (int sub_column=column;sub_column<=degree;sub_column++) {
        work(row, sub_column) -= factor * work(active_row, sub_column);
      }
    }
  }

  // 後退代入 (最後の列から、記録したピボット行の順で)
  std::fill(is_done.begin(), is_done.end(), false);
  Matrix coefficients(degree, 1);
  for (int column=degree-1;column>=0;column--) {
    int active_row = order[column];
    is_done[active_row] = true;
    for (int row=0;row<degree;row++) {
      if (is_done[row]) continue;
      double factor = work(row, column);
      for (int sub_column=column;sub_column<=degree;sub_column++) {
        work(row, sub_column) -= factor * work(active_row, sub_column);
      }
    }
    coefficients(column, 0) = work(active_row, degree);
  }

  ROS_DEBUG_STREAM_NAMED("gauss_newton_regression", "solve: degree " << degree << ", pivot order "
                         << Eigen::Map<const Eigen::VectorXi>(order.data(), degree).transpose());
  return coefficients;
}

} // namespace gauss_newton_regression
