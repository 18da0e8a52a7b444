#ifndef GAUSS_NEWTON_REGRESSION_LINEAR_SOLVER_HPP
#define GAUSS_NEWTON_REGRESSION_LINEAR_SOLVER_HPP

#include "gauss_newton_regression/matrix_ops.hpp"

namespace gauss_newton_regression {

  /*
   * M * C = A を解く (Mはd x dの正方行列、Aはd x 1)
   *
   * 拡大行列 [M | A] に対するガウスの消去法。各列のピボットは
   * 「まだ終わっていない行のうち、その列が0でない最初の行」を上から探す
   * ので、ピボット行は列の順番と一致しなくてよい。列 -> ピボット行 の対応を
   * 覚えておき、後退代入もその順番で行う。
   *
   * 返り値はd x 1で、列の順番 (係数の順番) に並ぶ。
   * ピボットが見つからない列があればSingularMatrix、
   * Mが正方でない・Aの形が合わなければInvalidArgument。
   */
  Matrix solve(const Matrix& matrix, const Matrix& answers);

} // namespace gauss_newton_regression

#endif // GAUSS_NEWTON_REGRESSION_LINEAR_SOLVER_HPP
