#ifndef GAUSS_NEWTON_REGRESSION_GAUSS_NEWTON_REGRESSION_HPP
#define GAUSS_NEWTON_REGRESSION_GAUSS_NEWTON_REGRESSION_HPP

#include "gauss_newton_regression/model.hpp"
#include "gauss_newton_regression/matrix_ops.hpp"

#include <vector>

namespace gauss_newton_regression {

  /*
   * Gauss-Newton法による非線形最小二乗
   *   c_{n+1} = c_n + (J^T J)^-1 J^T r(c_n)
   * Jはヤコビ行列 (n x m)、rは残差 y - f(x; c_n)。
   *
   * refine()は1ステップだけ計算して新しい係数を返す。
   * 何回回すか・いつ止めるかは呼び出し側が決める。
   * モデルへの参照以外に状態は持たないので、複数スレッドから呼んでよい。
   */
  class GaussNewtonRegression
  {
  public:
    explicit GaussNewtonRegression(const Model& model);

    // 1ステップ分の更新。coefficientsは変更しない
    std::vector<double> refine(const std::vector<double>& x, const std::vector<double>& y,
                               const std::vector<double>& coefficients) const;

    // 決定係数 R^2 = 1 - RSS/TSS  平均より悪いフィットなら負になる
    // yが全て同じ値 (TSS = 0) ならDegenerateData
    double rSquared(const std::vector<double>& x, const std::vector<double>& y,
                    const std::vector<double>& coefficients) const;

    // r[i] = y[i] - f(x[i]; c)
    std::vector<double> residuals(const std::vector<double>& x, const std::vector<double>& y,
                                  const std::vector<double>& coefficients) const;

    double evaluate(double x, const std::vector<double>& coefficients) const;

    const Model& model() const { return model_; }

  private:
    void checkSamples(const std::vector<double>& x, const std::vector<double>& y,
                      const std::vector<double>& coefficients) const;
    Matrix jacobian(const std::vector<double>& x, const std::vector<double>& coefficients) const;
    Matrix errorMatrix(const std::vector<double>& x, const std::vector<double>& y,
                       const std::vector<double>& coefficients) const;

    const Model& model_;
  };

} // namespace gauss_newton_regression

#endif // GAUSS_NEWTON_REGRESSION_GAUSS_NEWTON_REGRESSION_HPP
