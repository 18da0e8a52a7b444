#ifndef GAUSS_NEWTON_REGRESSION_MODEL_HPP
#define GAUSS_NEWTON_REGRESSION_MODEL_HPP

#include <string>
#include <vector>

namespace gauss_newton_regression {

  /*
   * フィッティング対象の関数 f(x; c) のインターフェース
   *   evaluate          : f(x; c)
   *   partialDerivative : df(x; c) / dc_k  (0 <= k < parameterCount())
   *   parameterCount    : 係数の数 m
   * 構築後は不変。同じインスタンスを複数スレッドから読んでも安全であること。
   */
  class Model
  {
  public:
    virtual ~Model() {}

    virtual double evaluate(double x, const std::vector<double>& coefficients) const = 0;
    virtual double partialDerivative(double x, int coefficient_index, const std::vector<double>& coefficients) const = 0;
    virtual int parameterCount() const = 0;
    virtual std::string name() const = 0;

  protected:
    // kが[0, parameterCount())の外ならInvalidArgument
    void checkIndex(int coefficient_index) const;
    // 係数の数がparameterCount()と違えばInvalidArgument
    void checkCoefficients(const std::vector<double>& coefficients) const;
  };

} // namespace gauss_newton_regression

#endif // GAUSS_NEWTON_REGRESSION_MODEL_HPP
