#ifndef GAUSS_NEWTON_REGRESSION_EXPONENTIATION_MODEL_HPP
#define GAUSS_NEWTON_REGRESSION_EXPONENTIATION_MODEL_HPP

#include "gauss_newton_regression/model.hpp"

namespace gauss_newton_regression {

  // f(x) = a * x^b  (b < 0 なら a / x^|b|)
  // x > 0 のデータのみ
  class ExponentiationModel : public Model
  {
  public:
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 2; }
    virtual std::string name() const { return "exponentiation"; }
  };

  // f(x) = a * x^b + c
  class ExponentiationOffsetModel : public Model
  {
  public:
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 3; }
    virtual std::string name() const { return "exponentiation_offset"; }
  };

  // f(x) = a * n^(b * x)  nは構築時に固定
  class FixedPowerModel : public Model
  {
  public:
    explicit FixedPowerModel(double base);
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 2; }
    virtual std::string name() const { return "fixed_power"; }
    double base() const { return base_; }

  private:
    const double base_;
    const double log_base_;
  };

  // f(x) = a * n^(b * x) + c
  class FixedPowerOffsetModel : public Model
  {
  public:
    explicit FixedPowerOffsetModel(double base);
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 3; }
    virtual std::string name() const { return "fixed_power_offset"; }
    double base() const { return base_; }

  private:
    const double base_;
    const double log_base_;
  };

  // f(x) = a * b^x
  class PowerModel : public Model
  {
  public:
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 2; }
    virtual std::string name() const { return "power"; }
  };

  /* -- 以下の3つは実装済みだが収束しない (bとcの組が一意に決まらない) -- */

  // f(x) = a * b^(c * x)
  class PowerScaledModel : public Model
  {
  public:
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 3; }
    virtual std::string name() const { return "power_scaled"; }
  };

  // f(x) = a * b^(c * x + d)
  class PowerShiftedModel : public Model
  {
  public:
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 4; }
    virtual std::string name() const { return "power_shifted"; }
  };

  // f(x) = a * b^(c * x + d) + g
  class PowerShiftedOffsetModel : public Model
  {
  public:
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 5; }
    virtual std::string name() const { return "power_shifted_offset"; }
  };

} // namespace gauss_newton_regression

#endif // GAUSS_NEWTON_REGRESSION_EXPONENTIATION_MODEL_HPP
