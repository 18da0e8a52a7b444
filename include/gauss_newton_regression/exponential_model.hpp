#ifndef GAUSS_NEWTON_REGRESSION_EXPONENTIAL_MODEL_HPP
#define GAUSS_NEWTON_REGRESSION_EXPONENTIAL_MODEL_HPP

#include "gauss_newton_regression/model.hpp"

namespace gauss_newton_regression {

  // f(x) = a * exp(b * x)
  class ExponentialModel : public Model
  {
  public:
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 2; }
    virtual std::string name() const { return "exponential"; }
  };

  // f(x) = a * exp(b * x) + c
  class ExponentialOffsetModel : public Model
  {
  public:
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 3; }
    virtual std::string name() const { return "exponential_offset"; }
  };

  // f(x) = a * exp(b * x + c) + d
  // aとcが独立でない (a*e^c) のでJ^T Jがほぼ特異になり、収束しない
  class ExponentialShiftedModel : public Model
  {
  public:
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 4; }
    virtual std::string name() const { return "exponential_shifted"; }
  };

  // f(x) = a * (1 - exp(b * x))
  class ExponentialDecayModel : public Model
  {
  public:
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 2; }
    virtual std::string name() const { return "exponential_decay"; }
  };

  // f(x) = a * (1 - exp(b * x)) + c
  class ExponentialDecayOffsetModel : public Model
  {
  public:
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 3; }
    virtual std::string name() const { return "exponential_decay_offset"; }
  };

  // f(x) = a * (1 - exp(b * x + c)) + d
  // 収束しない (ExponentialShiftedModelと同じ理由)
  class ExponentialDecayShiftedModel : public Model
  {
  public:
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 4; }
    virtual std::string name() const { return "exponential_decay_shifted"; }
  };

} // namespace gauss_newton_regression

#endif // GAUSS_NEWTON_REGRESSION_EXPONENTIAL_MODEL_HPP
