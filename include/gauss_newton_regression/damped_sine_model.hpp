#ifndef GAUSS_NEWTON_REGRESSION_DAMPED_SINE_MODEL_HPP
#define GAUSS_NEWTON_REGRESSION_DAMPED_SINE_MODEL_HPP

#include "gauss_newton_regression/model.hpp"

namespace gauss_newton_regression {

  // f(x) = a * exp(b * x) * sin(c * x + d)
  class DampedSineModel : public Model
  {
  public:
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 4; }
    virtual std::string name() const { return "damped_sine"; }
  };

  // f(x) = a * exp(b * x) * (cos(c * x) + sin(c * x))
  class DampedSineCosModel : public Model
  {
  public:
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 3; }
    virtual std::string name() const { return "damped_sine_cos"; }
  };

  // f(x) = a * exp(b * x) * (cos(c * x + d) + sin(c * x + d))
  class DampedSineCosPhaseModel : public Model
  {
  public:
    virtual double evaluate(double x, const std::vector<double>& c) const;
    virtual double partialDerivative(double x, int k, const std::vector<double>& c) const;
    virtual int parameterCount() const { return 4; }
    virtual std::string name() const { return "damped_sine_cos_phase"; }
  };

} // namespace gauss_newton_regression

#endif // GAUSS_NEWTON_REGRESSION_DAMPED_SINE_MODEL_HPP
