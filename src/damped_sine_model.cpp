#include "gauss_newton_regression/damped_sine_model.hpp"

#include <cmath>

namespace gauss_newton_regression {

/* -- a * exp(b * x) * sin(c * x + d) -- */
double DampedSineModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  return c[0] * std::exp(c[1] * x) * std::sin(c[2] * x + c[3]);
}

double DampedSineModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  double e = std::exp(c[1] * x);
  double phase = c[2] * x + c[3];
  switch (k) {
  case 0: return e * std::sin(phase);
  case 1: return c[0] * x * e * std::sin(phase);
  case 2: return c[0] * x * e * std::cos(phase);
  default: return c[0] * e * std::cos(phase);
  }
}

/* -- a * exp(b * x) * (cos(c * x) + sin(c * x)) -- */
double DampedSineCosModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  return c[0] * std::exp(c[1] * x) * (std::cos(c[2] * x) + std::sin(c[2] * x));
}

double DampedSineCosModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  double e = std::exp(c[1] * x);
  double cs = std::cos(c[2] * x);
  double sn = std::sin(c[2] * x);
  switch (k) {
  case 0: return e * (cs + sn);
  case 1: return c[0] * x * e * (cs + sn);
  default: return c[0] * x * e * (cs - sn);
  }
}

/* -- a * exp(b * x) * (cos(c * x + d) + sin(c * x + d)) -- */
double DampedSineCosPhaseModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  double phase = c[2] * x + c[3];
  return c[0] * std::exp(c[1] * x) * (std::cos(phase) + std::sin(phase));
}

double DampedSineCosPhaseModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  double e = std::exp(c[1] * x);
  double phase = c[2] * x + c[3];
  double cs = std::cos(phase);
  double sn = std::sin(phase);
  switch (k) {
  case 0: return e * (cs + sn);
  case 1: return c[0] * x * e * (cs + sn);
  case 2: return c[0] * x * e * (cs - sn);
  default: return c[0] * e * (cs - sn);
  }
}

} // namespace gauss_newton_regression
