#include "gauss_newton_regression/exponential_model.hpp"

#include <cmath>

namespace gauss_newton_regression {

/* -- a * exp(b * x) -- */
double ExponentialModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  return c[0] * std::exp(c[1] * x);
}

double ExponentialModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  double e = std::exp(c[1] * x);
  switch (k) {
  case 0: return e;
  default: return c[0] * x * e;
  }
}

/* -- a * exp(b * x) + c -- */
double ExponentialOffsetModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  return c[0] * std::exp(c[1] * x) + c[2];
}

double ExponentialOffsetModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  double e = std::exp(c[1] * x);
  switch (k) {
  case 0: return e;
  case 1: return c[0] * x * e;
  default: return 1.0;
  }
}

/* -- a * exp(b * x + c) + d -- */
double ExponentialShiftedModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  return c[0] * std::exp(c[1] * x + c[2]) + c[3];
}

double ExponentialShiftedModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  double e = std::exp(c[1] * x + c[2]);
  switch (k) {
  case 0: return e;
  case 1: return c[0] * x * e;
  case 2: return c[0] * e;
  default: return 1.0;
  }
}

/* -- a * (1 - exp(b * x)) -- */
double ExponentialDecayModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  return c[0] * (1.0 - std::exp(c[1] * x));
}

double ExponentialDecayModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  double e = std::exp(c[1] * x);
  switch (k) {
  case 0: return 1.0 - e;
  default: return -c[0] * x * e;
  }
}

/* -- a * (1 - exp(b * x)) + c -- */
double ExponentialDecayOffsetModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  return c[0] * (1.0 - std::exp(c[1] * x)) + c[2];
}

double ExponentialDecayOffsetModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  double e = std::exp(c[1] * x);
  switch (k) {
  case 0: return 1.0 - e;
  case 1: return -c[0] * x * e;
  default: return 1.0;
  }
}

/* -- a * (1 - exp(b * x + c)) + d -- */
double ExponentialDecayShiftedModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  return c[0] * (1.0 - std::exp(c[1] * x + c[2])) + c[3];
}

double ExponentialDecayShiftedModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  double e = std::exp(c[1] * x + c[2]);
  switch (k) {
  case 0: return 1.0 - e;
  case 1: return -c[0] * x * e;
  case 2: return -c[0] * e;
  default: return 1.0;
  }
}

} // namespace gauss_newton_regression
