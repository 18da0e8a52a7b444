#include "gauss_newton_regression/exponentiation_model.hpp"
#include "gauss_newton_regression/regression_error.hpp"

#include <cmath>
#include <sstream>

namespace gauss_newton_regression {

namespace {

// x^b * ln(x)  x -> 0 の極限は0
double powLog(double x, double b) {
  double p = std::pow(x, b);
  if (p == 0.0) return 0.0;
  return p * std::log(x);
}

double checkedLogBase(double base) {
  if (!(base > 0.0) || base == 1.0 || !std::isfinite(base)) {
    std::ostringstream ss;
    ss << "fixed power base must be positive and not 1, got " << base;
    throw InvalidArgument(ss.str());
  }
  return std::log(base);
}

} // namespace

/* -- a * x^b -- */
double ExponentiationModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  return c[0] * std::pow(x, c[1]);
}

double ExponentiationModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  switch (k) {
  case 0: return std::pow(x, c[1]);
  default: return c[0] * powLog(x, c[1]);
  }
}

/* -- a * x^b + c -- */
double ExponentiationOffsetModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  return c[0] * std::pow(x, c[1]) + c[2];
}

double ExponentiationOffsetModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  switch (k) {
  case 0: return std::pow(x, c[1]);
  case 1: return c[0] * powLog(x, c[1]);
  default: return 1.0;
  }
}

/* -- a * n^(b * x) -- */
FixedPowerModel::FixedPowerModel(double base)
  : base_(base), log_base_(checkedLogBase(base)) {}

double FixedPowerModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  return c[0] * std::pow(base_, c[1] * x);
}

double FixedPowerModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  double p = std::pow(base_, c[1] * x);
  switch (k) {
  case 0: return p;
  default: return c[0] * x * log_base_ * p;
  }
}

/* -- a * n^(b * x) + c -- */
FixedPowerOffsetModel::FixedPowerOffsetModel(double base)
  : base_(base), log_base_(checkedLogBase(base)) {}

double FixedPowerOffsetModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  return c[0] * std::pow(base_, c[1] * x) + c[2];
}

double FixedPowerOffsetModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  double p = std::pow(base_, c[1] * x);
  switch (k) {
  case 0: return p;
  case 1: return c[0] * x * log_base_ * p;
  default: return 1.0;
  }
}

/* -- a * b^x -- */
double PowerModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  return c[0] * std::pow(c[1], x);
}

double PowerModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  switch (k) {
  case 0: return std::pow(c[1], x);
  default: return c[0] * x * std::pow(c[1], x - 1.0);
  }
}

/* -- a * b^(c * x) -- */
double PowerScaledModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  return c[0] * std::pow(c[1], c[2] * x);
}

double PowerScaledModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  double u = c[2] * x;
  switch (k) {
  case 0: return std::pow(c[1], u);
  case 1: return c[0] * u * std::pow(c[1], u - 1.0);
  default: return c[0] * x * std::log(c[1]) * std::pow(c[1], u);
  }
}

/* -- a * b^(c * x + d) -- */
double PowerShiftedModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  return c[0] * std::pow(c[1], c[2] * x + c[3]);
}

double PowerShiftedModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  double u = c[2] * x + c[3];
  switch (k) {
  case 0: return std::pow(c[1], u);
  case 1: return c[0] * u * std::pow(c[1], u - 1.0);
  case 2: return c[0] * x * std::log(c[1]) * std::pow(c[1], u);
  default: return c[0] * std::log(c[1]) * std::pow(c[1], u);
  }
}

/* -- a * b^(c * x + d) + g -- */
double PowerShiftedOffsetModel::evaluate(double x, const std::vector<double>& c) const {
  checkCoefficients(c);
  return c[0] * std::pow(c[1], c[2] * x + c[3]) + c[4];
}

double PowerShiftedOffsetModel::partialDerivative(double x, int k, const std::vector<double>& c) const {
  checkIndex(k);
  checkCoefficients(c);
  double u = c[2] * x + c[3];
  switch (k) {
  case 0: return std::pow(c[1], u);
  case 1: return c[0] * u * std::pow(c[1], u - 1.0);
  case 2: return c[0] * x * std::log(c[1]) * std::pow(c[1], u);
  case 3: return c[0] * std::log(c[1]) * std::pow(c[1], u);
  default: return 1.0;
  }
}

} // namespace gauss_newton_regression
