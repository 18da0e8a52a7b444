#include "gauss_newton_regression/model.hpp"
#include "gauss_newton_regression/regression_error.hpp"

#include <sstream>

namespace gauss_newton_regression {

void Model::checkIndex(int coefficient_index) const {
  if (coefficient_index < 0 || coefficient_index >= parameterCount()) {
    std::ostringstream ss;
    ss << name() << ": coefficient index " << coefficient_index
       << " out of range [0, " << parameterCount() << ")";
    throw InvalidArgument(ss.str());
  }
}

void Model::checkCoefficients(const std::vector<double>& coefficients) const {
  if (static_cast<int>(coefficients.size()) != parameterCount()) {
    std::ostringstream ss;
    ss << name() << ": expected " << parameterCount()
       << " coefficients, got " << coefficients.size();
    throw InvalidArgument(ss.str());
  }
}

} // namespace gauss_newton_regression
