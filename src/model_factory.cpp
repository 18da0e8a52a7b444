#include "gauss_newton_regression/model_factory.hpp"
#include "gauss_newton_regression/exponential_model.hpp"
#include "gauss_newton_regression/exponentiation_model.hpp"
#include "gauss_newton_regression/damped_sine_model.hpp"
#include "gauss_newton_regression/regression_error.hpp"

#include <ros/console.h>

namespace gauss_newton_regression {

const std::vector<ModelInfo>& modelCatalog() {
  static const std::vector<ModelInfo> catalog = {
    {"exponential",               2, true},
    {"exponential_offset",        3, true},
    {"exponential_shifted",       4, false},
    {"exponential_decay",         2, true},
    {"exponential_decay_offset",  3, true},
    {"exponential_decay_shifted", 4, false},
    {"exponentiation",            2, true},
    {"exponentiation_offset",     3, true},
    {"fixed_power",               2, true},
    {"fixed_power_offset",        3, true},
    {"power",                     2, true},
    {"power_scaled",              3, false},
    {"power_shifted",             4, false},
    {"power_shifted_offset",      5, false},
    {"damped_sine",               4, true},
    {"damped_sine_cos",           3, true},
    {"damped_sine_cos_phase",     4, true},
  };
  return catalog;
}

std::shared_ptr<const Model> makeModel(const std::string& name, double fixed_base) {
  const ModelInfo* info = nullptr;
  for (size_t i=0;i<modelCatalog().size();i++) {
    if (modelCatalog()[i].name == name) info = &modelCatalog()[i];
  }
  if (info == nullptr) throw InvalidArgument("unknown model: " + name);
  if (!info->converges) {
    ROS_WARN("model '%s' is known not to converge under Gauss-Newton", name.c_str());
  }

  if (name == "exponential")               return std::make_shared<ExponentialModel>();
  if (name == "exponential_offset")        return std::make_shared<ExponentialOffsetModel>();
  if (name == "exponential_shifted")       return std::make_shared<ExponentialShiftedModel>();
  if (name == "exponential_decay")         return std::make_shared<ExponentialDecayModel>();
  if (name == "exponential_decay_offset")  return std::make_shared<ExponentialDecayOffsetModel>();
  if (name == "exponential_decay_shifted") return std::make_shared<ExponentialDecayShiftedModel>();
  if (name == "exponentiation")            return std::make_shared<ExponentiationModel>();
  if (name == "exponentiation_offset")     return std::make_shared<ExponentiationOffsetModel>();
  if (name == "fixed_power")               return std::make_shared<FixedPowerModel>(fixed_base);
  if (name == "fixed_power_offset")        return std::make_shared<FixedPowerOffsetModel>(fixed_base);
  if (name == "power")                     return std::make_shared<PowerModel>();
  if (name == "power_scaled")              return std::make_shared<PowerScaledModel>();
  if (name == "power_shifted")             return std::make_shared<PowerShiftedModel>();
  if (name == "power_shifted_offset")      return std::make_shared<PowerShiftedOffsetModel>();
  if (name == "damped_sine")               return std::make_shared<DampedSineModel>();
  if (name == "damped_sine_cos")           return std::make_shared<DampedSineCosModel>();
  if (name == "damped_sine_cos_phase")     return std::make_shared<DampedSineCosPhaseModel>();
  throw InvalidArgument("unknown model: " + name);
}

} // namespace gauss_newton_regression
