#ifndef GAUSS_NEWTON_REGRESSION_MODEL_FACTORY_HPP
#define GAUSS_NEWTON_REGRESSION_MODEL_FACTORY_HPP

#include "gauss_newton_regression/model.hpp"

#include <memory>
#include <string>
#include <vector>

namespace gauss_newton_regression {

  struct ModelInfo
  {
    std::string name;
    int parameter_count;
    bool converges; // false: 実装済みだがGauss-Newtonで収束しない
  };

  // 登録されている全モデル (登録順)
  const std::vector<ModelInfo>& modelCatalog();

  // 名前からモデルを作る。未知の名前はInvalidArgument
  // fixed_baseはfixed_power系のみで使う
  std::shared_ptr<const Model> makeModel(const std::string& name, double fixed_base = 2.0);

} // namespace gauss_newton_regression

#endif // GAUSS_NEWTON_REGRESSION_MODEL_FACTORY_HPP
