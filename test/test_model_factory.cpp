#include <gtest/gtest.h>

#include "gauss_newton_regression/model_factory.hpp"
#include "gauss_newton_regression/exponentiation_model.hpp"
#include "gauss_newton_regression/regression_error.hpp"

#include <set>

using namespace gauss_newton_regression;

TEST(ModelFactory, CatalogNamesAreUnique)
{
  std::set<std::string> names;
  for (size_t i=0;i<modelCatalog().size();i++) names.insert(modelCatalog()[i].name);
  EXPECT_EQ(names.size(), modelCatalog().size());
  EXPECT_EQ(modelCatalog().size(), 17u);
}

TEST(ModelFactory, BuildsEveryCatalogEntry)
{
  for (size_t i=0;i<modelCatalog().size();i++) {
    const ModelInfo& info = modelCatalog()[i];
    std::shared_ptr<const Model> model = makeModel(info.name);
    ASSERT_TRUE(model != nullptr);
    EXPECT_EQ(model->name(), info.name);
    EXPECT_EQ(model->parameterCount(), info.parameter_count);
  }
}

TEST(ModelFactory, MarksNonConvergingModels)
{
  std::set<std::string> expected = {"exponential_shifted", "exponential_decay_shifted",
                                    "power_scaled", "power_shifted", "power_shifted_offset"};
  for (size_t i=0;i<modelCatalog().size();i++) {
    const ModelInfo& info = modelCatalog()[i];
    EXPECT_EQ(info.converges, expected.count(info.name) == 0) << info.name;
  }
}

TEST(ModelFactory, PassesFixedBase)
{
  std::shared_ptr<const Model> model = makeModel("fixed_power", 10.0);
  EXPECT_DOUBLE_EQ(model->evaluate(2.0, {1.0, 1.0}), 100.0);
  std::shared_ptr<const FixedPowerOffsetModel> offset =
    std::dynamic_pointer_cast<const FixedPowerOffsetModel>(makeModel("fixed_power_offset", 5.0));
  ASSERT_TRUE(offset != nullptr);
  EXPECT_DOUBLE_EQ(offset->base(), 5.0);
}

TEST(ModelFactory, RejectsUnknownName)
{
  EXPECT_THROW(makeModel("polynomial"), InvalidArgument);
  EXPECT_THROW(makeModel(""), InvalidArgument);
}

TEST(ModelFactory, RejectsInvalidFixedBase)
{
  EXPECT_THROW(makeModel("fixed_power", 1.0), InvalidArgument);
  EXPECT_THROW(makeModel("fixed_power_offset", -3.0), InvalidArgument);
  // fixed_power以外では使わない
  EXPECT_NO_THROW(makeModel("exponential", -3.0));
}
