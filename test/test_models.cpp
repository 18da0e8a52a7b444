#include <gtest/gtest.h>

#include "gauss_newton_regression/exponential_model.hpp"
#include "gauss_newton_regression/exponentiation_model.hpp"
#include "gauss_newton_regression/damped_sine_model.hpp"
#include "gauss_newton_regression/model_factory.hpp"
#include "gauss_newton_regression/regression_error.hpp"

#include <cmath>

using namespace gauss_newton_regression;

namespace {

std::vector<double> sampleCoefficients(int m)
{
  const double values[] = {1.3, 0.4, 0.7, 0.2, 0.5};
  return std::vector<double>(values, values + m);
}

// (f(c + h e_k) - f(c - h e_k)) / 2h
double centralDifference(const Model& model, double x, int k, const std::vector<double>& c)
{
  const double h = 1e-6;
  std::vector<double> plus = c;
  std::vector<double> minus = c;
  plus[k] += h;
  minus[k] -= h;
  return (model.evaluate(x, plus) - model.evaluate(x, minus)) / (2.0 * h);
}

} // namespace

class ModelDerivativeTest : public ::testing::TestWithParam<std::string> {};

TEST_P(ModelDerivativeTest, MatchesFiniteDifference)
{
  std::shared_ptr<const Model> model = makeModel(GetParam(), 2.0);
  std::vector<double> c = sampleCoefficients(model->parameterCount());
  const double xs[] = {0.5, 1.0, 1.7, 2.3, 3.1};
  for (double x : xs) {
    for (int k=0;k<model->parameterCount();k++) {
      double analytic = model->partialDerivative(x, k, c);
      double numeric = centralDifference(*model, x, k, c);
      EXPECT_NEAR(analytic, numeric, 1e-6 * (1.0 + std::fabs(analytic)))
        << GetParam() << " x=" << x << " k=" << k;
    }
  }
}

TEST_P(ModelDerivativeTest, RejectsCoefficientIndexOutOfRange)
{
  std::shared_ptr<const Model> model = makeModel(GetParam(), 2.0);
  std::vector<double> c = sampleCoefficients(model->parameterCount());
  EXPECT_THROW(model->partialDerivative(1.0, -1, c), InvalidArgument);
  EXPECT_THROW(model->partialDerivative(1.0, model->parameterCount(), c), InvalidArgument);
}

TEST_P(ModelDerivativeTest, RejectsWrongCoefficientCount)
{
  std::shared_ptr<const Model> model = makeModel(GetParam(), 2.0);
  std::vector<double> c = sampleCoefficients(model->parameterCount() - 1);
  EXPECT_THROW(model->evaluate(1.0, c), InvalidArgument);
  EXPECT_THROW(model->partialDerivative(1.0, 0, c), InvalidArgument);
}

namespace {

std::vector<std::string> catalogNames()
{
  std::vector<std::string> names;
  for (size_t i=0;i<modelCatalog().size();i++) names.push_back(modelCatalog()[i].name);
  return names;
}

} // namespace

INSTANTIATE_TEST_CASE_P(Catalog, ModelDerivativeTest, ::testing::ValuesIn(catalogNames()));

TEST(ExponentialModel, Evaluates)
{
  ExponentialModel model;
  EXPECT_DOUBLE_EQ(model.evaluate(1.0, {2.0, 1.0}), 2.0 * std::exp(1.0));
  EXPECT_DOUBLE_EQ(model.partialDerivative(0.0, 0, {2.0, 1.0}), 1.0);
  EXPECT_DOUBLE_EQ(model.partialDerivative(0.0, 1, {2.0, 1.0}), 0.0);
}

TEST(ExponentialModel, DecayStartsAtZero)
{
  ExponentialDecayModel model;
  EXPECT_DOUBLE_EQ(model.evaluate(0.0, {5.0, -0.3}), 0.0);
  ExponentialDecayOffsetModel offset;
  EXPECT_DOUBLE_EQ(offset.evaluate(0.0, {5.0, -0.3, 1.5}), 1.5);
}

TEST(ExponentiationModel, EvaluatesReciprocalPowerWithNegativeExponent)
{
  ExponentiationModel model;
  EXPECT_DOUBLE_EQ(model.evaluate(4.0, {3.0, -2.0}), 3.0 / 16.0);
  // x -> 0 でも d/db は有限
  EXPECT_DOUBLE_EQ(model.partialDerivative(0.0, 1, {3.0, 2.0}), 0.0);
}

TEST(FixedPowerModel, UsesBaseFixedAtConstruction)
{
  FixedPowerModel model(3.0);
  EXPECT_DOUBLE_EQ(model.base(), 3.0);
  EXPECT_DOUBLE_EQ(model.evaluate(2.0, {1.5, 1.0}), 13.5);
  FixedPowerOffsetModel offset(10.0);
  EXPECT_DOUBLE_EQ(offset.evaluate(1.0, {2.0, 2.0, 1.0}), 201.0);
}

TEST(FixedPowerModel, RejectsInvalidBase)
{
  EXPECT_THROW(FixedPowerModel(1.0), InvalidArgument);
  EXPECT_THROW(FixedPowerModel(0.0), InvalidArgument);
  EXPECT_THROW(FixedPowerOffsetModel(-2.0), InvalidArgument);
}

TEST(DampedSineModel, EvaluatesAtOrigin)
{
  DampedSineModel model;
  EXPECT_NEAR(model.evaluate(0.0, {2.0, -0.5, 3.0, 0.0}), 0.0, 1e-15);
  DampedSineCosModel cos_model;
  EXPECT_DOUBLE_EQ(cos_model.evaluate(0.0, {2.0, -0.5, 3.0}), 2.0);
  DampedSineCosPhaseModel phase_model;
  EXPECT_DOUBLE_EQ(phase_model.evaluate(0.0, {2.0, -0.5, 3.0, 0.0}), 2.0);
}
