#include "gauss_newton_regression/curve_fitting_nodelet.h"
#include "gauss_newton_regression/regression_error.hpp"

#include <algorithm>
#include <cmath>

namespace gauss_newton_regression {

CurveFittingNodelet::CurveFittingNodelet() {}

void CurveFittingNodelet::onInit() {
  // node handler
  nh = getNodeHandle();
  pnh = getPrivateNodeHandle();
  // srv
  refineService = nh.advertiseService("/CurveFitting/refine_coefficients", &CurveFittingNodelet::refineCoefficients, this);
  fitService = nh.advertiseService("/CurveFitting/fit_curve", &CurveFittingNodelet::fitCurve, this);
  // rosparam
  pnh.param<std::string>("model", default_model, "exponential");
  pnh.param("fixed_base", fixed_base, 2.0);
  pnh.param("max_iterations", max_iterations, 50);
  pnh.param("tolerance", tolerance, 1e-9);

  if (max_iterations <= 0) {
    ROS_ERROR("max_iterations must be positive (got %d), using 50", max_iterations);
    max_iterations = 50;
  }
  if (!(tolerance > 0.0)) {
    ROS_ERROR("tolerance must be positive (got %g), using 1e-9", tolerance);
    tolerance = 1e-9;
  }
  ROS_INFO("CurveFitting ready: model=%s fixed_base=%g max_iterations=%d tolerance=%g",
           default_model.c_str(), fixed_base, max_iterations, tolerance);
}

std::shared_ptr<const Model> CurveFittingNodelet::selectModel(const std::string& name, double base) const {
  return makeModel(name.empty() ? default_model : name, base > 0.0 ? base : fixed_base);
}

/* -- 1ステップだけ更新 -- */
bool CurveFittingNodelet::refineCoefficients(gauss_newton_regression::RefineCoefficients::Request &req,
                                             gauss_newton_regression::RefineCoefficients::Response &res) {
  ROS_INFO("refine_coefficients: model=%s points=%zu", req.model.c_str(), req.x.size());
  res.success = false;
  try {
    std::shared_ptr<const Model> model = selectModel(req.model, req.fixed_base);
    GaussNewtonRegression regression(*model);
    res.coefficients = regression.refine(req.x, req.y, req.coefficients);
    res.success = true;
    try {
      res.r_squared = regression.rSquared(req.x, req.y, res.coefficients);
    } catch (const DegenerateData& e) {
      // ステップ自体は成功している
      res.r_squared = 0.0;
      res.message = e.what();
    }
  } catch (const SingularMatrix& e) {
    ROS_WARN("refine_coefficients failed: %s", e.what());
    res.message = e.what();
  } catch (const InvalidArgument& e) {
    ROS_WARN("refine_coefficients rejected: %s", e.what());
    res.message = e.what();
  }
  return true;
}

/* -- 収束するか上限回数までrefineを回す -- */
bool CurveFittingNodelet::fitCurve(gauss_newton_regression::FitCurve::Request &req,
                                   gauss_newton_regression::FitCurve::Response &res) {
  int cap = req.max_iterations > 0 ? req.max_iterations : max_iterations;
  double tol = req.tolerance > 0.0 ? req.tolerance : tolerance;
  ROS_INFO("fit_curve: model=%s points=%zu max_iterations=%d tolerance=%g",
           req.model.c_str(), req.x.size(), cap, tol);

  res.success = false;
  res.converged = false;
  res.iterations = 0;
  try {
    std::shared_ptr<const Model> model = selectModel(req.model, req.fixed_base);
    GaussNewtonRegression regression(*model);

    std::vector<double> coefficients = req.initial_coefficients;
    while (res.iterations < cap && !res.converged) {
      std::vector<double> next = regression.refine(req.x, req.y, coefficients);
      double change = 0.0;
      for (size_t k=0;k<next.size();k++) change = std::max(change, std::fabs(next[k] - coefficients[k]));
      coefficients = next;
      res.iterations++;
      if (change < tol) res.converged = true;
    }

    res.coefficients = coefficients;
    res.success = true;
    if (!res.converged) res.message = "iteration limit reached before convergence";
    try {
      res.r_squared = regression.rSquared(req.x, req.y, coefficients);
    } catch (const DegenerateData& e) {
      res.r_squared = 0.0;
      res.message = e.what();
    }
    ROS_INFO("fit_curve: %d iterations, converged=%s, r_squared=%f",
             res.iterations, res.converged ? "true" : "false", res.r_squared);
  } catch (const SingularMatrix& e) {
    ROS_WARN("fit_curve failed after %d iterations: %s", res.iterations, e.what());
    res.message = e.what();
  } catch (const InvalidArgument& e) {
    ROS_WARN("fit_curve rejected: %s", e.what());
    res.message = e.what();
  }
  return true;
}

} // namespace gauss_newton_regression

// Register the nodelet
#ifdef USE_PLUGINLIB_CLASS_LIST_MACROS_H
#include <pluginlib/class_list_macros.h>
#else
#include <pluginlib/class_list_macros.hpp>
#endif
PLUGINLIB_EXPORT_CLASS(gauss_newton_regression::CurveFittingNodelet, nodelet::Nodelet);
