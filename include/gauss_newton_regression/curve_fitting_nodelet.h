#ifndef GAUSS_NEWTON_REGRESSION_CURVE_FITTING_NODELET_H
#define GAUSS_NEWTON_REGRESSION_CURVE_FITTING_NODELET_H

#include <ros/ros.h>
#include <nodelet/nodelet.h>

#include <gauss_newton_regression/FitCurve.h>
#include <gauss_newton_regression/RefineCoefficients.h>

#include <gauss_newton_regression/gauss_newton_regression.hpp>
#include <gauss_newton_regression/model_factory.hpp>

#include <memory>
#include <string>
#include <vector>

namespace gauss_newton_regression {

  class CurveFittingNodelet : public nodelet::Nodelet {
  public:
    CurveFittingNodelet();
    ~CurveFittingNodelet(){};

    virtual void onInit();

  private:
    bool refineCoefficients(gauss_newton_regression::RefineCoefficients::Request &req,
                            gauss_newton_regression::RefineCoefficients::Response &res);
    bool fitCurve(gauss_newton_regression::FitCurve::Request &req,
                  gauss_newton_regression::FitCurve::Response &res);

    // リクエストのモデル名・底が空ならrosparamの値を使う
    std::shared_ptr<const Model> selectModel(const std::string& name, double base) const;

    ros::NodeHandle nh;
    ros::NodeHandle pnh;
    ros::ServiceServer refineService;
    ros::ServiceServer fitService;

    // rosparam
    std::string default_model;
    double fixed_base;
    int max_iterations;
    double tolerance;
  };

} // namespace gauss_newton_regression

#endif // GAUSS_NEWTON_REGRESSION_CURVE_FITTING_NODELET_H
