#include "ros/ros.h"
#include "gauss_newton_regression/FitCurve.h"

#include <cstdlib>
#include <vector>

int main(int argc, char **argv)
{
  ros::init(argc, argv, "fit_curve_client");
  if (argc < 3)
    {
      ROS_INFO("usage: fit_curve_client MODEL C0 [C1 ...]  (samples from ~x and ~y)");
      return 1;
    }

  ros::NodeHandle nh;
  ros::NodeHandle pnh("~");

  gauss_newton_regression::FitCurve srv;
  srv.request.model = argv[1];
  for (int i = 2; i < argc; ++i)
    {
      srv.request.initial_coefficients.push_back(atof(argv[i]));
    }
  pnh.param("fixed_base", srv.request.fixed_base, 0.0);
  pnh.param("max_iterations", srv.request.max_iterations, 0);
  if (!pnh.getParam("x", srv.request.x) || !pnh.getParam("y", srv.request.y))
    {
      ROS_ERROR("sample data not set: ~x and ~y are required");
      return 1;
    }

  ros::ServiceClient client = nh.serviceClient<gauss_newton_regression::FitCurve>("/CurveFitting/fit_curve");
  if (client.call(srv))
    {
      if (srv.response.success)
        {
          ROS_INFO("Fit finished in %d iterations (converged: %s)", srv.response.iterations,
                   srv.response.converged ? "yes" : "no");
          for (size_t i = 0; i < srv.response.coefficients.size(); ++i)
            {
              ROS_INFO("Coefficient %zu: %f", i, srv.response.coefficients[i]);
            }
          ROS_INFO("R-squared: %f", srv.response.r_squared);
        }
      else
        {
          ROS_WARN("Fit failed: %s", srv.response.message.c_str());
        }
    }
  else
    {
      ROS_ERROR("Failed to call service fit_curve");
      return 1;
    }

  return 0;
}
