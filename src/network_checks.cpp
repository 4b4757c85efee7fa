#include "matchnet/network_checks.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>

namespace matchnet {

namespace {

double largest_singular_value(const Eigen::Matrix2cd &S) {
  Eigen::JacobiSVD<Eigen::Matrix2cd> svd(S);
  return svd.singularValues()(0);
}

} // namespace

bool is_passive(const Eigen::Matrix2cd &S, double tolerance) {
  return largest_singular_value(S) <= 1.0 + tolerance;
}

bool is_reciprocal(const Eigen::Matrix2cd &S, double tolerance) {
  return std::abs(S(0, 1) - S(1, 0)) <= tolerance;
}

NetworkCheckReport check_network(const TwoPortNetwork &net, double tolerance) {
  NetworkCheckReport report;
  const bool one_port = net.port_count() == PortCount::One;

  for (std::size_t i = 0; i < net.size(); ++i) {
    double sigma;
    double recip_err = 0.0;
    if (one_port) {
      sigma = std::abs(net.s11()[i]);
    } else {
      const Eigen::Matrix2cd S = sparams2_to_matrix(net.at(i));
      sigma = largest_singular_value(S);
      recip_err = std::abs(S(0, 1) - S(1, 0));
    }

    report.max_singular_value = std::max(report.max_singular_value, sigma);
    report.max_reciprocity_error =
        std::max(report.max_reciprocity_error, recip_err);

    if (sigma > 1.0 + tolerance) {
      ++report.num_active_points;
      report.active_indices.push_back(i);
    }
    if (recip_err > tolerance) {
      ++report.num_non_reciprocal_points;
      report.non_reciprocal_indices.push_back(i);
    }
  }
  return report;
}

} // namespace matchnet
