#pragma once

#include <cstddef>
#include <vector>

#include <Eigen/Core>

#include "matchnet/network.hpp"

namespace matchnet {

struct NetworkCheckReport {
  int num_active_points = 0;        ///< samples with max singular value > 1 + tol
  int num_non_reciprocal_points = 0; ///< samples with |S12 - S21| > tol
  double max_singular_value = 0.0;
  double max_reciprocity_error = 0.0;
  std::vector<std::size_t> active_indices;
  std::vector<std::size_t> non_reciprocal_indices;

  bool is_passive() const { return num_active_points == 0; }
  bool is_reciprocal() const { return num_non_reciprocal_points == 0; }
  bool is_valid() const { return is_passive() && is_reciprocal(); }
};

/// A network is passive when every singular value of S is <= 1 + tolerance.
bool is_passive(const Eigen::Matrix2cd &S, double tolerance = 1e-6);

/// A two-port is reciprocal when |S12 - S21| <= tolerance.
bool is_reciprocal(const Eigen::Matrix2cd &S, double tolerance = 1e-6);

/// Check passivity and reciprocity at every sample. One-port data is only
/// checked for |S11| <= 1 + tolerance and is always reciprocal.
NetworkCheckReport check_network(const TwoPortNetwork &net,
                                 double tolerance = 1e-6);

} // namespace matchnet
