#pragma once

#include <complex>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "matchnet/topology.hpp"

namespace matchnet {

/// Weights of the four normalised sub-scores. Missing keys in a weight map
/// keep these defaults.
struct ObjectiveWeights {
  double return_loss = 0.7;
  double vswr = 0.0;
  double bandwidth = 0.2;
  double component_count = 0.1;

  double sum() const { return return_loss + vswr + bandwidth + component_count; }
};

/// Merge a map keyed "return_loss", "vswr", "bandwidth", "component_count"
/// over the defaults.
/// @throws std::invalid_argument for any other key
ObjectiveWeights weights_from_map(const std::map<std::string, double> &weights);

/// (value - min) / (max - min) clipped to [0, 1]; 0 when max <= min.
double normalize_metric(double value, double min_value, double max_value);

/// Total width (Hz) of the contiguous runs where the VSWR of the impedance
/// against target is strictly below vswr_threshold.
/// @throws std::invalid_argument if the arrays differ in length
double calculate_bandwidth(const std::vector<std::complex<double>> &impedances,
                           const std::vector<double> &frequencies,
                           double target_impedance = 50.0,
                           double vswr_threshold = 2.0);

/// Sub-scores in [0, 1] (lower is better) and the weighted cost.
struct ObjectiveBreakdown {
  double average_return_loss_db = 0.0;
  double average_vswr = 1.0;
  double bandwidth_hz = 0.0;
  std::size_t component_count = 0;

  double normalized_return_loss = 0.0; ///< 0 dB -> 1, 40 dB -> 0
  double normalized_vswr = 0.0;        ///< 1 -> 0, 10 -> 1
  double normalized_bandwidth = 0.0;   ///< full span -> 0, none -> 1
  double normalized_component_count = 0.0; ///< 0 -> 0, 5 -> 1

  double cost = 0.0;
};

/// @throws std::invalid_argument if the arrays are empty or differ in length
ObjectiveBreakdown
evaluate_objective(const std::vector<std::complex<double>> &impedances,
                   const std::vector<double> &frequencies,
                   std::size_t component_count,
                   const ObjectiveWeights &weights = ObjectiveWeights(),
                   double target_impedance = 50.0);

/// Weighted cost of a candidate network, in [0, weights.sum()] for
/// non-negative weights.
double score_candidate(const std::vector<std::complex<double>> &impedances,
                       const std::vector<double> &frequencies,
                       std::size_t component_count,
                       const ObjectiveWeights &weights = ObjectiveWeights(),
                       double target_impedance = 50.0);

double score_candidate(const std::vector<std::complex<double>> &impedances,
                       const std::vector<double> &frequencies,
                       const std::vector<ComponentCandidate> &candidates,
                       const ObjectiveWeights &weights = ObjectiveWeights(),
                       double target_impedance = 50.0);

} // namespace matchnet
