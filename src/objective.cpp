#include "matchnet/objective.hpp"

#include <algorithm>
#include <stdexcept>

#include "matchnet/metrics.hpp"

namespace matchnet {

ObjectiveWeights weights_from_map(const std::map<std::string, double> &weights) {
  ObjectiveWeights w;
  for (const auto &kv : weights) {
    if (kv.first == "return_loss")
      w.return_loss = kv.second;
    else if (kv.first == "vswr")
      w.vswr = kv.second;
    else if (kv.first == "bandwidth")
      w.bandwidth = kv.second;
    else if (kv.first == "component_count")
      w.component_count = kv.second;
    else
      throw std::invalid_argument("Unknown objective weight: '" + kv.first +
                                  "'");
  }
  return w;
}

double normalize_metric(double value, double min_value, double max_value) {
  if (max_value <= min_value)
    return 0.0;
  const double n = (value - min_value) / (max_value - min_value);
  return std::min(1.0, std::max(0.0, n));
}

double calculate_bandwidth(const std::vector<std::complex<double>> &impedances,
                           const std::vector<double> &frequencies,
                           double target_impedance, double vswr_threshold) {
  if (impedances.size() != frequencies.size()) {
    throw std::invalid_argument(
        "calculate_bandwidth: impedance and frequency arrays differ in length");
  }
  std::vector<double> v;
  v.reserve(impedances.size());
  for (const auto &z : impedances)
    v.push_back(vswr_of_impedance(z, target_impedance));
  return bandwidth_from_vswr(v, frequencies, vswr_threshold);
}

ObjectiveBreakdown
evaluate_objective(const std::vector<std::complex<double>> &impedances,
                   const std::vector<double> &frequencies,
                   std::size_t component_count,
                   const ObjectiveWeights &weights, double target_impedance) {
  if (impedances.empty()) {
    throw std::invalid_argument("evaluate_objective: no impedance samples");
  }
  if (impedances.size() != frequencies.size()) {
    throw std::invalid_argument(
        "evaluate_objective: impedance and frequency arrays differ in length");
  }

  ObjectiveBreakdown b;
  double rl_sum = 0.0;
  double vswr_sum = 0.0;
  for (const auto &z : impedances) {
    const auto gamma = reflection_from_impedance(z, target_impedance);
    rl_sum += return_loss_db(gamma);
    vswr_sum += vswr(gamma);
  }
  const double n = static_cast<double>(impedances.size());
  b.average_return_loss_db = rl_sum / n;
  b.average_vswr = vswr_sum / n;
  b.bandwidth_hz =
      calculate_bandwidth(impedances, frequencies, target_impedance, 2.0);
  b.component_count = component_count;

  const auto extremes =
      std::minmax_element(frequencies.begin(), frequencies.end());
  const double span = *extremes.second - *extremes.first;
  b.normalized_return_loss =
      normalize_metric(-b.average_return_loss_db, -40.0, 0.0);
  b.normalized_vswr = normalize_metric(b.average_vswr - 1.0, 0.0, 9.0);
  b.normalized_bandwidth = normalize_metric(-b.bandwidth_hz, -span, 0.0);
  b.normalized_component_count =
      normalize_metric(static_cast<double>(component_count), 0.0, 5.0);

  b.cost = weights.return_loss * b.normalized_return_loss +
           weights.vswr * b.normalized_vswr +
           weights.bandwidth * b.normalized_bandwidth +
           weights.component_count * b.normalized_component_count;
  return b;
}

double score_candidate(const std::vector<std::complex<double>> &impedances,
                       const std::vector<double> &frequencies,
                       std::size_t component_count,
                       const ObjectiveWeights &weights,
                       double target_impedance) {
  return evaluate_objective(impedances, frequencies, component_count, weights,
                            target_impedance)
      .cost;
}

double score_candidate(const std::vector<std::complex<double>> &impedances,
                       const std::vector<double> &frequencies,
                       const std::vector<ComponentCandidate> &candidates,
                       const ObjectiveWeights &weights,
                       double target_impedance) {
  return score_candidate(impedances, frequencies, candidates.size(), weights,
                         target_impedance);
}

} // namespace matchnet
