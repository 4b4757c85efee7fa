#include "matchnet/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace matchnet {

std::complex<double> reflection_from_impedance(std::complex<double> z,
                                               double z0) {
  std::complex<double> denom = z + z0;
  if (std::abs(denom) < kMetricFloor)
    denom = kMetricFloor;
  return (z - z0) / denom;
}

std::complex<double> impedance_from_reflection(std::complex<double> gamma,
                                               double z0) {
  std::complex<double> denom = 1.0 - gamma;
  if (std::abs(denom) < kMetricFloor)
    denom = kMetricFloor;
  return z0 * (1.0 + gamma) / denom;
}

double vswr(double gamma_mag) {
  double rho = std::abs(gamma_mag);
  double denom = std::max(1.0 - rho, kMetricFloor);
  return (1.0 + rho) / denom;
}

double vswr(std::complex<double> gamma) { return vswr(std::abs(gamma)); }

double return_loss_db(double gamma_mag) {
  double rho = std::max(std::abs(gamma_mag), kMetricFloor);
  return std::min(-20.0 * std::log10(rho), kMaxReturnLossDb);
}

double return_loss_db(std::complex<double> gamma) {
  return return_loss_db(std::abs(gamma));
}

double mismatch_loss_db(std::complex<double> gamma) {
  double arg = std::max(1.0 - std::norm(gamma), kMetricFloor);
  return -10.0 * std::log10(arg);
}

double vswr_of_impedance(std::complex<double> z, double target) {
  return vswr(reflection_from_impedance(z, target));
}

bool is_matched(std::complex<double> z, double target, double tolerance,
                double vswr_threshold) {
  double z_error = std::abs(z - target);
  return z_error <= tolerance || vswr_of_impedance(z, target) <= vswr_threshold;
}

double bandwidth_from_vswr(const std::vector<double> &vswr_values,
                           const std::vector<double> &freqs,
                           double threshold) {
  if (vswr_values.size() != freqs.size()) {
    throw std::invalid_argument(
        "bandwidth_from_vswr: VSWR and frequency arrays differ in length");
  }
  // Samples are walked in ascending frequency whatever order they arrive in.
  std::vector<std::size_t> order(freqs.size());
  std::iota(order.begin(), order.end(), std::size_t(0));
  std::stable_sort(order.begin(), order.end(),
                   [&freqs](std::size_t a, std::size_t b) {
                     return freqs[a] < freqs[b];
                   });

  double bandwidth = 0.0;
  bool in_band = false;
  double band_start = 0.0;
  double previous = 0.0;
  for (std::size_t i : order) {
    bool meets = vswr_values[i] < threshold;
    if (meets && !in_band) {
      band_start = freqs[i];
      in_band = true;
    } else if (!meets && in_band) {
      bandwidth += previous - band_start;
      in_band = false;
    }
    previous = freqs[i];
  }
  if (in_band)
    bandwidth += previous - band_start;
  return bandwidth;
}

MetricPoint MetricSet::at(std::size_t i) const {
  MetricPoint p;
  p.frequency = frequency.at(i);
  p.gamma = gamma.at(i);
  p.gamma_mag = gamma_mag.at(i);
  p.vswr = vswr.at(i);
  p.return_loss_db = return_loss_db.at(i);
  p.impedance = impedance.at(i);
  return p;
}

double MetricSet::max_vswr(const std::vector<std::size_t> &indices) const {
  double worst = 0.0;
  if (indices.empty()) {
    for (double v : vswr)
      worst = std::max(worst, v);
    return worst;
  }
  for (std::size_t i : indices)
    worst = std::max(worst, vswr.at(i));
  return worst;
}

std::size_t MetricSet::max_vswr_index() const {
  return static_cast<std::size_t>(
      std::max_element(vswr.begin(), vswr.end()) - vswr.begin());
}

std::size_t MetricSet::min_vswr_index() const {
  return static_cast<std::size_t>(
      std::min_element(vswr.begin(), vswr.end()) - vswr.begin());
}

MetricPoint compute_metric_point(std::complex<double> gamma, double z0,
                                 double frequency) {
  MetricPoint p;
  p.frequency = frequency;
  p.gamma = gamma;
  p.gamma_mag = std::abs(gamma);
  p.vswr = vswr(p.gamma_mag);
  p.return_loss_db = return_loss_db(p.gamma_mag);
  p.impedance = impedance_from_reflection(gamma, z0);
  return p;
}

MetricSet compute_metrics(const std::vector<std::complex<double>> &gamma,
                          const std::vector<double> &freqs, double z0) {
  if (gamma.size() != freqs.size()) {
    throw std::invalid_argument(
        "compute_metrics: reflection and frequency arrays differ in length");
  }
  MetricSet m;
  m.frequency = freqs;
  m.gamma = gamma;
  m.gamma_mag.reserve(gamma.size());
  m.vswr.reserve(gamma.size());
  m.return_loss_db.reserve(gamma.size());
  m.impedance.reserve(gamma.size());
  for (std::size_t i = 0; i < gamma.size(); ++i) {
    const MetricPoint p = compute_metric_point(gamma[i], z0, freqs[i]);
    m.gamma_mag.push_back(p.gamma_mag);
    m.vswr.push_back(p.vswr);
    m.return_loss_db.push_back(p.return_loss_db);
    m.impedance.push_back(p.impedance);
  }
  return m;
}

} // namespace matchnet
