#pragma once

#include <complex>
#include <cstddef>
#include <vector>

namespace matchnet {

/// Floor applied to |Gamma|, 1 - |Gamma| and 1 - Gamma before division or
/// logarithm. A total reflection therefore gives a large finite VSWR
/// (about 2e10), never infinity or NaN.
constexpr double kMetricFloor = 1e-10;

/// Return loss is reported no higher than this (dB).
constexpr double kMaxReturnLossDb = 100.0;

/// Gamma = (Z - Z0) / (Z + Z0)
std::complex<double> reflection_from_impedance(std::complex<double> z,
                                               double z0 = 50.0);

/// Z = Z0 (1 + Gamma) / (1 - Gamma), with |1 - Gamma| floored at kMetricFloor.
std::complex<double> impedance_from_reflection(std::complex<double> gamma,
                                               double z0 = 50.0);

/// VSWR = (1 + |Gamma|) / max(1 - |Gamma|, kMetricFloor).
/// Monotonically increasing in |Gamma| on [0, 1).
double vswr(double gamma_mag);
double vswr(std::complex<double> gamma);

/// -20 log10(max(|Gamma|, kMetricFloor)), capped at kMaxReturnLossDb.
double return_loss_db(double gamma_mag);
double return_loss_db(std::complex<double> gamma);

/// -10 log10(max(1 - |Gamma|^2, kMetricFloor))
double mismatch_loss_db(std::complex<double> gamma);

/// VSWR of an impedance measured against a (real) target impedance.
double vswr_of_impedance(std::complex<double> z, double target = 50.0);

/// True when |Z - target| <= tolerance OR the VSWR of Z against target is
/// at most vswr_threshold. Either criterion alone certifies a match.
bool is_matched(std::complex<double> z, double target = 50.0,
                double tolerance = 10.0, double vswr_threshold = 2.0);

/// Total width (Hz) of the contiguous runs of samples whose VSWR is strictly
/// below threshold, taken in ascending frequency order. A run of one sample
/// contributes nothing.
double bandwidth_from_vswr(const std::vector<double> &vswr_values,
                           const std::vector<double> &freqs,
                           double threshold = 2.0);

/// Metrics at a single frequency.
struct MetricPoint {
  double frequency = 0.0;
  std::complex<double> gamma;
  double gamma_mag = 0.0;
  double vswr = 1.0;
  double return_loss_db = kMaxReturnLossDb;
  std::complex<double> impedance;
};

/// Metrics across a band, derived from a reflection array.
struct MetricSet {
  std::vector<double> frequency;
  std::vector<std::complex<double>> gamma;
  std::vector<double> gamma_mag;
  std::vector<double> vswr;
  std::vector<double> return_loss_db;
  std::vector<std::complex<double>> impedance;

  std::size_t size() const { return gamma_mag.size(); }
  bool empty() const { return gamma_mag.empty(); }

  MetricPoint at(std::size_t i) const;

  /// Largest VSWR over the given indices (all samples when empty).
  double max_vswr(const std::vector<std::size_t> &indices = {}) const;

  /// Index of the largest / smallest VSWR over all samples.
  std::size_t max_vswr_index() const;
  std::size_t min_vswr_index() const;
};

/// Gamma magnitude, VSWR, return loss and impedance of one reflection sample.
MetricPoint compute_metric_point(std::complex<double> gamma, double z0,
                                 double frequency = 0.0);

/// @throws std::invalid_argument if the arrays differ in length
MetricSet compute_metrics(const std::vector<std::complex<double>> &gamma,
                          const std::vector<double> &freqs, double z0);

} // namespace matchnet
