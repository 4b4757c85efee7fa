#pragma once

#include <complex>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <Eigen/Core>

namespace matchnet {

using ComplexVec = std::vector<std::complex<double>>;

/// Frequency axis (Hz, strictly increasing) paired with named complex arrays
/// of the same length ("s11", "s21", ...). Validated on construction and
/// immutable afterwards.
class FrequencySeries {
public:
  /// Empty series. Only used as a placeholder.
  FrequencySeries() = default;

  /// @throws std::invalid_argument if the axis is empty, not strictly
  ///         increasing or non-finite, if no array is given, or if an array
  ///         length differs from the axis length or holds non-finite values.
  FrequencySeries(std::vector<double> frequency,
                  std::map<std::string, ComplexVec> arrays);

  const std::vector<double> &frequency() const { return freq_; }
  std::size_t size() const { return freq_.size(); }
  bool empty() const { return freq_.empty(); }

  bool has(const std::string &name) const;

  /// @throws std::invalid_argument if no array with this name exists.
  const ComplexVec &at(const std::string &name) const;

  std::vector<std::string> names() const;

  double min_frequency() const { return freq_.front(); }
  double max_frequency() const { return freq_.back(); }

  /// Index of the sample closest to f (first one on ties).
  std::size_t nearest_index(double f) const;

  /// Indices of samples with fmin <= f <= fmax.
  std::vector<std::size_t> indices_in_range(double fmin, double fmax) const;

private:
  std::vector<double> freq_;
  std::map<std::string, ComplexVec> arrays_;
};

/// Number of ports described by the stored data. One-port data carries only
/// s11; the remaining parameters of the two-port view fall back to s11.
enum class PortCount { One = 1, Two = 2 };

/// Two-port S-parameters at a single frequency.
struct SParams2 {
  std::complex<double> s11;
  std::complex<double> s21;
  std::complex<double> s12;
  std::complex<double> s22;
};

inline Eigen::Matrix2cd sparams2_to_matrix(const SParams2 &s) {
  Eigen::Matrix2cd S;
  S << s.s11, s.s12, s.s21, s.s22;
  return S;
}

inline SParams2 matrix_to_sparams2(const Eigen::Matrix2cd &S) {
  SParams2 result;
  result.s11 = S(0, 0);
  result.s21 = S(1, 0);
  result.s12 = S(0, 1);
  result.s22 = S(1, 1);
  return result;
}

/// Device under test or catalog component: a frequency series holding the
/// S-parameters of a two-port plus its reference impedance.
class TwoPortNetwork {
public:
  /// Empty network. Only produced as the placeholder of a failed search.
  TwoPortNetwork() = default;

  /// @param data Series holding "s11" (PortCount::One) or all of
  ///        "s11", "s12", "s21", "s22" (PortCount::Two)
  /// @param z0 Reference impedance in ohms (must be > 0)
  /// @throws std::invalid_argument on a missing array or invalid z0
  TwoPortNetwork(FrequencySeries data, double z0,
                 PortCount ports = PortCount::Two);

  static TwoPortNetwork one_port(std::vector<double> frequency, ComplexVec s11,
                                 double z0 = 50.0);

  static TwoPortNetwork two_port(std::vector<double> frequency, ComplexVec s11,
                                 ComplexVec s12, ComplexVec s21,
                                 ComplexVec s22, double z0 = 50.0);

  const FrequencySeries &series() const { return data_; }
  const std::vector<double> &frequency() const { return data_.frequency(); }
  std::size_t size() const { return data_.size(); }
  bool empty() const { return data_.empty(); }
  double z0() const { return z0_; }
  PortCount port_count() const { return ports_; }

  const ComplexVec &s11() const;
  const ComplexVec &s12() const;
  const ComplexVec &s21() const;
  const ComplexVec &s22() const;

  /// S-parameters at sample i, with the one-port fallback applied.
  SParams2 at(std::size_t i) const;

  /// Input impedance Z0 (1 + S11) / (1 - S11) at sample i.
  std::complex<double> input_impedance(std::size_t i) const;

private:
  const ComplexVec &param(const char *name) const;

  FrequencySeries data_;
  double z0_ = 50.0;
  PortCount ports_ = PortCount::Two;
};

} // namespace matchnet
