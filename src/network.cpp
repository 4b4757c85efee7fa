#include "matchnet/network.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "matchnet/metrics.hpp"

namespace matchnet {

namespace {

bool is_finite(std::complex<double> v) {
  return std::isfinite(v.real()) && std::isfinite(v.imag());
}

} // namespace

FrequencySeries::FrequencySeries(std::vector<double> frequency,
                                 std::map<std::string, ComplexVec> arrays)
    : freq_(std::move(frequency)), arrays_(std::move(arrays)) {
  if (freq_.empty()) {
    throw std::invalid_argument("FrequencySeries: empty frequency axis");
  }
  for (size_t i = 0; i < freq_.size(); ++i) {
    if (!std::isfinite(freq_[i])) {
      throw std::invalid_argument(
          "FrequencySeries: non-finite frequency at index " +
          std::to_string(i));
    }
    if (i > 0 && freq_[i] <= freq_[i - 1]) {
      throw std::invalid_argument(
          "FrequencySeries: frequencies must be strictly increasing (index " +
          std::to_string(i) + ")");
    }
  }
  if (arrays_.empty()) {
    throw std::invalid_argument("FrequencySeries: no data arrays");
  }
  for (const auto &kv : arrays_) {
    if (kv.second.size() != freq_.size()) {
      throw std::invalid_argument("FrequencySeries: array '" + kv.first +
                                  "' has " + std::to_string(kv.second.size()) +
                                  " samples, axis has " +
                                  std::to_string(freq_.size()));
    }
    for (size_t i = 0; i < kv.second.size(); ++i) {
      if (!is_finite(kv.second[i])) {
        throw std::invalid_argument("FrequencySeries: array '" + kv.first +
                                    "' is non-finite at index " +
                                    std::to_string(i));
      }
    }
  }
}

bool FrequencySeries::has(const std::string &name) const {
  return arrays_.count(name) != 0;
}

const ComplexVec &FrequencySeries::at(const std::string &name) const {
  auto it = arrays_.find(name);
  if (it == arrays_.end()) {
    throw std::invalid_argument("FrequencySeries: no array named '" + name +
                                "'");
  }
  return it->second;
}

std::vector<std::string> FrequencySeries::names() const {
  std::vector<std::string> out;
  out.reserve(arrays_.size());
  for (const auto &kv : arrays_)
    out.push_back(kv.first);
  return out;
}

std::size_t FrequencySeries::nearest_index(double f) const {
  if (freq_.empty()) {
    throw std::invalid_argument("FrequencySeries: empty frequency axis");
  }
  std::size_t best = 0;
  double best_dist = std::abs(freq_[0] - f);
  for (size_t i = 1; i < freq_.size(); ++i) {
    double d = std::abs(freq_[i] - f);
    if (d < best_dist) {
      best_dist = d;
      best = i;
    }
  }
  return best;
}

std::vector<std::size_t> FrequencySeries::indices_in_range(double fmin,
                                                           double fmax) const {
  std::vector<std::size_t> out;
  for (size_t i = 0; i < freq_.size(); ++i) {
    if (freq_[i] >= fmin && freq_[i] <= fmax)
      out.push_back(i);
  }
  return out;
}

TwoPortNetwork::TwoPortNetwork(FrequencySeries data, double z0,
                               PortCount ports)
    : data_(std::move(data)), z0_(z0), ports_(ports) {
  if (!(z0_ > 0.0) || !std::isfinite(z0_)) {
    throw std::invalid_argument(
        "TwoPortNetwork: reference impedance must be positive, got " +
        std::to_string(z0_));
  }
  if (data_.empty()) {
    throw std::invalid_argument("TwoPortNetwork: empty frequency series");
  }
  if (!data_.has("s11")) {
    throw std::invalid_argument("TwoPortNetwork: missing s11");
  }
  if (ports_ == PortCount::Two) {
    for (const char *name : {"s12", "s21", "s22"}) {
      if (!data_.has(name)) {
        throw std::invalid_argument(std::string("TwoPortNetwork: missing ") +
                                    name + " for two-port data");
      }
    }
  }
}

TwoPortNetwork TwoPortNetwork::one_port(std::vector<double> frequency,
                                        ComplexVec s11, double z0) {
  std::map<std::string, ComplexVec> arrays;
  arrays["s11"] = std::move(s11);
  return TwoPortNetwork(FrequencySeries(std::move(frequency), std::move(arrays)),
                        z0, PortCount::One);
}

TwoPortNetwork TwoPortNetwork::two_port(std::vector<double> frequency,
                                        ComplexVec s11, ComplexVec s12,
                                        ComplexVec s21, ComplexVec s22,
                                        double z0) {
  std::map<std::string, ComplexVec> arrays;
  arrays["s11"] = std::move(s11);
  arrays["s12"] = std::move(s12);
  arrays["s21"] = std::move(s21);
  arrays["s22"] = std::move(s22);
  return TwoPortNetwork(FrequencySeries(std::move(frequency), std::move(arrays)),
                        z0, PortCount::Two);
}

const ComplexVec &TwoPortNetwork::param(const char *name) const {
  // One-port data: s12 = s21 = s22 = s11.
  if (ports_ == PortCount::One)
    return data_.at("s11");
  return data_.at(name);
}

const ComplexVec &TwoPortNetwork::s11() const { return data_.at("s11"); }
const ComplexVec &TwoPortNetwork::s12() const { return param("s12"); }
const ComplexVec &TwoPortNetwork::s21() const { return param("s21"); }
const ComplexVec &TwoPortNetwork::s22() const { return param("s22"); }

SParams2 TwoPortNetwork::at(std::size_t i) const {
  SParams2 s;
  s.s11 = s11().at(i);
  s.s12 = s12().at(i);
  s.s21 = s21().at(i);
  s.s22 = s22().at(i);
  return s;
}

std::complex<double> TwoPortNetwork::input_impedance(std::size_t i) const {
  return impedance_from_reflection(s11().at(i), z0_);
}

} // namespace matchnet
