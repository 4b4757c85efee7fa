#include "matchnet/resample.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace matchnet {

namespace {

std::complex<double> lerp(double f0, double f1, std::complex<double> v0,
                          std::complex<double> v1, double f) {
  const double t = (f - f0) / (f1 - f0);
  return std::complex<double>(v0.real() + t * (v1.real() - v0.real()),
                              v0.imag() + t * (v1.imag() - v0.imag()));
}

} // namespace

ComplexVec interpolate_complex(const std::vector<double> &src_freq,
                               const ComplexVec &values,
                               const std::vector<double> &dst_freq,
                               ExtrapolationMode mode) {
  if (src_freq.empty()) {
    throw std::invalid_argument("interpolate_complex: empty source axis");
  }
  if (src_freq.size() != values.size()) {
    throw std::invalid_argument(
        "interpolate_complex: source axis and values differ in length");
  }

  const size_t n = src_freq.size();
  const double fmin = src_freq.front();
  const double fmax = src_freq.back();

  ComplexVec out;
  out.reserve(dst_freq.size());
  for (double f : dst_freq) {
    const bool outside = f < fmin || f > fmax;
    if (outside && mode == ExtrapolationMode::Reject) {
      throw std::out_of_range("interpolate_complex: frequency " +
                              std::to_string(f) + " Hz outside [" +
                              std::to_string(fmin) + ", " +
                              std::to_string(fmax) + "] Hz");
    }
    if (n == 1) {
      out.push_back(values[0]);
      continue;
    }
    if (f <= fmin) {
      out.push_back(mode == ExtrapolationMode::Linear
                        ? lerp(src_freq[0], src_freq[1], values[0], values[1], f)
                        : values[0]);
      continue;
    }
    if (f >= fmax) {
      out.push_back(mode == ExtrapolationMode::Linear
                        ? lerp(src_freq[n - 2], src_freq[n - 1], values[n - 2],
                               values[n - 1], f)
                        : values[n - 1]);
      continue;
    }
    // First sample strictly above f; f lies in [hi - 1, hi).
    size_t hi = static_cast<size_t>(
        std::upper_bound(src_freq.begin(), src_freq.end(), f) -
        src_freq.begin());
    size_t lo = hi - 1;
    out.push_back(lerp(src_freq[lo], src_freq[hi], values[lo], values[hi], f));
  }
  return out;
}

bool same_frequency_axis(const std::vector<double> &a,
                         const std::vector<double> &b, double rel_tol) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i) {
    double scale = std::max(std::abs(a[i]), std::abs(b[i]));
    if (std::abs(a[i] - b[i]) > rel_tol * std::max(scale, 1.0))
      return false;
  }
  return true;
}

FrequencySeries resample(const FrequencySeries &series,
                         const std::vector<double> &dst_freq,
                         ExtrapolationMode mode) {
  std::map<std::string, ComplexVec> arrays;
  for (const auto &name : series.names()) {
    arrays[name] =
        interpolate_complex(series.frequency(), series.at(name), dst_freq, mode);
  }
  return FrequencySeries(dst_freq, std::move(arrays));
}

TwoPortNetwork resample(const TwoPortNetwork &net,
                        const std::vector<double> &dst_freq,
                        ExtrapolationMode mode) {
  if (same_frequency_axis(net.frequency(), dst_freq))
    return net;
  return TwoPortNetwork(resample(net.series(), dst_freq, mode), net.z0(),
                        net.port_count());
}

} // namespace matchnet
