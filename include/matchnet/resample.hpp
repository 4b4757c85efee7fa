#pragma once

#include <vector>

#include "matchnet/network.hpp"

namespace matchnet {

/// Behaviour for target frequencies outside the source axis.
enum class ExtrapolationMode {
  Linear, ///< extend the first / last segment linearly
  Hold,   ///< repeat the first / last sample
  Reject  ///< throw std::out_of_range
};

/// Linearly interpolate the real and imaginary parts of `values` (sampled on
/// `src_freq`) onto `dst_freq` independently.
/// @throws std::invalid_argument if src_freq is empty or sizes differ
/// @throws std::out_of_range for out-of-axis targets with Reject
ComplexVec interpolate_complex(const std::vector<double> &src_freq,
                               const ComplexVec &values,
                               const std::vector<double> &dst_freq,
                               ExtrapolationMode mode = ExtrapolationMode::Linear);

/// True when both axes have the same length and every pair of samples agrees
/// within rel_tol (relative to the larger magnitude).
bool same_frequency_axis(const std::vector<double> &a,
                         const std::vector<double> &b, double rel_tol = 1e-9);

/// Resample every named array of a series onto a new axis.
FrequencySeries resample(const FrequencySeries &series,
                         const std::vector<double> &dst_freq,
                         ExtrapolationMode mode = ExtrapolationMode::Linear);

/// Resample a network onto a new axis. Returns a copy when the axes already
/// agree. Port count and reference impedance are preserved.
TwoPortNetwork resample(const TwoPortNetwork &net,
                        const std::vector<double> &dst_freq,
                        ExtrapolationMode mode = ExtrapolationMode::Linear);

} // namespace matchnet
