#pragma once

#include <complex>
#include <cstddef>
#include <vector>

#include <Eigen/Core>

#include "matchnet/network.hpp"

namespace matchnet {

/// Denominators smaller than this in magnitude are replaced by it during
/// S <-> ABCD conversion (near-infinite isolation, shorted shunt elements).
constexpr double kConversionFloor = 1e-12;

/// Per-frequency ABCD (transmission) matrices of one network.
using AbcdSeries = std::vector<Eigen::Matrix2cd>;

/// Convert two-port S-parameters to an ABCD matrix (Pozar, table 4.2).
/// |2 S21| below kConversionFloor is floored.
Eigen::Matrix2cd s_to_abcd(const SParams2 &s, double z0 = 50.0);

/// Convert an ABCD matrix to S-parameters. The denominator
/// A + B/Z0 + C Z0 + D is floored like s_to_abcd.
SParams2 abcd_to_s(const Eigen::Matrix2cd &abcd, double z0 = 50.0);

/// ABCD matrix of an element of impedance Z connected to ground:
/// [[1, 0], [1/Z, 1]]. Z is derived from the element's own S11 as
/// Z0 (1 + S11) / (1 - S11).
Eigen::Matrix2cd shunt_abcd(std::complex<double> s11, double z0 = 50.0);

/// ABCD matrices of a network at every frequency sample, with the one-port
/// fallback (s12 = s21 = s22 = s11) applied.
AbcdSeries to_abcd_series(const TwoPortNetwork &net);

/// Shunt-equivalent ABCD matrices built from the s11 of a network.
AbcdSeries to_shunt_abcd_series(const TwoPortNetwork &net);

AbcdSeries identity_series(std::size_t n);

/// acc[i] = acc[i] * rhs[i] for every frequency sample.
/// @throws std::invalid_argument if the series differ in length
void cascade_in_place(AbcdSeries &acc, const AbcdSeries &rhs);

/// Back-convert an ABCD series to a full two-port network.
/// @throws std::invalid_argument if abcd and frequency differ in length
TwoPortNetwork abcd_series_to_network(const std::vector<double> &frequency,
                                      const AbcdSeries &abcd, double z0);

} // namespace matchnet
