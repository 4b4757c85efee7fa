#include "matchnet/abcd.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace matchnet {

namespace {

std::complex<double> floored(std::complex<double> v) {
  if (std::abs(v) < kConversionFloor)
    return std::complex<double>(kConversionFloor, 0.0);
  return v;
}

} // namespace

Eigen::Matrix2cd s_to_abcd(const SParams2 &s, double z0) {
  const std::complex<double> one(1.0, 0.0);
  const std::complex<double> s12s21 = s.s12 * s.s21;
  const std::complex<double> denom = floored(2.0 * s.s21);

  Eigen::Matrix2cd abcd;
  // A
  abcd(0, 0) = ((one + s.s11) * (one - s.s22) + s12s21) / denom;
  // B
  abcd(0, 1) = z0 * ((one + s.s11) * (one + s.s22) - s12s21) / denom;
  // C
  abcd(1, 0) = (1.0 / z0) * ((one - s.s11) * (one - s.s22) - s12s21) / denom;
  // D
  abcd(1, 1) = ((one - s.s11) * (one + s.s22) + s12s21) / denom;
  return abcd;
}

SParams2 abcd_to_s(const Eigen::Matrix2cd &abcd, double z0) {
  const std::complex<double> A = abcd(0, 0);
  const std::complex<double> B = abcd(0, 1);
  const std::complex<double> C = abcd(1, 0);
  const std::complex<double> D = abcd(1, 1);

  const std::complex<double> denom = floored(A + B / z0 + C * z0 + D);

  SParams2 s;
  s.s11 = (A + B / z0 - C * z0 - D) / denom;
  s.s12 = 2.0 * (A * D - B * C) / denom;
  s.s21 = 2.0 / denom;
  s.s22 = (-A + B / z0 - C * z0 + D) / denom;
  return s;
}

Eigen::Matrix2cd shunt_abcd(std::complex<double> s11, double z0) {
  const std::complex<double> z = z0 * (1.0 + s11) / floored(1.0 - s11);
  Eigen::Matrix2cd abcd;
  abcd << 1.0, 0.0, 1.0 / floored(z), 1.0;
  return abcd;
}

AbcdSeries to_abcd_series(const TwoPortNetwork &net) {
  AbcdSeries out;
  out.reserve(net.size());
  for (size_t i = 0; i < net.size(); ++i)
    out.push_back(s_to_abcd(net.at(i), net.z0()));
  return out;
}

AbcdSeries to_shunt_abcd_series(const TwoPortNetwork &net) {
  const auto &s11 = net.s11();
  AbcdSeries out;
  out.reserve(s11.size());
  for (const auto &g : s11)
    out.push_back(shunt_abcd(g, net.z0()));
  return out;
}

AbcdSeries identity_series(std::size_t n) {
  return AbcdSeries(n, Eigen::Matrix2cd::Identity());
}

void cascade_in_place(AbcdSeries &acc, const AbcdSeries &rhs) {
  if (acc.size() != rhs.size()) {
    throw std::invalid_argument("cascade_in_place: " +
                                std::to_string(acc.size()) + " vs " +
                                std::to_string(rhs.size()) + " samples");
  }
  for (size_t i = 0; i < acc.size(); ++i) {
    Eigen::Matrix2cd product = acc[i] * rhs[i];
    acc[i] = product;
  }
}

TwoPortNetwork abcd_series_to_network(const std::vector<double> &frequency,
                                      const AbcdSeries &abcd, double z0) {
  if (abcd.size() != frequency.size()) {
    throw std::invalid_argument(
        "abcd_series_to_network: matrix count does not match frequency count");
  }
  const size_t n = abcd.size();
  ComplexVec s11(n), s12(n), s21(n), s22(n);
  for (size_t i = 0; i < n; ++i) {
    SParams2 s = abcd_to_s(abcd[i], z0);
    s11[i] = s.s11;
    s12[i] = s.s12;
    s21[i] = s.s21;
    s22[i] = s.s22;
  }
  return TwoPortNetwork::two_port(frequency, std::move(s11), std::move(s12),
                                  std::move(s21), std::move(s22), z0);
}

} // namespace matchnet
