#include <cassert>
#include <cmath>
#include <complex>
#include <iostream>
#include <stdexcept>

#include "matchnet/abcd.hpp"

using namespace matchnet;
using cd = std::complex<double>;

static double max_diff(const SParams2 &a, const SParams2 &b) {
  double d = std::abs(a.s11 - b.s11);
  d = std::max(d, std::abs(a.s12 - b.s12));
  d = std::max(d, std::abs(a.s21 - b.s21));
  d = std::max(d, std::abs(a.s22 - b.s22));
  return d;
}

void test_identity_network() {
  std::cout << "test_identity_network..." << std::endl;

  SParams2 thru{cd(0, 0), cd(1, 0), cd(1, 0), cd(0, 0)};
  Eigen::Matrix2cd abcd = s_to_abcd(thru, 50.0);
  assert((abcd - Eigen::Matrix2cd::Identity()).norm() < 1e-12);

  SParams2 back = abcd_to_s(abcd, 50.0);
  assert(max_diff(back, thru) < 1e-3);
}

void test_round_trip_passive() {
  std::cout << "test_round_trip_passive..." << std::endl;

  const SParams2 cases[] = {
      {cd(0.3, 0.1), cd(0.0, 0.8), cd(0.0, 0.8), cd(-0.2, 0.3)},
      {cd(0.2, 0.1), cd(0.95, 0), cd(0.95, 0), cd(0.2, -0.1)},
      {cd(-0.5, 0.0), cd(0.5, 0.5), cd(0.5, 0.5), cd(0.1, -0.4)},
      {cd(0.5, 0), cd(0.5, 0), cd(0.5, 0), cd(0.5, 0)},
  };
  for (const auto &s : cases) {
    for (double z0 : {50.0, 75.0}) {
      SParams2 back = abcd_to_s(s_to_abcd(s, z0), z0);
      assert(max_diff(back, s) < 1e-2);
    }
  }
}

void test_series_impedance_matrix() {
  std::cout << "test_series_impedance_matrix..." << std::endl;

  // Series Z between two Z0 ports: ABCD = [[1, Z], [0, 1]].
  const double z0 = 50.0;
  const cd z(10.0, 25.0);
  SParams2 s;
  s.s11 = z / (z + 2.0 * z0);
  s.s22 = s.s11;
  s.s21 = 2.0 * z0 / (z + 2.0 * z0);
  s.s12 = s.s21;

  Eigen::Matrix2cd abcd = s_to_abcd(s, z0);
  assert(std::abs(abcd(0, 0) - cd(1, 0)) < 1e-12);
  assert(std::abs(abcd(0, 1) - z) < 1e-9);
  assert(std::abs(abcd(1, 0)) < 1e-12);
  assert(std::abs(abcd(1, 1) - cd(1, 0)) < 1e-12);
}

void test_isolation_floor() {
  std::cout << "test_isolation_floor..." << std::endl;

  // S21 = 0: denominator floored, result finite.
  SParams2 open{cd(1, 0), cd(0, 0), cd(0, 0), cd(1, 0)};
  Eigen::Matrix2cd abcd = s_to_abcd(open, 50.0);
  for (int r = 0; r < 2; ++r)
    for (int c = 0; c < 2; ++c)
      assert(std::isfinite(abcd(r, c).real()) &&
             std::isfinite(abcd(r, c).imag()));

  Eigen::Matrix2cd zero = Eigen::Matrix2cd::Zero();
  SParams2 s = abcd_to_s(zero, 50.0);
  assert(std::isfinite(s.s21.real()));
}

void test_shunt_matrix() {
  std::cout << "test_shunt_matrix..." << std::endl;

  // S11 = 0 -> Z = Z0 -> Y = 1/Z0.
  Eigen::Matrix2cd m = shunt_abcd(cd(0, 0), 50.0);
  assert(std::abs(m(0, 0) - cd(1, 0)) < 1e-15);
  assert(std::abs(m(0, 1)) < 1e-15);
  assert(std::abs(m(1, 0) - cd(1.0 / 50.0, 0)) < 1e-15);
  assert(std::abs(m(1, 1) - cd(1, 0)) < 1e-15);

  // S11 = -1 is a short: Z floored, Y large but finite.
  Eigen::Matrix2cd shorted = shunt_abcd(cd(-1, 0), 50.0);
  assert(std::isfinite(shorted(1, 0).real()));
  assert(std::abs(shorted(1, 0)) > 1e6);
}

void test_series_helpers() {
  std::cout << "test_series_helpers..." << std::endl;

  AbcdSeries acc = identity_series(3);
  AbcdSeries rhs(3, 2.0 * Eigen::Matrix2cd::Identity());
  cascade_in_place(acc, rhs);
  assert(std::abs(acc[2](0, 0) - cd(2, 0)) < 1e-15);

  AbcdSeries wrong(2, Eigen::Matrix2cd::Identity());
  bool threw = false;
  try {
    cascade_in_place(acc, wrong);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);

  auto net = abcd_series_to_network({1e9, 2e9}, identity_series(2), 50.0);
  assert(net.port_count() == PortCount::Two);
  assert(std::abs(net.s21()[1] - cd(1, 0)) < 1e-12);
  assert(std::abs(net.s11()[0]) < 1e-12);
}

int main() {
  test_identity_network();
  test_round_trip_passive();
  test_series_impedance_matrix();
  test_isolation_floor();
  test_shunt_matrix();
  test_series_helpers();
  std::cout << "All ABCD tests passed!" << std::endl;
  return 0;
}
