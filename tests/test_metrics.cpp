#include <cassert>
#include <cmath>
#include <complex>
#include <iostream>
#include <stdexcept>

#include "matchnet/metrics.hpp"

using namespace matchnet;
using cd = std::complex<double>;

void test_matched_point() {
  std::cout << "test_matched_point..." << std::endl;

  cd gamma = reflection_from_impedance(cd(50, 0), 50.0);
  assert(std::abs(gamma) < 1e-12);
  assert(std::abs(vswr(gamma) - 1.0) < 1e-9);
  assert(return_loss_db(gamma) > 60.0);
  assert(return_loss_db(gamma) <= kMaxReturnLossDb);
  assert(std::abs(mismatch_loss_db(gamma)) < 1e-12);
}

void test_vswr_monotonic() {
  std::cout << "test_vswr_monotonic..." << std::endl;

  double prev = vswr(0.0);
  for (int i = 1; i < 1000; ++i) {
    double g = i / 1000.0;
    double v = vswr(g);
    assert(v > prev);
    prev = v;
  }
  assert(std::abs(vswr(1.0 / 3.0) - 2.0) < 1e-12);
}

void test_total_reflection_is_finite() {
  std::cout << "test_total_reflection_is_finite..." << std::endl;

  double v = vswr(cd(-1, 0));
  assert(std::isfinite(v));
  assert(v > 1e9);
  assert(std::isfinite(vswr(1.5)));

  // Open circuit: 1 - Gamma floored.
  cd z = impedance_from_reflection(cd(1, 0), 50.0);
  assert(std::isfinite(z.real()));

  assert(std::abs(return_loss_db(cd(1, 0))) < 1e-12);
  assert(return_loss_db(0.0) == kMaxReturnLossDb);
  assert(std::abs(return_loss_db(0.1) - 20.0) < 1e-9);
}

void test_is_matched_or() {
  std::cout << "test_is_matched_or..." << std::endl;

  // Within 10 ohm tolerance.
  assert(is_matched(cd(55, 0)));
  // Outside tolerance but VSWR 1.8 <= 2.
  assert(is_matched(cd(90, 0)));
  // Outside both.
  assert(!is_matched(cd(150, 0)));
  // VSWR alone too high, impedance close enough with wide tolerance.
  assert(is_matched(cd(150, 0), 50.0, 100.0, 2.0));
}

void test_bandwidth_runs() {
  std::cout << "test_bandwidth_runs..." << std::endl;

  std::vector<double> f = {1, 2, 3, 4, 5, 6, 7};
  std::vector<double> v = {1.5, 1.5, 3.0, 1.2, 1.1, 1.9, 2.0};
  // Runs [1,2] and [4,6]: 1 + 2.
  assert(std::abs(bandwidth_from_vswr(v, f) - 3.0) < 1e-12);

  std::vector<double> none = {3, 3, 3, 3, 3, 3, 3};
  assert(bandwidth_from_vswr(none, f) == 0.0);

  // Same samples listed high to low.
  std::vector<double> f_desc(f.rbegin(), f.rend());
  std::vector<double> v_desc(v.rbegin(), v.rend());
  assert(std::abs(bandwidth_from_vswr(v_desc, f_desc) - 3.0) < 1e-12);

  // Same samples in no particular order.
  std::vector<double> f_mixed = {4, 1, 7, 3, 6, 2, 5};
  std::vector<double> v_mixed = {1.2, 1.5, 2.0, 3.0, 1.9, 1.5, 1.1};
  assert(std::abs(bandwidth_from_vswr(v_mixed, f_mixed) - 3.0) < 1e-12);

  bool threw = false;
  try {
    bandwidth_from_vswr({1.0}, f);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);
}

void test_metric_set() {
  std::cout << "test_metric_set..." << std::endl;

  std::vector<cd> gamma = {cd(0, 0), cd(0.5, 0), cd(1.0 / 3.0, 0)};
  auto m = compute_metrics(gamma, {1e9, 2e9, 3e9}, 50.0);
  assert(m.size() == 3);
  assert(std::abs(m.vswr[1] - 3.0) < 1e-12);
  assert(m.max_vswr_index() == 1);
  assert(m.min_vswr_index() == 0);
  assert(std::abs(m.max_vswr({0, 2}) - 2.0) < 1e-12);
  assert(std::abs(m.max_vswr() - 3.0) < 1e-12);

  auto p = m.at(2);
  assert(p.frequency == 3e9);
  assert(std::abs(p.impedance - cd(100, 0)) < 1e-9);

  auto single = compute_metric_point(cd(0.5, 0), 50.0, 2e9);
  assert(single.frequency == 2e9);
  assert(std::abs(single.gamma_mag - 0.5) < 1e-12);
  assert(std::abs(single.vswr - m.vswr[1]) < 1e-12);
  assert(std::abs(single.return_loss_db - m.return_loss_db[1]) < 1e-12);
  assert(std::abs(single.impedance - cd(150, 0)) < 1e-9);

  bool threw = false;
  try {
    compute_metrics(gamma, {1e9}, 50.0);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);
}

int main() {
  test_matched_point();
  test_vswr_monotonic();
  test_total_reflection_is_finite();
  test_is_matched_or();
  test_bandwidth_runs();
  test_metric_set();
  std::cout << "All metrics tests passed!" << std::endl;
  return 0;
}
