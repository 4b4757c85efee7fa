#include <algorithm>
#include <cassert>
#include <cmath>
#include <complex>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

#include "matchnet/bandwidth_search.hpp"
#include "matchnet/lumped.hpp"

using namespace matchnet;
using cd = std::complex<double>;

static std::vector<double> band_axis() {
  std::vector<double> f;
  for (int i = 0; i < 41; ++i)
    f.push_back(1.6e9 + 2e7 * i); // 1.6 - 2.4 GHz
  return f;
}

// 20 ohm resistor in series with 2 nH.
static TwoPortNetwork band_device() {
  const double pi = 3.14159265358979323846;
  auto f = band_axis();
  ComplexVec s11;
  for (double x : f)
    s11.push_back(reflection_from_impedance(cd(20.0, 2 * pi * x * 2e-9)));
  return TwoPortNetwork::one_port(f, s11);
}

static ComponentCatalog band_catalog() {
  std::vector<double> f;
  for (int i = 0; i <= 10; ++i)
    f.push_back(1e9 + 2e8 * i); // 1 - 3 GHz, coarser than the device
  return make_lumped_catalog(generate_e_series(ESeries::E12, 1e-12, 10e-12),
                             generate_e_series(ESeries::E12, 1e-9, 10e-9), f);
}

void test_preconditions() {
  std::cout << "test_preconditions..." << std::endl;

  auto device = band_device();
  auto catalog = band_catalog();

  bool threw = false;
  try {
    run_bandwidth_search(device, catalog, l_section(),
                         std::make_pair(2.2e9, 1.8e9));
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    run_bandwidth_search(device, catalog, l_section(),
                         std::make_pair(5e9, 6e9));
  } catch (const std::invalid_argument &e) {
    threw = true;
    std::cout << "  " << e.what() << std::endl;
  }
  assert(threw);
}

void test_min_max_vswr() {
  std::cout << "test_min_max_vswr..." << std::endl;

  auto device = band_device();
  auto catalog = band_catalog();
  const std::pair<double, double> range(1.9e9, 2.1e9);

  auto result = run_bandwidth_search(device, catalog, l_section(), range);
  assert(result.ok());
  assert(result.target == SearchTarget::Bandwidth);
  assert(!result.used_fallback);
  assert(result.frequency_range == range);
  assert(result.score == result.max_vswr_in_band);
  assert(result.success == (result.max_vswr_in_band <= 2.0));
  assert(result.bandwidth_hz >= 0.0);
  assert(result.bandwidth_hz <= range.second - range.first + 1.0);
  assert(std::abs(result.evaluation_frequency - 2.0e9) < 1.0);

  // Brute-force minimum of the in-band worst case.
  auto band = device.series().indices_in_range(range.first, range.second);
  CombinationEnumerator e(catalog, l_section());
  std::vector<ComponentCandidate> combo;
  double best = std::numeric_limits<double>::infinity();
  while (e.next(combo)) {
    auto net = cascade(device, combo).network;
    double worst = 0.0;
    for (std::size_t i : band)
      worst = std::max(worst, vswr(net.s11()[i]));
    best = std::min(best, worst);
  }
  assert(result.max_vswr_in_band == best);
  assert(result.iterations == e.total());

  std::cout << "  max VSWR " << result.max_vswr_in_band << ", bandwidth "
            << result.bandwidth_hz / 1e6 << " MHz, "
            << describe_network(result) << std::endl;
}

void test_full_band_overload() {
  std::cout << "test_full_band_overload..." << std::endl;

  auto device = band_device();
  auto catalog = make_lumped_catalog({2.2e-12}, {3.3e-9}, band_axis());
  auto r = run_bandwidth_search(device, catalog, l_section());
  assert(r.ok());
  assert(r.iterations == 4);
  assert(r.frequency_range.first == 1.6e9);
  assert(r.max_vswr_in_band == r.metrics.max_vswr());
}

void test_first_cascade_fallback() {
  std::cout << "test_first_cascade_fallback..." << std::endl;

  auto device = band_device();
  auto catalog = make_lumped_catalog({2.2e-12, 4.7e-12}, {3.3e-9}, band_axis());

  CombinationScorer never = [](const TwoPortNetwork &) {
    return std::numeric_limits<double>::quiet_NaN();
  };
  auto out = sweep_topology(device, catalog, l_section(), never,
                            SearchOptions(), true);
  assert(out.found);
  assert(out.used_fallback);
  assert(out.failed_combinations == out.iterations);
  assert(out.best.candidates[0].component->part_number == "C_2.2pF");
  assert(out.best.candidates[1].component->part_number == "L_3.3nH");

  auto strict = sweep_topology(device, catalog, l_section(), never,
                               SearchOptions(), false);
  assert(!strict.found);
}

void test_nothing_cascades() {
  std::cout << "test_nothing_cascades..." << std::endl;

  auto device = band_device();
  auto catalog = make_lumped_catalog({1e-12}, {1e-9}, {1.9e9, 2.0e9});

  BandwidthSearchOptions opts;
  opts.extrapolation = ExtrapolationMode::Reject;
  auto r = run_bandwidth_search(device, catalog, pi_section(),
                                std::make_pair(1.9e9, 2.0e9), opts);
  assert(r.state == SearchState::Failed);
  assert(r.iterations == 8);
  assert(r.failed_combinations == 8);
  assert(!r.used_fallback);
}

void test_single_point_band() {
  std::cout << "test_single_point_band..." << std::endl;

  std::vector<double> f = {2e9};
  auto device = TwoPortNetwork::one_port(f, {cd(0.5, 0)});
  auto catalog = make_lumped_catalog({1e-12}, {5e-9}, f);
  auto r = run_bandwidth_search(device, catalog, l_section(),
                                std::make_pair(2e9, 2e9));
  assert(r.ok());
  assert(r.iterations == 4);
  // A single sample spans no bandwidth.
  assert(r.bandwidth_hz == 0.0);
}

void test_success_uses_impedance_tolerance() {
  std::cout << "test_success_uses_impedance_tolerance..." << std::endl;

  // 120 ohm load; near-zero parts cannot bring it under VSWR 2.
  std::vector<double> f = {2e9};
  auto device = TwoPortNetwork::one_port(
      f, {reflection_from_impedance(cd(120.0, 0.0))});
  auto catalog = make_lumped_catalog({1e-15}, {1e-15}, f);

  BandwidthSearchOptions wide;
  wide.impedance_tolerance = 1e6;
  auto r = run_bandwidth_search(device, catalog, l_section(),
                                std::make_pair(2e9, 2e9), wide);
  assert(r.ok());
  assert(r.max_vswr_in_band > wide.vswr_threshold);
  assert(r.success);

  // The single-frequency search applies the same rule to the same data.
  SearchOptions single_opts;
  single_opts.impedance_tolerance = 1e6;
  auto single =
      run_single_frequency_search(device, catalog, l_section(), 2e9,
                                  single_opts);
  assert(single.ok());
  assert(single.success == r.success);

  BandwidthSearchOptions strict;
  strict.impedance_tolerance = 0.0;
  auto s = run_bandwidth_search(device, catalog, l_section(),
                                std::make_pair(2e9, 2e9), strict);
  assert(s.ok());
  assert(!s.success);
}

int main() {
  test_preconditions();
  test_min_max_vswr();
  test_full_band_overload();
  test_first_cascade_fallback();
  test_nothing_cascades();
  test_single_point_band();
  test_success_uses_impedance_tolerance();
  std::cout << "All bandwidth search tests passed!" << std::endl;
  return 0;
}
