#include <cmath>
#include <complex>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "matchnet/bandwidth_search.hpp"
#include "matchnet/grid_search.hpp"
#include "matchnet/lumped.hpp"
#include "matchnet/metrics.hpp"
#include "matchnet/topology.hpp"

using namespace matchnet;

// Antenna-like load: 25 ohm in series with 3 nH, measured 2.0 - 2.8 GHz.
static TwoPortNetwork make_device(const std::vector<double> &freqs) {
  const double pi = 3.14159265358979323846;
  ComplexVec s11;
  s11.reserve(freqs.size());
  for (double f : freqs) {
    std::complex<double> z(25.0, 2.0 * pi * f * 3e-9);
    s11.push_back(reflection_from_impedance(z, 50.0));
  }
  return TwoPortNetwork::one_port(freqs, s11, 50.0);
}

int main(int argc, char **argv) {
  std::string topo_name = "L";
  if (argc > 1)
    topo_name = argv[1];

  std::vector<double> freqs;
  const int N = 81;
  freqs.reserve(N);
  for (int i = 0; i < N; ++i)
    freqs.push_back(2.0e9 + 0.8e9 * i / (N - 1));

  const auto device = make_device(freqs);

  // Component data over a wider span than the device.
  std::vector<double> comp_freqs;
  for (int i = 0; i <= 40; ++i)
    comp_freqs.push_back(1.5e9 + 2.0e9 * i / 40);

  auto caps = generate_e_series(ESeries::E12, 0.5e-12, 10e-12);
  auto inds = generate_e_series(ESeries::E12, 1e-9, 15e-9);
  auto catalog = make_lumped_catalog(caps, inds, comp_freqs);

  const Topology *topology = nullptr;
  try {
    topology = &topology_by_name(topo_name);
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << "\n";
    std::cerr << "Usage: " << argv[0] << " [L|Pi|T]\n";
    return 1;
  }

  std::cout << "catalog: " << caps.size() << " capacitors, " << inds.size()
            << " inductors\n";

  SearchOptions opts;
  auto single = run_single_frequency_search(device, catalog, *topology, 2.4e9,
                                            opts);
  std::cout << "single-frequency: " << describe_network(single) << "\n";
  if (single.ok()) {
    std::cout << "  |S11|=" << single.at_target.gamma_mag
              << " VSWR=" << single.at_target.vswr
              << " RL=" << single.at_target.return_loss_db << " dB"
              << " matched=" << (single.success ? "yes" : "no")
              << " iterations=" << single.iterations
              << " time=" << single.duration_sec << " s\n";
  }

  BandwidthSearchOptions bw_opts;
  auto band = run_bandwidth_search(device, catalog, *topology,
                                   std::make_pair(2.3e9, 2.5e9), bw_opts);
  std::cout << "bandwidth: " << describe_network(band) << "\n";
  if (band.ok()) {
    std::cout << "  max VSWR=" << band.max_vswr_in_band
              << " bandwidth=" << band.bandwidth_hz / 1e6 << " MHz"
              << " iterations=" << band.iterations
              << " time=" << band.duration_sec << " s\n";
  }
  return 0;
}
