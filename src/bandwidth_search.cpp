#include "matchnet/bandwidth_search.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace matchnet {

SearchResult run_bandwidth_search(const TwoPortNetwork &device,
                                  const ComponentCatalog &catalog,
                                  const Topology &topology,
                                  std::pair<double, double> range,
                                  const BandwidthSearchOptions &opts) {
  if (device.empty()) {
    throw std::invalid_argument("run_bandwidth_search: empty device");
  }
  if (!(range.first <= range.second)) {
    throw std::invalid_argument("run_bandwidth_search: invalid range");
  }
  const std::vector<std::size_t> band =
      device.series().indices_in_range(range.first, range.second);
  if (band.empty()) {
    std::ostringstream ss;
    ss << "run_bandwidth_search: no frequencies in range [" << range.first
       << ", " << range.second << "] Hz";
    throw std::invalid_argument(ss.str());
  }
  validate_topology(topology);

  SearchResult result;
  result.target = SearchTarget::Bandwidth;
  result.topology = topology.name;
  result.frequency_range = range;
  result.state = SearchState::Evaluating;

  auto start = std::chrono::steady_clock::now();

  CombinationScorer scorer = [&band](const TwoPortNetwork &net) {
    const auto &s11 = net.s11();
    double worst = 0.0;
    for (std::size_t i : band)
      worst = std::max(worst, vswr(s11[i]));
    return worst;
  };
  SweepOutcome outcome = sweep_topology(device, catalog, topology, scorer,
                                        opts, /*keep_first_on_no_winner=*/true);

  const std::size_t centre = device.series().nearest_index(
      0.5 * (device.frequency()[band.front()] + device.frequency()[band.back()]));
  detail::fill_result(result, device, outcome, centre);

  if (result.ok()) {
    result.max_vswr_in_band = result.metrics.max_vswr(band);
    if (outcome.used_fallback)
      result.score = result.max_vswr_in_band;

    std::vector<double> band_vswr, band_freq;
    band_vswr.reserve(band.size());
    band_freq.reserve(band.size());
    for (std::size_t i : band) {
      band_vswr.push_back(result.metrics.vswr[i]);
      band_freq.push_back(result.metrics.frequency[i]);
    }
    result.bandwidth_hz =
        bandwidth_from_vswr(band_vswr, band_freq, opts.bandwidth_vswr);
    result.success = true;
    for (std::size_t i : band) {
      if (!is_matched(result.metrics.impedance[i], opts.target_impedance,
                      opts.impedance_tolerance, opts.vswr_threshold)) {
        result.success = false;
        break;
      }
    }
  }

  auto end = std::chrono::steady_clock::now();
  result.duration_sec = std::chrono::duration<double>(end - start).count();

  if (opts.verbose) {
    std::cerr << "[matchnet] " << topology.name << " over ["
              << range.first / 1e9 << ", " << range.second / 1e9
              << "] GHz: " << to_string(result.state) << ", "
              << result.iterations << " iterations in " << result.duration_sec
              << " s";
    if (result.ok()) {
      std::cerr << ", max VSWR = " << result.max_vswr_in_band
                << ", bandwidth = " << result.bandwidth_hz / 1e6 << " MHz";
      if (result.used_fallback)
        std::cerr << " (fallback)";
    }
    std::cerr << "\n";
  }
  return result;
}

SearchResult run_bandwidth_search(const TwoPortNetwork &device,
                                  const ComponentCatalog &catalog,
                                  const Topology &topology,
                                  const BandwidthSearchOptions &opts) {
  if (device.empty()) {
    throw std::invalid_argument("run_bandwidth_search: empty device");
  }
  return run_bandwidth_search(
      device, catalog, topology,
      {device.series().min_frequency(), device.series().max_frequency()},
      opts);
}

} // namespace matchnet
