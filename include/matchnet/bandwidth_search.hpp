#pragma once

#include <utility>

#include "matchnet/grid_search.hpp"

namespace matchnet {

struct BandwidthSearchOptions : SearchOptions {
  /// VSWR level below which a sample counts towards the achieved bandwidth.
  double bandwidth_vswr = 2.0;
};

/// Exhaustive search for the assignment minimising the largest VSWR over the
/// device samples inside [range.first, range.second]. When no assignment
/// scores, the first one that cascaded is returned (used_fallback is set);
/// the state is Failed only if nothing cascaded. success is set when every
/// in-band sample passes is_matched against the target impedance.
/// @throws std::invalid_argument for an empty device, an inverted range, a
///         range holding no device sample or an inconsistent topology
SearchResult run_bandwidth_search(const TwoPortNetwork &device,
                                  const ComponentCatalog &catalog,
                                  const Topology &topology,
                                  std::pair<double, double> range,
                                  const BandwidthSearchOptions &opts =
                                      BandwidthSearchOptions());

/// Same, over the whole device axis.
SearchResult run_bandwidth_search(const TwoPortNetwork &device,
                                  const ComponentCatalog &catalog,
                                  const Topology &topology,
                                  const BandwidthSearchOptions &opts =
                                      BandwidthSearchOptions());

} // namespace matchnet
