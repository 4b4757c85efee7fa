#pragma once

#include <vector>

#include "matchnet/network.hpp"
#include "matchnet/resample.hpp"
#include "matchnet/topology.hpp"

namespace matchnet {

struct CascadeOptions {
  ExtrapolationMode extrapolation = ExtrapolationMode::Linear;
};

/// Device followed by its matching elements, collapsed into one two-port on
/// the device's frequency axis.
struct CascadeResult {
  TwoPortNetwork network;
  std::vector<ComponentCandidate> candidates;

  const std::vector<double> &frequency() const { return network.frequency(); }
};

/// Cascade a device with matching elements placed as the topology prescribes.
/// Candidate data is resampled onto the device axis; in-line elements enter
/// through their own ABCD matrix, to-ground elements through
/// [[1, 0], [1/Z, 1]] with Z taken from their S11. Matrices are multiplied on
/// the right in candidate order. With no candidates the device is returned as
/// a full two-port.
/// @throws std::invalid_argument if the candidate count or a role disagrees
///         with the topology, or a candidate has no component
CascadeResult cascade(const TwoPortNetwork &device,
                      const std::vector<ComponentCandidate> &candidates,
                      const Topology &topology,
                      const CascadeOptions &opts = CascadeOptions());

/// Same as above, using each candidate's own role.
CascadeResult cascade(const TwoPortNetwork &device,
                      const std::vector<ComponentCandidate> &candidates,
                      const CascadeOptions &opts = CascadeOptions());

/// In-line composition of networks sharing one frequency axis.
/// @throws std::invalid_argument if the list is empty or the axes differ
TwoPortNetwork cascade_networks(const std::vector<TwoPortNetwork> &networks,
                                double z0 = 50.0);

} // namespace matchnet
