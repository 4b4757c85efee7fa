#include "matchnet/cascade.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "matchnet/abcd.hpp"

namespace matchnet {

namespace {

// Full four-parameter copy of a network, one-port fallback applied.
TwoPortNetwork expand_two_port(const TwoPortNetwork &net) {
  if (net.port_count() == PortCount::Two)
    return net;
  const std::size_t n = net.size();
  ComplexVec s11(n), s12(n), s21(n), s22(n);
  for (std::size_t i = 0; i < n; ++i) {
    const SParams2 s = net.at(i);
    s11[i] = s.s11;
    s12[i] = s.s12;
    s21[i] = s.s21;
    s22[i] = s.s22;
  }
  return TwoPortNetwork::two_port(net.frequency(), std::move(s11),
                                  std::move(s12), std::move(s21),
                                  std::move(s22), net.z0());
}

} // namespace

CascadeResult cascade(const TwoPortNetwork &device,
                      const std::vector<ComponentCandidate> &candidates,
                      const Topology &topology, const CascadeOptions &opts) {
  if (candidates.size() != topology.size()) {
    throw std::invalid_argument(
        "cascade: topology '" + topology.name + "' expects " +
        std::to_string(topology.size()) + " elements, got " +
        std::to_string(candidates.size()));
  }
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    if (candidates[i].role != topology.roles[i]) {
      throw std::invalid_argument(
          "cascade: element " + std::to_string(i) + " is " +
          to_string(candidates[i].role) + " but topology '" + topology.name +
          "' requires " + to_string(topology.roles[i]));
    }
  }
  return cascade(device, candidates, opts);
}

CascadeResult cascade(const TwoPortNetwork &device,
                      const std::vector<ComponentCandidate> &candidates,
                      const CascadeOptions &opts) {
  if (device.empty()) {
    throw std::invalid_argument("cascade: device network is empty");
  }

  CascadeResult result;
  result.candidates = candidates;
  if (candidates.empty()) {
    result.network = expand_two_port(device);
    return result;
  }

  const auto &freq = device.frequency();
  AbcdSeries acc = to_abcd_series(device);

  for (const auto &cand : candidates) {
    if (!cand.component) {
      throw std::invalid_argument("cascade: candidate at position " +
                                  std::to_string(cand.position) +
                                  " has no component");
    }
    const TwoPortNetwork net =
        resample(cand.component->network, freq, opts.extrapolation);

    switch (cand.role) {
    case ConnectionRole::InLine:
      cascade_in_place(acc, to_abcd_series(net));
      break;
    case ConnectionRole::ToGround:
      cascade_in_place(acc, to_shunt_abcd_series(net));
      break;
    }
  }

  result.network = abcd_series_to_network(freq, acc, device.z0());
  return result;
}

TwoPortNetwork cascade_networks(const std::vector<TwoPortNetwork> &networks,
                                double z0) {
  if (networks.empty()) {
    throw std::invalid_argument("cascade_networks: no networks given");
  }
  const auto &freq = networks.front().frequency();
  AbcdSeries acc = identity_series(freq.size());
  for (const auto &net : networks) {
    if (!same_frequency_axis(net.frequency(), freq)) {
      throw std::invalid_argument(
          "cascade_networks: networks do not share a frequency axis");
    }
    cascade_in_place(acc, to_abcd_series(net));
  }
  return abcd_series_to_network(freq, acc, z0);
}

} // namespace matchnet
