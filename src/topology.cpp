#include "matchnet/topology.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>

namespace matchnet {

namespace {

Topology make_topology(std::string name, std::vector<ConnectionRole> roles,
                       std::vector<std::vector<SlotKind>> pairings) {
  Topology t;
  t.name = std::move(name);
  t.roles = std::move(roles);
  t.pairings = std::move(pairings);
  return t;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // namespace

const char *to_string(ConnectionRole role) {
  switch (role) {
  case ConnectionRole::InLine:
    return "in-line";
  case ConnectionRole::ToGround:
    return "to-ground";
  }
  return "unknown";
}

const Topology &l_section() {
  static const Topology t = make_topology(
      "L-section", {ConnectionRole::InLine, ConnectionRole::ToGround},
      {{SlotKind::Capacitor, SlotKind::Inductor},
       {SlotKind::Inductor, SlotKind::Capacitor},
       {SlotKind::Capacitor, SlotKind::Capacitor},
       {SlotKind::Inductor, SlotKind::Inductor}});
  return t;
}

const Topology &pi_section() {
  static const Topology t = make_topology(
      "Pi-section",
      {ConnectionRole::ToGround, ConnectionRole::InLine,
       ConnectionRole::ToGround},
      {{SlotKind::Any, SlotKind::Any, SlotKind::Any}});
  return t;
}

const Topology &t_section() {
  static const Topology t = make_topology(
      "T-section",
      {ConnectionRole::InLine, ConnectionRole::ToGround,
       ConnectionRole::InLine},
      {{SlotKind::Any, SlotKind::Any, SlotKind::Any}});
  return t;
}

const Topology &topology_by_name(const std::string &name) {
  const std::string key = lower(name);
  if (key == "l" || key == "l-section")
    return l_section();
  if (key == "pi" || key == "pi-section")
    return pi_section();
  if (key == "t" || key == "t-section")
    return t_section();
  throw std::invalid_argument("Unknown topology: '" + name + "'");
}

void validate_topology(const Topology &topology) {
  for (std::size_t p = 0; p < topology.pairings.size(); ++p) {
    if (topology.pairings[p].size() != topology.roles.size()) {
      throw std::invalid_argument(
          "Topology '" + topology.name + "': pairing " + std::to_string(p) +
          " has " + std::to_string(topology.pairings[p].size()) +
          " slots for " + std::to_string(topology.roles.size()) + " roles");
    }
  }
}

CombinationEnumerator::CombinationEnumerator(const ComponentCatalog &catalog,
                                             const Topology &topology)
    : topology_(topology) {
  validate_topology(topology_);

  capacitors_ = catalog.capacitors();
  inductors_ = catalog.inductors();
  any_ = capacitors_;
  any_.insert(any_.end(), inductors_.begin(), inductors_.end());

  for (std::size_t p = 0; p < topology_.pairings.size(); ++p) {
    if (!pairing_usable(p))
      continue;
    std::size_t count = 1;
    for (SlotKind slot : topology_.pairings[p])
      count *= pool(slot).size();
    total_ += count;
  }
}

const std::vector<ComponentPtr> &
CombinationEnumerator::pool(SlotKind kind) const {
  switch (kind) {
  case SlotKind::Capacitor:
    return capacitors_;
  case SlotKind::Inductor:
    return inductors_;
  case SlotKind::Any:
    break;
  }
  return any_;
}

bool CombinationEnumerator::pairing_usable(std::size_t p) const {
  const auto &slots = topology_.pairings[p];
  if (slots.empty())
    return false;
  for (SlotKind slot : slots) {
    if (pool(slot).empty())
      return false;
  }
  return true;
}

bool CombinationEnumerator::next(std::vector<ComponentCandidate> &out) {
  while (pairing_ < topology_.pairings.size()) {
    if (!pairing_usable(pairing_)) {
      ++pairing_;
      started_ = false;
      continue;
    }

    const auto &slots = topology_.pairings[pairing_];
    if (!started_) {
      odometer_.assign(slots.size(), 0);
      started_ = true;
    } else {
      // Last position fastest.
      std::size_t pos = slots.size();
      bool carry = true;
      while (carry && pos > 0) {
        --pos;
        if (++odometer_[pos] < pool(slots[pos]).size()) {
          carry = false;
        } else {
          odometer_[pos] = 0;
        }
      }
      if (carry) {
        ++pairing_;
        started_ = false;
        continue;
      }
    }

    out.resize(slots.size());
    for (std::size_t i = 0; i < slots.size(); ++i) {
      out[i].component = pool(slots[i])[odometer_[i]];
      out[i].role = topology_.roles[i];
      out[i].position = static_cast<int>(i);
    }
    current_pairing_ = pairing_;
    return true;
  }
  return false;
}

void CombinationEnumerator::reset() {
  pairing_ = 0;
  current_pairing_ = 0;
  odometer_.clear();
  started_ = false;
}

} // namespace matchnet
