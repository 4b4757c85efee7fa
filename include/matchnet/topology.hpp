#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "matchnet/catalog.hpp"

namespace matchnet {

/// How a matching element is connected between the device and the load.
enum class ConnectionRole {
  InLine,  ///< series element in the signal path
  ToGround ///< shunt element from the signal path to ground
};

const char *to_string(ConnectionRole role);

/// Which catalog pool a topology position draws from.
enum class SlotKind {
  Capacitor,
  Inductor,
  Any ///< capacitors followed by inductors
};

/// A fixed ladder arrangement: one connection role per position plus the
/// type pairings tried, in order. Every pairing has one slot per role.
struct Topology {
  std::string name;
  std::vector<ConnectionRole> roles;
  std::vector<std::vector<SlotKind>> pairings;

  std::size_t size() const { return roles.size(); }
};

/// In-line then to-ground. Pairings (C, L), (L, C), (C, C), (L, L).
const Topology &l_section();

/// To-ground, in-line, to-ground over every capacitor and inductor.
const Topology &pi_section();

/// In-line, to-ground, in-line over every capacitor and inductor.
const Topology &t_section();

/// Lookup by name, case-insensitive: "L", "L-section", "Pi", "Pi-section",
/// "T", "T-section".
/// @throws std::invalid_argument for any other name
const Topology &topology_by_name(const std::string &name);

/// @throws std::invalid_argument if a pairing length differs from the
///         number of roles
void validate_topology(const Topology &topology);

/// A catalog element placed at one position of a topology.
struct ComponentCandidate {
  ComponentPtr component;
  ConnectionRole role = ConnectionRole::InLine;
  int position = 0;
};

/// Walks every component assignment of a topology over a catalog in a fixed
/// order: pairing by pairing, and within a pairing the Cartesian product of
/// the slot pools with the last position varying fastest. Components of
/// unknown kind never take part; a pairing with an empty pool is skipped.
class CombinationEnumerator {
public:
  /// @throws std::invalid_argument if the topology is inconsistent
  CombinationEnumerator(const ComponentCatalog &catalog,
                        const Topology &topology);

  /// Number of assignments the enumerator will produce.
  std::size_t total() const { return total_; }

  /// Write the next assignment into `out`. Returns false when exhausted.
  bool next(std::vector<ComponentCandidate> &out);

  /// Pairing of the assignment last returned by next().
  std::size_t pairing_index() const { return current_pairing_; }

  void reset();

private:
  const std::vector<ComponentPtr> &pool(SlotKind kind) const;
  bool pairing_usable(std::size_t p) const;

  Topology topology_;
  std::vector<ComponentPtr> capacitors_;
  std::vector<ComponentPtr> inductors_;
  std::vector<ComponentPtr> any_;

  std::size_t total_ = 0;

  std::size_t pairing_ = 0;
  std::size_t current_pairing_ = 0;
  std::vector<std::size_t> odometer_;
  bool started_ = false;
};

} // namespace matchnet
