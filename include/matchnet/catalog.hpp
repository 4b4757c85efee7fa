#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "matchnet/network.hpp"

namespace matchnet {

enum class ComponentKind { Capacitor, Inductor, Unknown };

const char *to_string(ComponentKind kind);

/// A catalog element: a measured (or synthesised) network plus metadata.
struct Component {
  std::string part_number;
  std::string manufacturer;
  std::string value;          ///< display value, e.g. "10pF"
  double value_nominal = 0.0; ///< farads or henries, 0 when unknown
  ComponentKind kind = ComponentKind::Unknown;
  TwoPortNetwork network;

  /// "C 10pF", "L 5.6nH", or the part number when no value is known.
  std::string label() const;
};

using ComponentPtr = std::shared_ptr<const Component>;

struct CoverageRejection {
  ComponentPtr component;
  std::vector<double> missing_frequencies;
};

struct CoverageReport {
  std::vector<ComponentPtr> accepted;
  std::vector<CoverageRejection> rejected;
};

struct CatalogSummary {
  std::size_t total = 0;
  std::size_t capacitors = 0;
  std::size_t inductors = 0;
  std::size_t unknown = 0;
  std::vector<std::string> manufacturers;
  double min_frequency = 0.0; ///< lowest frequency of any component (Hz)
  double max_frequency = 0.0; ///< highest frequency of any component (Hz)
};

/// Ordered collection of components. Order is insertion order and fixes the
/// enumeration order of the searches.
class ComponentCatalog {
public:
  ComponentCatalog() = default;
  explicit ComponentCatalog(std::vector<ComponentPtr> components);

  /// @throws std::invalid_argument for a null pointer or an empty network
  void add(ComponentPtr component);
  void add(Component component);

  const std::vector<ComponentPtr> &components() const { return components_; }
  std::size_t size() const { return components_.size(); }
  bool empty() const { return components_.empty(); }

  std::vector<ComponentPtr> of_kind(ComponentKind kind) const;
  std::vector<ComponentPtr> capacitors() const;
  std::vector<ComponentPtr> inductors() const;
  std::vector<ComponentPtr> by_manufacturer(const std::string &name) const;

  /// Whitespace-separated tokens, all of which must match (case-insensitive).
  /// "capacitor"/"cap"/"c" and "inductor"/"ind"/"l" select a kind; any other
  /// token matches a substring of manufacturer, part number or value.
  std::vector<ComponentPtr> search(const std::string &query) const;

  /// Components whose axis spans [fmin, fmax] completely.
  ComponentCatalog filter_by_frequency_range(double fmin, double fmax) const;

  /// Split components by whether they hold a sample within rel_tol of every
  /// device frequency.
  CoverageReport
  validate_frequency_coverage(const std::vector<double> &device_freq,
                              double rel_tol = 0.01) const;

  CatalogSummary summary() const;

private:
  std::vector<ComponentPtr> components_;
};

/// Classify a component from the reactance of Z0 (1 + S11) / (1 - S11):
/// negative and shrinking in magnitude with frequency -> capacitor, positive
/// and growing -> inductor; otherwise the sign at the centre sample decides.
ComponentKind infer_component_kind(const TwoPortNetwork &net);

} // namespace matchnet
