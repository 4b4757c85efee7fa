#include "matchnet/catalog.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace matchnet {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool contains(const std::string &haystack, const std::string &needle) {
  return lower(haystack).find(needle) != std::string::npos;
}

} // namespace

const char *to_string(ComponentKind kind) {
  switch (kind) {
  case ComponentKind::Capacitor:
    return "capacitor";
  case ComponentKind::Inductor:
    return "inductor";
  case ComponentKind::Unknown:
    return "unknown";
  }
  return "unknown";
}

std::string Component::label() const {
  if (value.empty())
    return part_number;
  switch (kind) {
  case ComponentKind::Capacitor:
    return "C " + value;
  case ComponentKind::Inductor:
    return "L " + value;
  case ComponentKind::Unknown:
    break;
  }
  return value;
}

ComponentCatalog::ComponentCatalog(std::vector<ComponentPtr> components) {
  components_.reserve(components.size());
  for (auto &c : components)
    add(std::move(c));
}

void ComponentCatalog::add(ComponentPtr component) {
  if (!component) {
    throw std::invalid_argument("ComponentCatalog: null component");
  }
  if (component->network.empty()) {
    throw std::invalid_argument("ComponentCatalog: component '" +
                                component->part_number +
                                "' has no S-parameter data");
  }
  components_.push_back(std::move(component));
}

void ComponentCatalog::add(Component component) {
  add(std::make_shared<const Component>(std::move(component)));
}

std::vector<ComponentPtr> ComponentCatalog::of_kind(ComponentKind kind) const {
  std::vector<ComponentPtr> out;
  for (const auto &c : components_) {
    if (c->kind == kind)
      out.push_back(c);
  }
  return out;
}

std::vector<ComponentPtr> ComponentCatalog::capacitors() const {
  return of_kind(ComponentKind::Capacitor);
}

std::vector<ComponentPtr> ComponentCatalog::inductors() const {
  return of_kind(ComponentKind::Inductor);
}

std::vector<ComponentPtr>
ComponentCatalog::by_manufacturer(const std::string &name) const {
  std::vector<ComponentPtr> out;
  const std::string key = lower(name);
  for (const auto &c : components_) {
    if (lower(c->manufacturer) == key)
      out.push_back(c);
  }
  return out;
}

std::vector<ComponentPtr>
ComponentCatalog::search(const std::string &query) const {
  std::istringstream ss(lower(query));
  std::vector<std::string> tokens;
  std::string tok;
  while (ss >> tok)
    tokens.push_back(tok);

  std::vector<ComponentPtr> out;
  for (const auto &c : components_) {
    bool all = true;
    for (const auto &t : tokens) {
      bool hit;
      if (t == "capacitor" || t == "cap" || t == "c") {
        hit = c->kind == ComponentKind::Capacitor;
      } else if (t == "inductor" || t == "ind" || t == "l") {
        hit = c->kind == ComponentKind::Inductor;
      } else {
        hit = contains(c->manufacturer, t) || contains(c->part_number, t) ||
              contains(c->value, t);
      }
      if (!hit) {
        all = false;
        break;
      }
    }
    if (all)
      out.push_back(c);
  }
  return out;
}

ComponentCatalog ComponentCatalog::filter_by_frequency_range(double fmin,
                                                             double fmax) const {
  ComponentCatalog out;
  for (const auto &c : components_) {
    const auto &f = c->network.frequency();
    if (f.front() <= fmin && f.back() >= fmax)
      out.components_.push_back(c);
  }
  return out;
}

CoverageReport ComponentCatalog::validate_frequency_coverage(
    const std::vector<double> &device_freq, double rel_tol) const {
  CoverageReport report;
  for (const auto &c : components_) {
    const auto &cf = c->network.frequency();
    std::vector<double> missing;
    for (double f : device_freq) {
      // Nearest component sample via binary search on the sorted axis.
      auto it = std::lower_bound(cf.begin(), cf.end(), f);
      double best = std::numeric_limits<double>::infinity();
      if (it != cf.end())
        best = std::abs(*it - f);
      if (it != cf.begin())
        best = std::min(best, std::abs(*(it - 1) - f));
      double scale = std::abs(f) > 0.0 ? std::abs(f) : 1.0;
      if (best / scale >= rel_tol)
        missing.push_back(f);
    }
    if (missing.empty()) {
      report.accepted.push_back(c);
    } else {
      report.rejected.push_back({c, std::move(missing)});
    }
  }
  return report;
}

CatalogSummary ComponentCatalog::summary() const {
  CatalogSummary s;
  s.total = components_.size();
  std::set<std::string> makers;
  bool first = true;
  for (const auto &c : components_) {
    switch (c->kind) {
    case ComponentKind::Capacitor:
      ++s.capacitors;
      break;
    case ComponentKind::Inductor:
      ++s.inductors;
      break;
    case ComponentKind::Unknown:
      ++s.unknown;
      break;
    }
    if (!c->manufacturer.empty())
      makers.insert(lower(c->manufacturer));
    const auto &f = c->network.frequency();
    if (first) {
      s.min_frequency = f.front();
      s.max_frequency = f.back();
      first = false;
    } else {
      s.min_frequency = std::min(s.min_frequency, f.front());
      s.max_frequency = std::max(s.max_frequency, f.back());
    }
  }
  s.manufacturers.assign(makers.begin(), makers.end());
  return s;
}

ComponentKind infer_component_kind(const TwoPortNetwork &net) {
  if (net.size() < 2)
    return ComponentKind::Unknown;

  const double x_low = net.input_impedance(0).imag();
  const double x_high = net.input_impedance(net.size() - 1).imag();

  if (x_low < 0.0 && x_high < 0.0) {
    if (std::abs(x_low) > std::abs(x_high))
      return ComponentKind::Capacitor;
  } else if (x_low > 0.0 && x_high > 0.0) {
    if (x_high > x_low)
      return ComponentKind::Inductor;
  }

  const double x_mid = net.input_impedance(net.size() / 2).imag();
  if (x_mid < 0.0)
    return ComponentKind::Capacitor;
  if (x_mid > 0.0)
    return ComponentKind::Inductor;
  return ComponentKind::Unknown;
}

} // namespace matchnet
