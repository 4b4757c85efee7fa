#include "matchnet/lumped.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace matchnet {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Slack on range endpoints so that 1.0 * 10^-12 counts as >= 1e-12.
constexpr double kRangeSlack = 1e-9;

const std::vector<double> kE12 = {1.0, 1.2, 1.5, 1.8, 2.2, 2.7,
                                  3.3, 3.9, 4.7, 5.6, 6.8, 8.2};

const std::vector<double> kE24 = {1.0, 1.1, 1.2, 1.3, 1.5, 1.6, 1.8, 2.0,
                                  2.2, 2.4, 2.7, 3.0, 3.3, 3.6, 3.9, 4.3,
                                  4.7, 5.1, 5.6, 6.2, 6.8, 7.5, 8.2, 9.1};

const std::vector<double> kE96 = {
    1.00, 1.02, 1.05, 1.07, 1.10, 1.13, 1.15, 1.18, 1.21, 1.24, 1.27, 1.30,
    1.33, 1.37, 1.40, 1.43, 1.47, 1.50, 1.54, 1.58, 1.62, 1.65, 1.69, 1.74,
    1.78, 1.82, 1.87, 1.91, 1.96, 2.00, 2.05, 2.10, 2.15, 2.21, 2.26, 2.32,
    2.37, 2.43, 2.49, 2.55, 2.61, 2.67, 2.74, 2.80, 2.87, 2.94, 3.01, 3.09,
    3.16, 3.24, 3.32, 3.40, 3.48, 3.57, 3.65, 3.74, 3.83, 3.92, 4.02, 4.12,
    4.22, 4.32, 4.42, 4.53, 4.64, 4.75, 4.87, 4.99, 5.11, 5.23, 5.36, 5.49,
    5.62, 5.76, 5.90, 6.04, 6.19, 6.34, 6.49, 6.65, 6.81, 6.98, 7.15, 7.32,
    7.50, 7.68, 7.87, 8.06, 8.25, 8.45, 8.66, 8.87, 9.09, 9.31, 9.53, 9.76};

} // namespace

const std::vector<double> &e_series_base(ESeries series) {
  switch (series) {
  case ESeries::E12:
    return kE12;
  case ESeries::E24:
    return kE24;
  case ESeries::E96:
    return kE96;
  }
  throw std::invalid_argument("e_series_base: unknown series");
}

std::vector<double> generate_e_series(ESeries series, double min_value,
                                      double max_value) {
  if (!(min_value > 0.0) || max_value < min_value) {
    throw std::invalid_argument("generate_e_series: invalid range");
  }
  const auto &base = e_series_base(series);
  const int lo = static_cast<int>(std::floor(std::log10(min_value)));
  const int hi = static_cast<int>(std::ceil(std::log10(max_value)));

  std::vector<double> values;
  for (int k = lo; k <= hi; ++k) {
    const double decade = std::pow(10.0, k);
    for (double b : base) {
      const double v = b * decade;
      if (v >= min_value * (1.0 - kRangeSlack) &&
          v <= max_value * (1.0 + kRangeSlack))
        values.push_back(v);
    }
  }
  std::sort(values.begin(), values.end());
  return values;
}

std::vector<double> standard_values(ESeries series, ComponentKind kind) {
  switch (kind) {
  case ComponentKind::Capacitor:
    return generate_e_series(series, 1e-12, 100e-6);
  case ComponentKind::Inductor:
    return generate_e_series(series, 1e-9, 100e-3);
  case ComponentKind::Unknown:
    break;
  }
  throw std::invalid_argument("standard_values: component kind must be "
                              "capacitor or inductor");
}

double snap_to_standard(double value, ESeries series, ComponentKind kind) {
  const auto values = standard_values(series, kind);
  double best = values.front();
  for (double v : values) {
    if (std::abs(v - value) < std::abs(best - value))
      best = v;
  }
  return best;
}

std::string format_engineering(double value, const std::string &unit) {
  struct Prefix {
    double scale;
    const char *symbol;
  };
  static const std::array<Prefix, 9> prefixes = {{{1e9, "G"},
                                                  {1e6, "M"},
                                                  {1e3, "k"},
                                                  {1.0, ""},
                                                  {1e-3, "m"},
                                                  {1e-6, "u"},
                                                  {1e-9, "n"},
                                                  {1e-12, "p"},
                                                  {1e-15, "f"}}};

  if (value == 0.0 || !std::isfinite(value)) {
    std::ostringstream ss;
    ss << value << unit;
    return ss.str();
  }

  const double mag = std::abs(value);
  std::size_t idx = prefixes.size() - 1;
  for (std::size_t i = 0; i < prefixes.size(); ++i) {
    if (mag >= prefixes[i].scale * (1.0 - kRangeSlack)) {
      idx = i;
      break;
    }
  }

  double mantissa = value / prefixes[idx].scale;
  // Three significant digits; 999.9 rounds into the next prefix.
  const int digits = std::abs(mantissa) >= 100.0 ? 0
                     : std::abs(mantissa) >= 10.0 ? 1
                                                  : 2;
  const double factor = std::pow(10.0, digits);
  mantissa = std::round(mantissa * factor) / factor;
  if (std::abs(mantissa) >= 1000.0 && idx > 0) {
    --idx;
    mantissa /= 1000.0;
  }

  // Past the largest prefix the mantissa keeps all its integer digits.
  int precision = 3;
  if (std::abs(mantissa) >= 1000.0)
    precision =
        static_cast<int>(std::floor(std::log10(std::abs(mantissa)))) + 1;

  std::ostringstream ss;
  ss << std::setprecision(precision) << mantissa << prefixes[idx].symbol
     << unit;
  return ss.str();
}

std::complex<double> element_impedance(ComponentKind kind, double value,
                                       double frequency) {
  const double omega = 2.0 * kPi * frequency;
  switch (kind) {
  case ComponentKind::Capacitor:
    return std::complex<double>(0.0, -1.0 / (omega * value));
  case ComponentKind::Inductor:
    return std::complex<double>(0.0, omega * value);
  case ComponentKind::Unknown:
    break;
  }
  throw std::invalid_argument("element_impedance: unknown component kind");
}

TwoPortNetwork series_element_network(ComponentKind kind, double value,
                                      const std::vector<double> &frequency,
                                      double z0) {
  if (!(value > 0.0)) {
    throw std::invalid_argument("series_element_network: value must be "
                                "positive");
  }
  if (kind == ComponentKind::Unknown) {
    throw std::invalid_argument("series_element_network: unknown component "
                                "kind");
  }
  const size_t n = frequency.size();
  ComplexVec s11(n), s21(n);
  for (size_t i = 0; i < n; ++i) {
    const std::complex<double> z = element_impedance(kind, value, frequency[i]);
    const std::complex<double> denom = z + 2.0 * z0;
    s11[i] = z / denom;
    s21[i] = 2.0 * z0 / denom;
  }
  ComplexVec s22 = s11;
  ComplexVec s12 = s21;
  return TwoPortNetwork::two_port(frequency, std::move(s11), std::move(s12),
                                  std::move(s21), std::move(s22), z0);
}

Component make_lumped_component(ComponentKind kind, double value,
                                const std::vector<double> &frequency,
                                double z0) {
  Component c;
  c.kind = kind;
  c.value_nominal = value;
  c.value = format_engineering(
      value, kind == ComponentKind::Inductor ? "H" : "F");
  c.part_number =
      std::string(kind == ComponentKind::Inductor ? "L_" : "C_") + c.value;
  c.manufacturer = "ideal";
  c.network = series_element_network(kind, value, frequency, z0);
  return c;
}

ComponentCatalog make_lumped_catalog(const std::vector<double> &capacitances,
                                     const std::vector<double> &inductances,
                                     const std::vector<double> &frequency,
                                     double z0) {
  ComponentCatalog catalog;
  for (double c : capacitances)
    catalog.add(make_lumped_component(ComponentKind::Capacitor, c, frequency,
                                      z0));
  for (double l : inductances)
    catalog.add(make_lumped_component(ComponentKind::Inductor, l, frequency,
                                      z0));
  return catalog;
}

} // namespace matchnet
