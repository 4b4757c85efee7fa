#pragma once

#include <complex>
#include <string>
#include <vector>

#include "matchnet/catalog.hpp"
#include "matchnet/network.hpp"

namespace matchnet {

/// IEC 60063 preferred-number series.
enum class ESeries { E12, E24, E96 };

/// Base values of one decade (1.0 ... < 10.0).
const std::vector<double> &e_series_base(ESeries series);

/// All series values in [min_value, max_value], ascending.
/// @throws std::invalid_argument unless 0 < min_value <= max_value
std::vector<double> generate_e_series(ESeries series, double min_value,
                                      double max_value);

/// Standard values for a component kind: capacitors 1 pF to 100 uF,
/// inductors 1 nH to 100 mH.
/// @throws std::invalid_argument for ComponentKind::Unknown
std::vector<double> standard_values(ESeries series, ComponentKind kind);

/// Nearest standard value (absolute distance) to `value`.
double snap_to_standard(double value, ESeries series, ComponentKind kind);

/// Engineering notation with an SI prefix, e.g. (1.2e-11, "F") -> "12pF",
/// (5.6e-9, "H") -> "5.6nH". Up to three significant digits.
std::string format_engineering(double value, const std::string &unit);

/// Impedance of an ideal capacitor (1 / j w C) or inductor (j w L).
std::complex<double> element_impedance(ComponentKind kind, double value,
                                       double frequency);

/// Two-port of an ideal series element of impedance Z:
/// S11 = S22 = Z / (Z + 2 Z0), S21 = S12 = 2 Z0 / (Z + 2 Z0).
/// @throws std::invalid_argument for a non-positive value or unknown kind
TwoPortNetwork series_element_network(ComponentKind kind, double value,
                                      const std::vector<double> &frequency,
                                      double z0 = 50.0);

/// Catalog entry for an ideal series element, part number "C_12pF" etc.
Component make_lumped_component(ComponentKind kind, double value,
                                const std::vector<double> &frequency,
                                double z0 = 50.0);

/// One ideal component per value, in the order given.
ComponentCatalog make_lumped_catalog(const std::vector<double> &capacitances,
                                     const std::vector<double> &inductances,
                                     const std::vector<double> &frequency,
                                     double z0 = 50.0);

} // namespace matchnet
