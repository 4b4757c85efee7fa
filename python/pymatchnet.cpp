#include <pybind11/complex.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "matchnet/abcd.hpp"
#include "matchnet/bandwidth_search.hpp"
#include "matchnet/cascade.hpp"
#include "matchnet/catalog.hpp"
#include "matchnet/grid_search.hpp"
#include "matchnet/lumped.hpp"
#include "matchnet/metrics.hpp"
#include "matchnet/network.hpp"
#include "matchnet/network_checks.hpp"
#include "matchnet/objective.hpp"
#include "matchnet/resample.hpp"
#include "matchnet/topology.hpp"

namespace py = pybind11;
using namespace matchnet;

namespace {

std::vector<Component> copy_components(const std::vector<ComponentPtr> &ptrs) {
  std::vector<Component> out;
  out.reserve(ptrs.size());
  for (const auto &p : ptrs)
    out.push_back(*p);
  return out;
}

} // namespace

PYBIND11_MODULE(pymatchnet, m) {
  m.doc() = "Python bindings for the MatchNet impedance-matching library.";

  // Data model
  py::enum_<PortCount>(m, "PortCount")
      .value("One", PortCount::One)
      .value("Two", PortCount::Two);

  py::class_<SParams2>(m, "SParams2", "Two-port S-parameters at one frequency.")
      .def(py::init<>())
      .def_readwrite("s11", &SParams2::s11)
      .def_readwrite("s21", &SParams2::s21)
      .def_readwrite("s12", &SParams2::s12)
      .def_readwrite("s22", &SParams2::s22);

  py::class_<TwoPortNetwork>(m, "TwoPortNetwork",
                             "S-parameters of a device or component.")
      .def_static("one_port", &TwoPortNetwork::one_port, py::arg("frequency"),
                  py::arg("s11"), py::arg("z0") = 50.0)
      .def_static("two_port", &TwoPortNetwork::two_port, py::arg("frequency"),
                  py::arg("s11"), py::arg("s12"), py::arg("s21"),
                  py::arg("s22"), py::arg("z0") = 50.0)
      .def_property_readonly("frequency", &TwoPortNetwork::frequency)
      .def_property_readonly("z0", &TwoPortNetwork::z0)
      .def_property_readonly("port_count", &TwoPortNetwork::port_count)
      .def_property_readonly("s11", &TwoPortNetwork::s11)
      .def_property_readonly("s12", &TwoPortNetwork::s12)
      .def_property_readonly("s21", &TwoPortNetwork::s21)
      .def_property_readonly("s22", &TwoPortNetwork::s22)
      .def("__len__", &TwoPortNetwork::size)
      .def("at", &TwoPortNetwork::at, "S-parameters at sample i.")
      .def("input_impedance", &TwoPortNetwork::input_impedance);

  // Conversions
  m.def("s_to_abcd", &s_to_abcd, py::arg("s"), py::arg("z0") = 50.0,
        "Convert S-parameters to an ABCD matrix.");
  m.def("abcd_to_s", &abcd_to_s, py::arg("abcd"), py::arg("z0") = 50.0,
        "Convert an ABCD matrix to S-parameters.");
  m.def("shunt_abcd", &shunt_abcd, py::arg("s11"), py::arg("z0") = 50.0,
        "ABCD matrix of an element connected to ground.");

  py::enum_<ExtrapolationMode>(m, "ExtrapolationMode")
      .value("Linear", ExtrapolationMode::Linear)
      .value("Hold", ExtrapolationMode::Hold)
      .value("Reject", ExtrapolationMode::Reject);

  m.def("resample",
        py::overload_cast<const TwoPortNetwork &, const std::vector<double> &,
                          ExtrapolationMode>(&resample),
        py::arg("network"), py::arg("frequency"),
        py::arg("mode") = ExtrapolationMode::Linear);

  // Metrics
  m.def("vswr", py::overload_cast<std::complex<double>>(&vswr),
        py::arg("gamma"));
  m.def("return_loss_db",
        py::overload_cast<std::complex<double>>(&return_loss_db),
        py::arg("gamma"));
  m.def("mismatch_loss_db", &mismatch_loss_db, py::arg("gamma"));
  m.def("impedance_from_reflection", &impedance_from_reflection,
        py::arg("gamma"), py::arg("z0") = 50.0);
  m.def("reflection_from_impedance", &reflection_from_impedance, py::arg("z"),
        py::arg("z0") = 50.0);
  m.def("is_matched", &is_matched, py::arg("z"), py::arg("target") = 50.0,
        py::arg("tolerance") = 10.0, py::arg("vswr_threshold") = 2.0);

  py::class_<MetricPoint>(m, "MetricPoint")
      .def_readonly("frequency", &MetricPoint::frequency)
      .def_readonly("gamma", &MetricPoint::gamma)
      .def_readonly("gamma_mag", &MetricPoint::gamma_mag)
      .def_readonly("vswr", &MetricPoint::vswr)
      .def_readonly("return_loss_db", &MetricPoint::return_loss_db)
      .def_readonly("impedance", &MetricPoint::impedance);

  py::class_<MetricSet>(m, "MetricSet")
      .def_readonly("frequency", &MetricSet::frequency)
      .def_readonly("gamma_mag", &MetricSet::gamma_mag)
      .def_readonly("vswr", &MetricSet::vswr)
      .def_readonly("return_loss_db", &MetricSet::return_loss_db)
      .def_readonly("impedance", &MetricSet::impedance);

  py::class_<NetworkCheckReport>(m, "NetworkCheckReport")
      .def_readonly("max_singular_value",
                    &NetworkCheckReport::max_singular_value)
      .def_readonly("max_reciprocity_error",
                    &NetworkCheckReport::max_reciprocity_error)
      .def_readonly("active_indices", &NetworkCheckReport::active_indices)
      .def("is_passive", &NetworkCheckReport::is_passive)
      .def("is_reciprocal", &NetworkCheckReport::is_reciprocal)
      .def("is_valid", &NetworkCheckReport::is_valid);
  m.def("check_network", &check_network, py::arg("network"),
        py::arg("tolerance") = 1e-6);

  // Catalog
  py::enum_<ComponentKind>(m, "ComponentKind")
      .value("Capacitor", ComponentKind::Capacitor)
      .value("Inductor", ComponentKind::Inductor)
      .value("Unknown", ComponentKind::Unknown);

  py::class_<Component>(m, "Component", "Catalog element.")
      .def(py::init<>())
      .def_readwrite("part_number", &Component::part_number)
      .def_readwrite("manufacturer", &Component::manufacturer)
      .def_readwrite("value", &Component::value)
      .def_readwrite("value_nominal", &Component::value_nominal)
      .def_readwrite("kind", &Component::kind)
      .def_readwrite("network", &Component::network)
      .def("label", &Component::label);

  py::class_<ComponentCatalog>(m, "ComponentCatalog")
      .def(py::init<>())
      .def("add", py::overload_cast<Component>(&ComponentCatalog::add))
      .def("__len__", &ComponentCatalog::size)
      .def("components",
           [](const ComponentCatalog &c) {
             return copy_components(c.components());
           })
      .def("search", [](const ComponentCatalog &c, const std::string &q) {
        return copy_components(c.search(q));
      });

  py::enum_<ESeries>(m, "ESeries")
      .value("E12", ESeries::E12)
      .value("E24", ESeries::E24)
      .value("E96", ESeries::E96);
  m.def("standard_values", &standard_values, py::arg("series"),
        py::arg("kind"));
  m.def("make_lumped_catalog", &make_lumped_catalog, py::arg("capacitances"),
        py::arg("inductances"), py::arg("frequency"), py::arg("z0") = 50.0);

  // Searches
  py::class_<Topology>(m, "Topology")
      .def_readonly("name", &Topology::name)
      .def("__len__", &Topology::size);
  m.def("topology", &topology_by_name, py::return_value_policy::reference,
        py::arg("name"), "Look up 'L', 'Pi' or 'T'.");

  py::enum_<ConnectionRole>(m, "ConnectionRole")
      .value("InLine", ConnectionRole::InLine)
      .value("ToGround", ConnectionRole::ToGround);

  py::class_<ComponentCandidate>(m, "ComponentCandidate")
      .def_property_readonly("component",
                             [](const ComponentCandidate &c) {
                               return *c.component;
                             })
      .def_readonly("role", &ComponentCandidate::role)
      .def_readonly("position", &ComponentCandidate::position);

  py::class_<SearchOptions>(m, "SearchOptions")
      .def(py::init<>())
      .def_readwrite("target_impedance", &SearchOptions::target_impedance)
      .def_readwrite("impedance_tolerance",
                     &SearchOptions::impedance_tolerance)
      .def_readwrite("vswr_threshold", &SearchOptions::vswr_threshold)
      .def_readwrite("max_combinations", &SearchOptions::max_combinations)
      .def_readwrite("extrapolation", &SearchOptions::extrapolation)
      .def_readwrite("verbose", &SearchOptions::verbose)
      .def_readwrite("progress_callback", &SearchOptions::progress_callback)
      .def_readwrite("progress_interval", &SearchOptions::progress_interval);

  py::class_<BandwidthSearchOptions, SearchOptions>(m,
                                                    "BandwidthSearchOptions")
      .def(py::init<>())
      .def_readwrite("bandwidth_vswr", &BandwidthSearchOptions::bandwidth_vswr);

  py::enum_<SearchState>(m, "SearchState")
      .value("Idle", SearchState::Idle)
      .value("Evaluating", SearchState::Evaluating)
      .value("Done", SearchState::Done)
      .value("Failed", SearchState::Failed);

  py::class_<SearchResult>(m, "SearchResult")
      .def_readonly("state", &SearchResult::state)
      .def_readonly("topology", &SearchResult::topology)
      .def_readonly("components", &SearchResult::components)
      .def_readonly("network", &SearchResult::network)
      .def_readonly("metrics", &SearchResult::metrics)
      .def_readonly("at_target", &SearchResult::at_target)
      .def_readonly("evaluation_frequency",
                    &SearchResult::evaluation_frequency)
      .def_readonly("score", &SearchResult::score)
      .def_readonly("max_vswr_in_band", &SearchResult::max_vswr_in_band)
      .def_readonly("bandwidth_hz", &SearchResult::bandwidth_hz)
      .def_readonly("used_fallback", &SearchResult::used_fallback)
      .def_readonly("success", &SearchResult::success)
      .def_readonly("iterations", &SearchResult::iterations)
      .def_readonly("failed_combinations",
                    &SearchResult::failed_combinations)
      .def_readonly("duration_sec", &SearchResult::duration_sec)
      .def_readonly("error_message", &SearchResult::error_message)
      .def("ok", &SearchResult::ok)
      .def("describe", [](const SearchResult &r) {
        return describe_network(r);
      });

  m.def("run_single_frequency_search", &run_single_frequency_search,
        py::arg("device"), py::arg("catalog"), py::arg("topology"),
        py::arg("target_frequency"), py::arg("options") = SearchOptions(),
        "Exhaustive search for minimum |S11| at one frequency.");
  m.def("run_bandwidth_search",
        py::overload_cast<const TwoPortNetwork &, const ComponentCatalog &,
                          const Topology &, std::pair<double, double>,
                          const BandwidthSearchOptions &>(
            &run_bandwidth_search),
        py::arg("device"), py::arg("catalog"), py::arg("topology"),
        py::arg("frequency_range"),
        py::arg("options") = BandwidthSearchOptions(),
        "Exhaustive search for minimum worst-case VSWR over a band.");

  // Objective
  py::class_<ObjectiveWeights>(m, "ObjectiveWeights")
      .def(py::init<>())
      .def_readwrite("return_loss", &ObjectiveWeights::return_loss)
      .def_readwrite("vswr", &ObjectiveWeights::vswr)
      .def_readwrite("bandwidth", &ObjectiveWeights::bandwidth)
      .def_readwrite("component_count", &ObjectiveWeights::component_count);
  m.def("weights_from_map", &weights_from_map, py::arg("weights"));
  m.def("score_candidate",
        py::overload_cast<const std::vector<std::complex<double>> &,
                          const std::vector<double> &, std::size_t,
                          const ObjectiveWeights &, double>(&score_candidate),
        py::arg("impedances"), py::arg("frequencies"),
        py::arg("component_count"), py::arg("weights") = ObjectiveWeights(),
        py::arg("target_impedance") = 50.0);
}
