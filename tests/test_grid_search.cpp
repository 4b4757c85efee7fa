#include <algorithm>
#include <cassert>
#include <cmath>
#include <complex>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include "matchnet/grid_search.hpp"
#include "matchnet/lumped.hpp"

using namespace matchnet;
using cd = std::complex<double>;

static ComponentPtr make_part(const std::string &pn, ComponentKind kind,
                              cd s11, cd s22, const std::vector<double> &f) {
  auto c = std::make_shared<Component>();
  c->part_number = pn;
  c->kind = kind;
  c->network = TwoPortNetwork::two_port(f, ComplexVec(f.size(), s11),
                                        ComplexVec(f.size(), cd(0.95, 0)),
                                        ComplexVec(f.size(), cd(0.95, 0)),
                                        ComplexVec(f.size(), s22));
  return c;
}

// Device S11 = 0.5 at 2 GHz; one capacitor-like and one inductor-like part.
static void scenario(TwoPortNetwork &device, ComponentCatalog &catalog) {
  std::vector<double> f = {2e9};
  device = TwoPortNetwork::one_port(f, {cd(0.5, 0)});
  catalog.add(make_part("CAP1", ComponentKind::Capacitor, cd(0.2, 0.1),
                        cd(0.2, -0.1), f));
  catalog.add(make_part("IND1", ComponentKind::Inductor, cd(0.2, -0.1),
                        cd(0.2, 0.1), f));
}

void test_end_to_end_scenario() {
  std::cout << "test_end_to_end_scenario..." << std::endl;

  TwoPortNetwork device;
  ComponentCatalog catalog;
  scenario(device, catalog);

  auto result = run_single_frequency_search(device, catalog, l_section(), 2e9);
  assert(result.ok());
  assert(result.state == SearchState::Done);
  assert(result.target == SearchTarget::SingleFrequency);
  assert(result.iterations == 4);
  assert(result.failed_combinations == 0);
  assert(result.components.size() == 2);
  assert(result.components[0].role == ConnectionRole::InLine);
  assert(result.components[1].role == ConnectionRole::ToGround);
  assert(result.at_target.gamma_mag < 0.5);
  assert(std::abs(result.score - result.at_target.gamma_mag) < 1e-15);
  assert(result.evaluation_frequency == 2e9);
  assert(result.duration_sec >= 0.0);
  assert(result.network.port_count() == PortCount::Two);

  std::cout << "  |S11| = " << result.at_target.gamma_mag << " using "
            << describe_network(result) << std::endl;
}

void test_determinism() {
  std::cout << "test_determinism..." << std::endl;

  std::vector<double> f;
  for (int i = 0; i < 21; ++i)
    f.push_back(1e9 + 1e8 * i);
  ComplexVec s11;
  for (double x : f)
    s11.push_back(reflection_from_impedance(cd(20.0, x * 2e-9), 50.0));
  auto device = TwoPortNetwork::one_port(f, s11);
  auto catalog = make_lumped_catalog({1e-12, 2.2e-12, 4.7e-12},
                                     {1e-9, 3.3e-9, 6.8e-9}, f);

  auto a = run_single_frequency_search(device, catalog, t_section(), 2e9);
  auto b = run_single_frequency_search(device, catalog, t_section(), 2e9);
  assert(a.ok() && b.ok());
  assert(a.iterations == 216);
  assert(a.iterations == b.iterations);
  assert(a.score == b.score);
  assert(a.components.size() == b.components.size());
  for (size_t i = 0; i < a.components.size(); ++i)
    assert(a.components[i].component == b.components[i].component);

  // The winner is the minimum over every assignment.
  CombinationEnumerator e(catalog, t_section());
  std::vector<ComponentCandidate> combo;
  double best = std::numeric_limits<double>::infinity();
  const std::size_t idx = device.series().nearest_index(2e9);
  while (e.next(combo)) {
    double mag = std::abs(cascade(device, combo).network.s11()[idx]);
    best = std::min(best, mag);
  }
  assert(a.score == best);
}

void test_ties_keep_first() {
  std::cout << "test_ties_keep_first..." << std::endl;

  std::vector<double> f = {1e9, 2e9, 3e9};
  auto device = TwoPortNetwork::one_port(f, ComplexVec(3, cd(0.4, 0.3)));

  ComponentCatalog catalog;
  auto c = make_lumped_component(ComponentKind::Capacitor, 2.2e-12, f);
  auto twin = c;
  twin.part_number = "TWIN";
  catalog.add(c);
  catalog.add(twin);
  catalog.add(make_lumped_component(ComponentKind::Inductor, 3.3e-9, f));

  auto result = run_single_frequency_search(device, catalog, l_section(), 2e9);
  assert(result.ok());
  for (const auto &cand : result.components)
    assert(cand.component->part_number != "TWIN");
}

void test_empty_catalog_fails() {
  std::cout << "test_empty_catalog_fails..." << std::endl;

  auto device = TwoPortNetwork::one_port({2e9}, {cd(0.5, 0)});
  ComponentCatalog empty;
  auto result = run_single_frequency_search(device, empty, l_section(), 2e9);
  assert(!result.ok());
  assert(result.state == SearchState::Failed);
  assert(result.iterations == 0);
  assert(!result.success);
  assert(!result.error_message.empty());
  assert(describe_network(result).find("No matching network") == 0);
}

void test_universal_failure() {
  std::cout << "test_universal_failure..." << std::endl;

  // Components cover 2.0-2.5 GHz only; Reject makes every cascade throw.
  auto device = TwoPortNetwork::one_port({1e9, 2e9}, {cd(0.5, 0), cd(0.5, 0)});
  auto catalog = make_lumped_catalog({1e-12}, {1e-9}, {2e9, 2.5e9});

  SearchOptions opts;
  opts.extrapolation = ExtrapolationMode::Reject;
  auto result =
      run_single_frequency_search(device, catalog, l_section(), 2e9, opts);
  assert(result.state == SearchState::Failed);
  assert(result.iterations == 4);
  assert(result.failed_combinations == 4);

  std::cout << "  " << result.error_message << std::endl;
}

void test_limits_and_progress() {
  std::cout << "test_limits_and_progress..." << std::endl;

  TwoPortNetwork device;
  ComponentCatalog catalog;
  scenario(device, catalog);

  SearchOptions opts;
  opts.max_combinations = 2;
  auto limited =
      run_single_frequency_search(device, catalog, l_section(), 2e9, opts);
  assert(limited.ok());
  assert(limited.iterations == 2);

  std::size_t calls = 0;
  std::size_t last_total = 0;
  SearchOptions cb;
  cb.progress_interval = 1;
  cb.progress_callback = [&](std::size_t evaluated, std::size_t total,
                             double best_score) {
    ++calls;
    last_total = total;
    assert(evaluated == calls);
    assert(best_score < 0.5);
  };
  auto r = run_single_frequency_search(device, catalog, l_section(), 2e9, cb);
  assert(r.ok());
  assert(calls == 4);
  assert(last_total == 4);

  bool threw = false;
  try {
    run_single_frequency_search(TwoPortNetwork(), catalog, l_section(), 2e9);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);
}

void test_counts_beyond_int_range() {
  std::cout << "test_counts_beyond_int_range..." << std::endl;

  std::vector<double> f = {2e9};
  std::vector<double> caps;
  for (int i = 0; i < 1300; ++i)
    caps.push_back(1e-12 * (1.0 + 0.01 * i));
  auto catalog = make_lumped_catalog(caps, {}, f);
  auto device = TwoPortNetwork::one_port(f, {cd(0.3, 0.1)});

  // 1300^3 Pi assignments do not fit in an int.
  CombinationEnumerator e(catalog, pi_section());
  assert(e.total() == std::size_t(2197000000ULL));
  assert(e.total() > static_cast<std::size_t>(
                         std::numeric_limits<int>::max()));

  std::size_t reported_total = 0;
  SearchOptions opts;
  opts.max_combinations = 5;
  opts.progress_interval = 1;
  opts.progress_callback = [&](std::size_t, std::size_t total, double) {
    reported_total = total;
  };
  auto r = run_single_frequency_search(device, catalog, pi_section(), 2e9,
                                       opts);
  assert(r.ok());
  assert(r.iterations == 5);
  assert(r.failed_combinations == 0);
  assert(reported_total == 5);
}

void test_success_flag() {
  std::cout << "test_success_flag..." << std::endl;

  // Matched thru device. A near-zero in-line inductor followed by a near-open
  // capacitor to ground leaves it matched.
  std::vector<double> f = {2e9};
  auto device = TwoPortNetwork::two_port(f, {cd(0, 0)}, {cd(1, 0)},
                                         {cd(1, 0)}, {cd(0, 0)});
  auto catalog = make_lumped_catalog({0.01e-12}, {0.01e-9}, f);
  auto r = run_single_frequency_search(device, catalog, l_section(), 2e9);
  assert(r.ok());
  assert(r.success);
  assert(r.at_target.vswr < 1.1);
  assert(r.components[0].component->kind == ComponentKind::Inductor);
}

int main() {
  test_end_to_end_scenario();
  test_determinism();
  test_ties_keep_first();
  test_empty_catalog_fails();
  test_universal_failure();
  test_limits_and_progress();
  test_counts_beyond_int_range();
  test_success_flag();
  std::cout << "All grid search tests passed!" << std::endl;
  return 0;
}
