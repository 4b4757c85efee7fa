#include "matchnet/grid_search.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace matchnet {

const char *to_string(SearchState state) {
  switch (state) {
  case SearchState::Idle:
    return "idle";
  case SearchState::Evaluating:
    return "evaluating";
  case SearchState::Done:
    return "done";
  case SearchState::Failed:
    return "failed";
  }
  return "unknown";
}

SweepOutcome sweep_topology(const TwoPortNetwork &device,
                            const ComponentCatalog &catalog,
                            const Topology &topology,
                            const CombinationScorer &scorer,
                            const SearchOptions &opts,
                            bool keep_first_on_no_winner) {
  CombinationEnumerator combos(catalog, topology);
  std::size_t total = combos.total();
  if (opts.max_combinations > 0 && opts.max_combinations < total)
    total = opts.max_combinations;

  if (opts.verbose) {
    std::cerr << "[matchnet] " << topology.name << ": " << total
              << " combinations over " << catalog.size() << " components\n";
  }

  CascadeOptions copts;
  copts.extrapolation = opts.extrapolation;

  SweepOutcome out;
  bool have_first = false;
  CascadeResult first;
  std::vector<ComponentCandidate> candidates;

  while (out.iterations < total &&
         combos.next(candidates)) {
    ++out.iterations;
    try {
      CascadeResult cr = cascade(device, candidates, topology, copts);
      if (!have_first) {
        first = cr;
        have_first = true;
      }
      const double score = scorer(cr.network);
      if (!std::isfinite(score)) {
        ++out.failed_combinations;
        if (opts.verbose) {
          std::cerr << "[matchnet]   combination " << out.iterations
                    << ": non-finite score\n";
        }
      } else if (score < out.best_score) {
        out.best_score = score;
        out.best = std::move(cr);
        out.found = true;
      }
    } catch (const std::exception &e) {
      ++out.failed_combinations;
      if (opts.verbose) {
        std::cerr << "[matchnet]   combination " << out.iterations
                  << " failed: " << e.what() << "\n";
      }
    }

    if (opts.progress_callback && opts.progress_interval > 0 &&
        out.iterations % static_cast<std::size_t>(opts.progress_interval) ==
            0) {
      opts.progress_callback(out.iterations, total, out.best_score);
    }
  }

  if (!out.found && keep_first_on_no_winner && have_first) {
    out.best = std::move(first);
    out.found = true;
    out.used_fallback = true;
  }
  return out;
}

namespace detail {

void fill_result(SearchResult &result, const TwoPortNetwork &device,
                 const SweepOutcome &outcome, std::size_t evaluation_index) {
  result.iterations = outcome.iterations;
  result.failed_combinations = outcome.failed_combinations;
  result.used_fallback = outcome.used_fallback;
  result.evaluation_index = evaluation_index;
  result.evaluation_frequency = device.frequency()[evaluation_index];

  if (!outcome.found) {
    result.state = SearchState::Failed;
    if (outcome.iterations == 0) {
      result.error_message = "No component combinations for topology '" +
                             result.topology + "'";
    } else {
      result.error_message = "No valid " + result.topology +
                             " solution found (" +
                             std::to_string(outcome.failed_combinations) +
                             " of " + std::to_string(outcome.iterations) +
                             " combinations failed)";
    }
    return;
  }

  result.state = SearchState::Done;
  result.components = outcome.best.candidates;
  result.network = outcome.best.network;
  result.score = outcome.best_score;
  result.metrics = compute_metrics(result.network.s11(),
                                   result.network.frequency(),
                                   result.network.z0());
  result.at_target = result.metrics.at(evaluation_index);
}

} // namespace detail

SearchResult run_single_frequency_search(const TwoPortNetwork &device,
                                         const ComponentCatalog &catalog,
                                         const Topology &topology,
                                         double target_frequency,
                                         const SearchOptions &opts) {
  if (device.empty()) {
    throw std::invalid_argument("run_single_frequency_search: empty device");
  }
  if (!std::isfinite(target_frequency)) {
    throw std::invalid_argument(
        "run_single_frequency_search: target frequency is not finite");
  }
  validate_topology(topology);

  SearchResult result;
  result.target = SearchTarget::SingleFrequency;
  result.topology = topology.name;
  result.state = SearchState::Evaluating;

  const std::size_t idx = device.series().nearest_index(target_frequency);
  auto start = std::chrono::steady_clock::now();

  CombinationScorer scorer = [idx](const TwoPortNetwork &net) {
    return std::abs(net.s11()[idx]);
  };
  SweepOutcome outcome =
      sweep_topology(device, catalog, topology, scorer, opts);

  detail::fill_result(result, device, outcome, idx);
  if (result.ok()) {
    result.success =
        is_matched(result.at_target.impedance, opts.target_impedance,
                   opts.impedance_tolerance, opts.vswr_threshold);
  }

  auto end = std::chrono::steady_clock::now();
  result.duration_sec = std::chrono::duration<double>(end - start).count();

  if (opts.verbose) {
    std::cerr << "[matchnet] " << topology.name << " at "
              << result.evaluation_frequency / 1e9 << " GHz: "
              << to_string(result.state) << ", " << result.iterations
              << " iterations in " << result.duration_sec << " s";
    if (result.ok())
      std::cerr << ", |S11| = " << result.score;
    std::cerr << "\n";
  }
  return result;
}

std::string describe_network(const SearchResult &result,
                             double load_impedance) {
  if (!result.ok())
    return "No matching network found: " + result.error_message;

  std::ostringstream ss;
  ss << "Device";
  for (const auto &c : result.components) {
    const std::string label = c.component ? c.component->label() : "?";
    switch (c.role) {
    case ConnectionRole::InLine:
      ss << "──[" << label << "]";
      break;
    case ConnectionRole::ToGround:
      ss << "──┬[" << label << "]┴";
      break;
    }
  }
  ss << "── " << load_impedance << "Ω Load";
  return ss.str();
}

} // namespace matchnet
