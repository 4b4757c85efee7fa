#pragma once

#include <cstddef>
#include <functional>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "matchnet/cascade.hpp"
#include "matchnet/catalog.hpp"
#include "matchnet/metrics.hpp"
#include "matchnet/network.hpp"
#include "matchnet/resample.hpp"
#include "matchnet/topology.hpp"

namespace matchnet {

/// Callback function type for search progress reporting.
/// @param evaluated Combinations tried so far
/// @param total Combinations the search will try
/// @param best_score Best score so far (infinity before the first success)
using SearchProgressCallback =
    std::function<void(std::size_t evaluated, std::size_t total,
                       double best_score)>;

struct SearchOptions {
  double target_impedance = 50.0;    ///< ohms
  double impedance_tolerance = 10.0; ///< ohms, for the success flag
  double vswr_threshold = 2.0;       ///< for the success flag

  /// Stop after this many combinations (0 = try them all). Checked between
  /// combinations only.
  std::size_t max_combinations = 0;

  ExtrapolationMode extrapolation = ExtrapolationMode::Linear;

  /// Enable verbose output to stderr (start line, failed combinations, summary)
  bool verbose = false;

  /// Optional callback for progress monitoring (called every N combinations)
  SearchProgressCallback progress_callback = nullptr;

  /// How often to call progress_callback (every N combinations)
  int progress_interval = 100;
};

enum class SearchState { Idle, Evaluating, Done, Failed };

const char *to_string(SearchState state);

enum class SearchTarget { SingleFrequency, Bandwidth };

struct SearchResult {
  SearchState state = SearchState::Idle;
  SearchTarget target = SearchTarget::SingleFrequency;
  std::string topology;

  std::vector<ComponentCandidate> components;
  TwoPortNetwork network; ///< cascaded device + components
  MetricSet metrics;      ///< from network S11 across the device axis
  MetricPoint at_target;  ///< metrics at the evaluation frequency
  double evaluation_frequency = 0.0;
  std::size_t evaluation_index = 0;
  double score = std::numeric_limits<double>::infinity();

  // Bandwidth search only.
  std::pair<double, double> frequency_range{0.0, 0.0};
  double max_vswr_in_band = 0.0;
  double bandwidth_hz = 0.0;
  bool used_fallback = false;

  bool success = false; ///< impedance within tolerance OR VSWR below threshold
  std::size_t iterations = 0; ///< combinations tried
  std::size_t failed_combinations = 0;
  double duration_sec = 0.0;
  std::string error_message;

  bool ok() const { return state == SearchState::Done; }
};

/// Scores a cascaded network; lower is better.
using CombinationScorer = std::function<double(const TwoPortNetwork &)>;

/// Best assignment found by sweep_topology.
struct SweepOutcome {
  bool found = false;
  bool used_fallback = false;
  CascadeResult best;
  double best_score = std::numeric_limits<double>::infinity();
  std::size_t iterations = 0;
  std::size_t failed_combinations = 0;
};

/// Cascade and score every assignment of `topology` over `catalog` in
/// enumeration order, keeping the first assignment with the strictly lowest
/// score. An assignment whose cascade throws or whose score is not finite is
/// counted as failed and skipped. With keep_first_on_no_winner the first
/// assignment that cascaded is returned when none scored.
SweepOutcome sweep_topology(const TwoPortNetwork &device,
                            const ComponentCatalog &catalog,
                            const Topology &topology,
                            const CombinationScorer &scorer,
                            const SearchOptions &opts,
                            bool keep_first_on_no_winner = false);

/// Exhaustive search for the assignment with the smallest |S11| at the
/// device sample nearest target_frequency. Never throws for an infeasible
/// search; the result state is then SearchState::Failed.
/// @throws std::invalid_argument for an empty device, a non-finite target
///         frequency or an inconsistent topology
SearchResult run_single_frequency_search(const TwoPortNetwork &device,
                                         const ComponentCatalog &catalog,
                                         const Topology &topology,
                                         double target_frequency,
                                         const SearchOptions &opts =
                                             SearchOptions());

namespace detail {

/// Copy the winner of a sweep into a result and derive its metrics at
/// evaluation_index. Leaves the result Failed when nothing was found.
void fill_result(SearchResult &result, const TwoPortNetwork &device,
                 const SweepOutcome &outcome, std::size_t evaluation_index);

} // namespace detail

/// One-line schematic of a result, e.g.
/// "Device──[C 10pF]──┬[L 5.6nH]┴── 50Ω Load".
std::string describe_network(const SearchResult &result,
                             double load_impedance = 50.0);

} // namespace matchnet
