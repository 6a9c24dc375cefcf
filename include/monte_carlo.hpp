#ifndef MONTE_CARLO_HPP
#define MONTE_CARLO_HPP

#include "integrate.hpp"
#include "ode_system.hpp"
#include "parameters.hpp"
#include "stepper.hpp"
#include "trajectory.hpp"

#include <cstddef>
#include <vector>

/**
 * @file monte_carlo.hpp
 * @brief Monte Carlo aggregation of independent stochastic trajectories.
 *
 * @details
 * simulate_ensemble() runs the integration driver n_trials times, each with its own
 * Wiener process, and reduces the runs to the elementwise sample mean, the unbiased
 * sample variance and the standard error of the mean at every grid point.
 *
 * Reproducibility:
 * - The per-trial seeds are drawn in order from a master generator seeded with
 *   EnsembleOpts::seed before any trial starts.
 * - Trials may run on several threads, but each trial writes only its own slot and the
 *   reduction walks the trials in index order, so the statistics do not depend on
 *   the number of threads or on completion order.
 *
 * The sampling error of the mean decreases as O(1/sqrt(n_trials)).
 *
 * @code{.cpp}
 * EnsembleOpts ens;
 * ens.n_trials = 1000;
 * ens.seed = 7;
 * EnsembleResult res = simulate_ensemble(make_single_cell_system(),
 *                                        default_pv_cell_parameters(), {300.0}, opts, ens);
 * double mean_T_end = res.mean.back()[0];
 * @endcode
 */

struct EnsembleOpts {
  int n_trials = 100;
  unsigned long seed = 42;
  bool keep_trajectories = false;
  int n_threads = 1;
  bool verbose = false;
};

struct EnsembleResult {
  std::vector<double> times;
  std::vector<State> mean;           ///< Sample mean per grid point and component
  std::vector<State> variance;       ///< Unbiased sample variance (0 for a single trial)
  std::vector<State> standard_error; ///< sqrt(variance / n_trials)
  std::vector<Trajectory> trajectories; ///< Filled only with keep_trajectories
  int n_trials = 0;

  [[nodiscard]] Trajectory meanTrajectory() const { return {times, mean}; }
};

/**
 * @brief Per-trial seeds drawn from a master generator seeded with seed
 *
 * Duplicate draws (and 0, which GSL maps onto the default mt19937 seed) are skipped,
 * so every trial gets its own Wiener stream.
 */
std::vector<unsigned long> draw_trial_seeds(unsigned long seed, std::size_t n_trials);

/// Worker threads used for n_trials: requested, capped by n_trials and the hardware.
/// @throws ConfigurationError if requested < 1
std::size_t ensemble_thread_count(int requested, std::size_t n_trials);

/**
 * @brief Run n_trials independent integrations and reduce them to sample statistics
 *
 * Per-trial file output and progress logging from opts are disabled.
 *
 * @throws ConfigurationError if n_trials < 1 or n_threads < 1, or for any input the
 *         driver rejects
 * @throws IntegrationError rethrown from the lowest-numbered failing trial
 */
EnsembleResult simulate_ensemble(const OdeSystem &system, const Parameters &params,
                                 const State &state0, const IntegrateOpts &opts,
                                 const EnsembleOpts &ensemble_opts, const Stepper &stepper);

/// Same as above with the Euler-Maruyama stepper.
EnsembleResult simulate_ensemble(const OdeSystem &system, const Parameters &params,
                                 const State &state0, const IntegrateOpts &opts,
                                 const EnsembleOpts &ensemble_opts);

#endif // MONTE_CARLO_HPP
