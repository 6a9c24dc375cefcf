#include "monte_carlo.hpp"

#include "wiener_process.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <gsl/gsl_statistics_double.h>
#include <iostream>
#include <set>
#include <system_error>
#include <thread>
#include <utility>

namespace {
EnsembleResult reduce_trials(const std::vector<Trajectory> &runs) {
  const std::size_t n = runs.size();
  const std::size_t n_points = runs.front().size();
  const std::size_t dim = runs.front().dimension();

  EnsembleResult result;
  result.n_trials = static_cast<int>(n);
  result.times = runs.front().times;
  result.mean.assign(n_points, State(dim, 0.0));
  result.variance.assign(n_points, State(dim, 0.0));
  result.standard_error.assign(n_points, State(dim, 0.0));

  std::vector<double> column(n);
  for (std::size_t j = 0; j < n_points; ++j) {
    for (std::size_t c = 0; c < dim; ++c) {
      for (std::size_t i = 0; i < n; ++i) {
        column[i] = runs[i].states[j][c];
      }
      const double mean = gsl_stats_mean(column.data(), 1, n);
      const double var = (n > 1) ? gsl_stats_variance_m(column.data(), 1, n, mean) : 0.0;
      result.mean[j][c] = mean;
      result.variance[j][c] = var;
      result.standard_error[j][c] = std::sqrt(var / static_cast<double>(n));
    }
  }
  return result;
}
} // namespace

std::vector<unsigned long> draw_trial_seeds(unsigned long seed, std::size_t n_trials) {
  WienerProcess master(seed);
  std::vector<unsigned long> seeds;
  seeds.reserve(n_trials);
  std::set<unsigned long> used;
  while (seeds.size() < n_trials) {
    const unsigned long s = master.nextSeed();
    // gsl_rng_set maps 0 onto the mt19937 default seed
    if (s == 0 || !used.insert(s).second) {
      continue;
    }
    seeds.push_back(s);
  }
  return seeds;
}

std::size_t ensemble_thread_count(int requested, std::size_t n_trials) {
  if (requested < 1) {
    throw ConfigurationError("Number of threads must be at least 1");
  }
  std::size_t n = std::min(static_cast<std::size_t>(requested), n_trials);
  const unsigned int hw = std::thread::hardware_concurrency();
  if (hw > 0) {
    n = std::min(n, static_cast<std::size_t>(hw));
  }
  return std::max<std::size_t>(n, 1);
}

EnsembleResult simulate_ensemble(const OdeSystem &system, const Parameters &params,
                                 const State &state0, const IntegrateOpts &opts,
                                 const EnsembleOpts &ensemble_opts, const Stepper &stepper) {
  if (ensemble_opts.n_trials < 1) {
    throw ConfigurationError("Number of trials must be at least 1");
  }

  const auto n_trials = static_cast<std::size_t>(ensemble_opts.n_trials);
  const std::size_t n_threads = ensemble_thread_count(ensemble_opts.n_threads, n_trials);

  // Seeds are fixed up front so trial i sees the same stream whatever thread runs it.
  const std::vector<unsigned long> seeds = draw_trial_seeds(ensemble_opts.seed, n_trials);

  IntegrateOpts trial_opts = opts;
  trial_opts.output_filename.reset();
  trial_opts.progress_stride = 0;

  if (ensemble_opts.verbose) {
    std::cout << "[Ensemble] " << stepper.getType() << ": " << n_trials << " trials on "
              << n_threads << " thread(s), seed " << ensemble_opts.seed << '\n';
  }

  std::vector<Trajectory> runs(n_trials);
  std::vector<std::exception_ptr> errors(n_trials);

  auto run_trial = [&](std::size_t i) {
    try {
      WienerProcess noise(seeds[i]);
      runs[i] = integrate(system, params, state0, trial_opts, stepper, &noise);
    } catch (...) {
      errors[i] = std::current_exception(); // rethrown below in trial order
    }
  };

  if (n_threads == 1) {
    for (std::size_t i = 0; i < n_trials; ++i) {
      run_trial(i);
      if (errors[i]) {
        break;
      }
    }
  } else {
    std::vector<std::thread> workers;
    workers.reserve(n_threads);
    try {
      for (std::size_t w = 0; w < n_threads; ++w) {
        workers.emplace_back([&run_trial, w, n_threads, n_trials]() {
          for (std::size_t i = w; i < n_trials; i += n_threads) {
            run_trial(i);
          }
        });
      }
    } catch (const std::system_error &) {
      // workers already started still reference the locals above
      for (auto &worker : workers) {
        worker.join();
      }
      throw;
    }
    for (auto &worker : workers) {
      worker.join();
    }
  }

  for (const auto &err : errors) {
    if (err) {
      std::rethrow_exception(err);
    }
  }

  EnsembleResult result = reduce_trials(runs);
  if (ensemble_opts.keep_trajectories) {
    result.trajectories = std::move(runs);
  }

  if (ensemble_opts.verbose) {
    const State &m = result.mean.back();
    const State &se = result.standard_error.back();
    std::cout << "[Ensemble] t = " << result.times.back() << ": mean y[0] = " << m[0]
              << " +/- " << se[0] << '\n';
  }
  return result;
}

EnsembleResult simulate_ensemble(const OdeSystem &system, const Parameters &params,
                                 const State &state0, const IntegrateOpts &opts,
                                 const EnsembleOpts &ensemble_opts) {
  const EulerMaruyamaStepper stepper{};
  return simulate_ensemble(system, params, state0, opts, ensemble_opts, stepper);
}
