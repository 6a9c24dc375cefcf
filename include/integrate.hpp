#pragma once
#include "integration_errors.hpp"
#include "ode_system.hpp"
#include "parameters.hpp"
#include "stepper.hpp"
#include "time_grid.hpp"
#include "trajectory.hpp"
#include "wiener_process.hpp"

#include <functional>
#include <optional>
#include <string>

struct IntegrateOpts {
  double t0 = 0.0;
  double t_end = 1.0;
  int n_steps = 1000;
  // When set, overrides n_steps; must divide [t0, t_end] evenly.
  std::optional<double> dt;
  std::optional<std::string> output_filename;
  // Print a progress line every progress_stride steps; 0 disables.
  int progress_stride = 0;
  // Checked between steps; returning true stops the run with IntegrationCancelled.
  std::function<bool()> cancel_requested;
};

// Grid described by opts (dt takes precedence over n_steps).
TimeGrid make_time_grid(const IntegrateOpts &opts);

/**
 * @brief Integrate an initial value problem on a uniform grid.
 *
 * Computes state_{j+1} = stepper.advance(t_j, state_j, dt, ...) for j = 0..N-1 and
 * returns all N+1 points. Trajectory[0] is (t0, state0) exactly.
 *
 * @param system Right-hand side (and diffusion for stochastic steppers)
 * @param params Parameters; the system's required names are checked before stepping
 * @param state0 Initial condition (non-empty, finite)
 * @param opts Time span, step count and output options
 * @param stepper Update rule
 * @param noise Source of Wiener increments; required iff stepper.isStochastic()
 *
 * @throws ConfigurationError before any stepping on invalid input
 * @throws NumericalSingularityError when the model is undefined at a visited state,
 *         tagged with the step index and carrying the partial trajectory
 * @throws NonFiniteStateError when a computed state is not finite; the partial
 *         trajectory ends at the last finite step
 * @throws IntegrationCancelled when opts.cancel_requested returns true
 */
Trajectory integrate(const OdeSystem &system, const Parameters &params, const State &state0,
                     const IntegrateOpts &opts, const Stepper &stepper,
                     WienerProcess *noise = nullptr);
