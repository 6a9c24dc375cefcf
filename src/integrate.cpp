#include "integrate.hpp"

#include "trajectory_io.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <utility>

namespace {
bool all_finite(const State &s) {
  for (double v : s) {
    if (!std::isfinite(v)) {
      return false;
    }
  }
  return true;
}

void validate_inputs(const OdeSystem &system, const Parameters &params, const State &state0,
                     const IntegrateOpts &opts, const Stepper &stepper,
                     const WienerProcess *noise) {
  if (!system.rhs) {
    throw ConfigurationError("System has no right-hand side");
  }
  if (state0.empty()) {
    throw ConfigurationError("Initial state cannot be empty");
  }
  if (!all_finite(state0)) {
    throw ConfigurationError("Initial state must be finite");
  }
  if (opts.progress_stride < 0) {
    throw ConfigurationError("progress_stride cannot be negative");
  }
  if (stepper.isStochastic()) {
    if (!system.hasDiffusion()) {
      throw ConfigurationError(stepper.getType() + " requires a diffusion function");
    }
    if (noise == nullptr) {
      throw ConfigurationError(stepper.getType() + " requires a Wiener process");
    }
  }
  params.require(system.required_parameters);
}
} // namespace

TimeGrid make_time_grid(const IntegrateOpts &opts) {
  if (opts.dt.has_value()) {
    return make_time_grid_from_dt(opts.t0, opts.t_end, *opts.dt);
  }
  return make_time_grid(opts.t0, opts.t_end, opts.n_steps);
}

Trajectory integrate(const OdeSystem &system, const Parameters &params, const State &state0,
                     const IntegrateOpts &opts, const Stepper &stepper, WienerProcess *noise) {
  const TimeGrid grid = make_time_grid(opts);
  validate_inputs(system, params, state0, opts, stepper, noise);

  std::ofstream outfile;
  const bool write_output = opts.output_filename.has_value();
  if (write_output) {
    outfile.open(*opts.output_filename);
    if (outfile.is_open()) {
      write_trajectory_header(outfile, state_column_names(system.state_names, state0.size()));
      write_trajectory_row(outfile, grid.t0, state0);
    } else {
      std::cerr << "[Integrate] Could not open " << *opts.output_filename
                << "; continuing without file output.\n";
    }
  }

  Trajectory trajectory;
  trajectory.reserve(static_cast<std::size_t>(grid.n_steps) + 1);
  trajectory.append(grid.t0, state0);

  State state = state0;
  for (int j = 0; j < grid.n_steps; ++j) {
    const auto step = static_cast<std::size_t>(j);
    const double t = grid.time(j);

    if (opts.cancel_requested && opts.cancel_requested()) {
      throw IntegrationCancelled("Integration cancelled", t, state, step, trajectory);
    }

    State dW;
    if (stepper.isStochastic()) {
      dW = noise->increment(grid.dt, state.size());
    }

    State next;
    try {
      next = stepper.advance(t, state, grid.dt, system, params, dW);
    } catch (const NumericalSingularityError &e) {
      throw NumericalSingularityError(e.detail(), e.time(), e.state(), step, trajectory);
    }

    // Stability
    if (!all_finite(next)) {
      throw NonFiniteStateError("Non-finite state computed", grid.time(j + 1), next, step + 1,
                                trajectory);
    }

    state = std::move(next);
    trajectory.append(grid.time(j + 1), state);

    if (write_output && outfile.is_open()) {
      write_trajectory_row(outfile, grid.time(j + 1), state);
    }

    // Progress
    if (opts.progress_stride > 0 && (j + 1) % opts.progress_stride == 0) {
      std::cout << "[Integrate] " << stepper.getType() << " step " << (j + 1) << "/"
                << grid.n_steps << ", t: " << grid.time(j + 1) << ", y[0]: " << state[0]
                << '\n';
    }
  }

  if (write_output && outfile.is_open()) {
    outfile.close();
  }
  return trajectory;
}
