#pragma once
#include "integration_errors.hpp"

#include <cmath>

// Uniform grid t_j = t0 + j*dt, j = 0..n_steps. Points are computed from the index, not
// accumulated, so t_j carries no running round-off.
struct TimeGrid {
  double t0;
  double t_end;
  int n_steps;
  double dt;

  [[nodiscard]] double time(int j) const { return t0 + j * dt; }
};

inline void validate_time_span(double t0, double t_end) {
  if (!std::isfinite(t0) || !std::isfinite(t_end)) {
    throw ConfigurationError("Time span must be finite");
  }
  if (t_end <= t0) {
    throw ConfigurationError("t_end must be greater than t0");
  }
}

inline TimeGrid make_time_grid(double t0, double t_end, int n_steps) {
  validate_time_span(t0, t_end);
  if (n_steps < 1) {
    throw ConfigurationError("Number of steps must be at least 1");
  }
  return {t0, t_end, n_steps, (t_end - t0) / n_steps};
}

// dt must tile [t0, t_end] with a whole number of steps (relative tolerance 1e-9).
inline TimeGrid make_time_grid_from_dt(double t0, double t_end, double dt) {
  validate_time_span(t0, t_end);
  if (!(dt > 0.0) || !std::isfinite(dt)) {
    throw ConfigurationError("Time step must be positive");
  }

  const double span = t_end - t0;
  const double steps = std::round(span / dt);
  if (steps < 1.0) {
    throw ConfigurationError("Time step is larger than the integration span");
  }
  if (std::abs(steps * dt - span) > 1e-9 * span) {
    throw ConfigurationError("Time step does not divide the integration span evenly");
  }
  if (steps > 2147483647.0) {
    throw ConfigurationError("Time step is too small for the integration span");
  }
  return make_time_grid(t0, t_end, static_cast<int>(steps));
}
