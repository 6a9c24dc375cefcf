#include "convergence.hpp"

#include "integrate.hpp"

#include <algorithm>
#include <cmath>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_fit.h>
#include <limits>

ConvergenceReport convergence_study(const OdeSystem &system, const Parameters &params,
                                    const State &state0, double t0, double t_end,
                                    const ExactSolution &exact, const Stepper &stepper,
                                    int n_base, int n_halvings) {
  if (n_base < 1) {
    throw ConfigurationError("Base step count must be at least 1");
  }
  if (n_halvings < 1) {
    throw ConfigurationError("Convergence study needs at least one halving");
  }
  if (n_halvings > 20) {
    throw ConfigurationError("Too many halvings requested");
  }
  if (stepper.isStochastic()) {
    throw ConfigurationError("Convergence study requires a deterministic stepper");
  }
  if ((static_cast<long long>(n_base) << n_halvings) > std::numeric_limits<int>::max()) {
    throw ConfigurationError("Finest refinement exceeds the maximum step count");
  }
  if (!exact) {
    throw ConfigurationError("Convergence study requires an exact solution");
  }

  const State y_exact = exact(t_end);
  if (y_exact.size() != state0.size()) {
    throw ConfigurationError("Exact solution dimension does not match the initial state");
  }

  ConvergenceReport report;
  report.observed_order = std::numeric_limits<double>::quiet_NaN();

  for (int level = 0; level <= n_halvings; ++level) {
    IntegrateOpts opts;
    opts.t0 = t0;
    opts.t_end = t_end;
    opts.n_steps = static_cast<int>(static_cast<long long>(n_base) << level);

    const Trajectory traj = integrate(system, params, state0, opts, stepper);
    const State &y_final = traj.finalState();

    double err = 0.0;
    for (std::size_t i = 0; i < y_final.size(); ++i) {
      err = std::max(err, std::abs(y_final[i] - y_exact[i]));
    }
    report.points.push_back({opts.n_steps, (t_end - t0) / opts.n_steps, err});
  }

  for (std::size_t i = 1; i < report.points.size(); ++i) {
    const double prev = report.points[i - 1].error;
    const double curr = report.points[i].error;
    report.error_ratios.push_back(curr > 0.0 ? prev / curr
                                             : std::numeric_limits<double>::infinity());
  }

  // log(error) = log(C) + p log(dt)
  std::vector<double> log_dt;
  std::vector<double> log_err;
  for (const auto &p : report.points) {
    if (p.error > 0.0) {
      log_dt.push_back(std::log(p.dt));
      log_err.push_back(std::log(p.error));
    }
  }
  if (log_dt.size() >= 2) {
    double c0 = 0.0, c1 = 0.0, cov00 = 0.0, cov01 = 0.0, cov11 = 0.0, sumsq = 0.0;
    const int status = gsl_fit_linear(log_dt.data(), 1, log_err.data(), 1, log_dt.size(), &c0,
                                      &c1, &cov00, &cov01, &cov11, &sumsq);
    if (status == GSL_SUCCESS) {
      report.observed_order = c1;
    }
  }
  return report;
}
