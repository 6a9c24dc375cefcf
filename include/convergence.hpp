#pragma once
#include "ode_system.hpp"
#include "parameters.hpp"
#include "stepper.hpp"
#include "trajectory.hpp"

#include <functional>
#include <vector>

// Exact solution y(t) of the problem under study.
using ExactSolution = std::function<State(double)>;

struct ConvergencePoint {
  int n_steps;
  double dt;
  double error; // max-norm of y_N - y(t_end)
};

struct ConvergenceReport {
  std::vector<ConvergencePoint> points;
  // error[i-1] / error[i]; about 2^p for a method of order p
  std::vector<double> error_ratios;
  // Least-squares slope of log(error) against log(dt); NaN if fewer than two
  // non-zero errors
  double observed_order;
};

/**
 * @brief Measure the global order of accuracy of a deterministic stepper
 *
 * Integrates with n_base, 2 n_base, ..., 2^n_halvings n_base steps and compares the
 * final state against the exact solution.
 *
 * @throws ConfigurationError if n_base < 1, n_halvings < 1, n_base * 2^n_halvings does not
 *         fit in an int, or the stepper is stochastic
 */
ConvergenceReport convergence_study(const OdeSystem &system, const Parameters &params,
                                    const State &state0, double t0, double t_end,
                                    const ExactSolution &exact, const Stepper &stepper,
                                    int n_base, int n_halvings);
