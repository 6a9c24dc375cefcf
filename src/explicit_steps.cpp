#include "explicit_steps.hpp"

#include <stdexcept>
#include <string>

namespace {
void check_step_inputs(double dt, const std::vector<double> &state) {
  if (state.empty()) {
    throw std::runtime_error("State vector cannot be empty");
  }
  if (dt <= 0.0) {
    throw std::runtime_error("Time step must be positive");
  }
}

void check_size(const std::vector<double> &v, std::size_t n, const char *what) {
  if (v.size() != n) {
    throw std::runtime_error(std::string(what) + " size mismatch: expected " +
                             std::to_string(n) + ", got " + std::to_string(v.size()));
  }
}

// y + h * k, componentwise
std::vector<double> offset(const std::vector<double> &y, double h, const std::vector<double> &k) {
  std::vector<double> out(y.size());
  for (std::size_t i = 0; i < y.size(); ++i) {
    out[i] = y[i] + h * k[i];
  }
  return out;
}

// Evaluates f at (t, y) and checks the result has n components
std::vector<double> slope(const DerivativeFunction &f, double t, const std::vector<double> &y,
                          std::size_t n, const char *what) {
  std::vector<double> k = f(t, y);
  check_size(k, n, what);
  return k;
}
} // namespace

std::vector<double> euler_step(double t, double dt, const std::vector<double> &state,
                               const DerivativeFunction &derivatives) {
  check_step_inputs(dt, state);
  return offset(state, dt, slope(derivatives, t, state, state.size(), "Derivative"));
}

std::vector<double> rk2_midpoint_step(double t, double dt, const std::vector<double> &state,
                                      const DerivativeFunction &derivatives) {
  check_step_inputs(dt, state);

  const std::size_t n = state.size();
  const double h = 0.5 * dt;
  std::vector<double> k1 = slope(derivatives, t, state, n, "k1");
  std::vector<double> k2 = slope(derivatives, t + h, offset(state, h, k1), n, "k2");
  return offset(state, dt, k2);
}

std::vector<double> rk4_step(double t, double dt, const std::vector<double> &state,
                             const DerivativeFunction &derivatives) {
  check_step_inputs(dt, state);

  const std::size_t n = state.size();
  const double h = 0.5 * dt;
  std::vector<double> k1 = slope(derivatives, t, state, n, "k1");
  std::vector<double> k2 = slope(derivatives, t + h, offset(state, h, k1), n, "k2");
  std::vector<double> k3 = slope(derivatives, t + h, offset(state, h, k2), n, "k3");
  std::vector<double> k4 = slope(derivatives, t + dt, offset(state, dt, k3), n, "k4");

  // Weighted slope (k1 + 2 k2 + 2 k3 + k4) / 6
  std::vector<double> weighted(n);
  for (std::size_t i = 0; i < n; ++i) {
    weighted[i] = (k1[i] + 2.0 * (k2[i] + k3[i]) + k4[i]) / 6.0;
  }
  return offset(state, dt, weighted);
}

std::vector<double> euler_maruyama_step(double t, double dt, const std::vector<double> &state,
                                        const DerivativeFunction &drift,
                                        const DerivativeFunction &diffusion,
                                        const std::vector<double> &dW) {
  check_step_inputs(dt, state);

  const std::size_t n = state.size();
  check_size(dW, n, "Wiener increment");

  std::vector<double> a = slope(drift, t, state, n, "Drift");
  std::vector<double> b = slope(diffusion, t, state, n, "Diffusion");

  std::vector<double> next(n);
  for (std::size_t i = 0; i < n; ++i) {
    next[i] = state[i] + dt * a[i] + b[i] * dW[i];
  }
  return next;
}
