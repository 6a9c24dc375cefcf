#pragma once
#include "parameters.hpp"
#include "trajectory.hpp"

#include <functional>
#include <string>
#include <vector>

// Right-hand side f(t, y; p). Must return a vector of the same size as y and be free of
// side effects: identical inputs give identical outputs.
using RhsFunction = std::function<State(double, const State &, const Parameters &)>;

// Diffusion coefficient g(t, y; p) for dy = f dt + g dW. Diagonal noise: component i of
// g scales component i of the Wiener increment.
using DiffusionFunction = std::function<State(double, const State &, const Parameters &)>;

struct OdeSystem {
  std::string name;
  RhsFunction rhs;
  DiffusionFunction diffusion; // empty for deterministic systems

  // Parameter names rhs/diffusion look up; validated once before the first step.
  std::vector<std::string> required_parameters;

  // Optional column names for output ("T", "T1", ...). Defaults to y0, y1, ...
  std::vector<std::string> state_names;

  [[nodiscard]] bool hasDiffusion() const { return static_cast<bool>(diffusion); }
};
