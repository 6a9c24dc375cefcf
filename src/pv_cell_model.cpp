#include "pv_cell_model.hpp"

#include "integration_errors.hpp"

#include <cmath>

Parameters default_pv_cell_parameters() {
  return Parameters{{"T_ambient", 290.0}, // K
                    {"c1", 2.0},          // K/s
                    {"c2", 0.05},         // 1/s
                    {"c3", 5e-11},        // 1/(K^3 s)
                    {"c4", 20.0},         // K^2/s
                    {"c5", 0.5},          // K/sqrt(s)
                    {"c6", 0.1}};         // 1/s
}

std::vector<std::string> single_cell_parameter_names() {
  return {"T_ambient", "c1", "c2", "c3", "c4"};
}

double cell_heating_rate(double t, double T, const Parameters &params) {
  if (std::abs(T) < kSingularTemperature) {
    throw NumericalSingularityError("Cell temperature reached zero in c4/T term", t, {T});
  }

  const double T_a = params.get("T_ambient");
  const double c1 = params.get("c1");
  const double c2 = params.get("c2");
  const double c3 = params.get("c3");
  const double c4 = params.get("c4");

  const double T2 = T * T;
  const double Ta2 = T_a * T_a;

  // absorbed - convective - radiative - electrical
  return c1 - c2 * (T - T_a) - c3 * (T2 * T2 - Ta2 * Ta2) - c4 / T;
}

std::vector<double> single_cell_derivatives(double t, const std::vector<double> &state,
                                            const Parameters &params) {
  if (state.size() != 1) {
    throw ConfigurationError("Single-cell state must have exactly one component");
  }
  return {cell_heating_rate(t, state[0], params)};
}

std::vector<double> single_cell_diffusion([[maybe_unused]] double t,
                                          const std::vector<double> &state,
                                          const Parameters &params) {
  return std::vector<double>(state.size(), params.get("c5"));
}

std::vector<double> coupled_cells_derivatives(double t, const std::vector<double> &state,
                                              const Parameters &params) {
  if (state.size() != 2) {
    throw ConfigurationError("Coupled-cell state must have exactly two components");
  }
  const double c6 = params.get("c6");
  const double T1 = state[0];
  const double T2 = state[1];

  double dT1 = 0.0;
  double dT2 = 0.0;
  try {
    dT1 = cell_heating_rate(t, T1, params) + c6 * (T2 - T1);
    dT2 = cell_heating_rate(t, T2, params) + c6 * (T1 - T2);
  } catch (const NumericalSingularityError &e) {
    // report the full two-cell state rather than the single component
    throw NumericalSingularityError(e.detail(), t, state);
  }
  return {dT1, dT2};
}

std::vector<double> coupled_cells_diffusion([[maybe_unused]] double t,
                                            const std::vector<double> &state,
                                            const Parameters &params) {
  return std::vector<double>(state.size(), params.get("c5"));
}

std::vector<double> newton_cooling_derivatives([[maybe_unused]] double t,
                                               const std::vector<double> &state,
                                               const Parameters &params) {
  const double k = params.get("k");
  const double T_a = params.get("T_ambient");
  std::vector<double> dT(state.size());
  for (std::size_t i = 0; i < state.size(); ++i) {
    dT[i] = -k * (state[i] - T_a);
  }
  return dT;
}

double newton_cooling_exact(double t, double t0, double T0, const Parameters &params) {
  const double k = params.get("k");
  const double T_a = params.get("T_ambient");
  return T_a + (T0 - T_a) * std::exp(-k * (t - t0));
}

OdeSystem make_single_cell_system() {
  OdeSystem system;
  system.name = "single_cell";
  system.rhs = single_cell_derivatives;
  system.diffusion = single_cell_diffusion;
  system.required_parameters = single_cell_parameter_names();
  system.required_parameters.push_back("c5");
  system.state_names = {"T"};
  return system;
}

OdeSystem make_coupled_cells_system() {
  OdeSystem system;
  system.name = "coupled_cells";
  system.rhs = coupled_cells_derivatives;
  system.diffusion = coupled_cells_diffusion;
  system.required_parameters = single_cell_parameter_names();
  system.required_parameters.push_back("c5");
  system.required_parameters.push_back("c6");
  system.state_names = {"T1", "T2"};
  return system;
}

OdeSystem make_newton_cooling_system() {
  OdeSystem system;
  system.name = "newton_cooling";
  system.rhs = newton_cooling_derivatives;
  system.required_parameters = {"k", "T_ambient"};
  system.state_names = {"T"};
  return system;
}

OdeSystem make_constant_noise_system(std::size_t dimension) {
  OdeSystem system;
  system.name = "constant_noise";
  system.rhs = [dimension]([[maybe_unused]] double t, [[maybe_unused]] const State &state,
                           [[maybe_unused]] const Parameters &params) {
    return State(dimension, 0.0);
  };
  system.diffusion = [dimension]([[maybe_unused]] double t,
                                 [[maybe_unused]] const State &state, const Parameters &params) {
    return State(dimension, params.get("sigma"));
  };
  system.required_parameters = {"sigma"};
  return system;
}
