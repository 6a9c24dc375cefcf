// pv_cell_model.hpp
#ifndef PV_CELL_MODEL_HPP
#define PV_CELL_MODEL_HPP

/**
 * @file pv_cell_model.hpp
 * @brief Thermal models of photovoltaic cells and reference test problems.
 *
 * @details
 * The running example is a lumped energy balance for the temperature T of a PV cell
 * exposed to sunlight:
 *
 * \f[
 * \frac{dT}{dt} = c_1 - c_2 (T - T_a) - c_3 (T^4 - T_a^4) - \frac{c_4}{T}
 * \f]
 *
 * @section terms Terms
 * @li c1: heating rate from absorbed irradiance (K/s)
 * @li c2: convective loss coefficient (1/s)
 * @li c3: radiative loss coefficient (1/(K^3 s))
 * @li c4: electrical extraction term (K^2/s); undefined at T = 0
 * @li c5: amplitude of irradiance fluctuations (K/sqrt(s)), the additive noise
 *     \f$ dT = f\,dt + c_5\,dW \f$
 * @li c6: conductive coupling between neighbouring cells (1/s)
 * @li T_ambient: ambient temperature (K)
 *
 * @section systems Systems
 * @li Single cell: the equation above, state {T}
 * @li Two coupled cells: \f$ dT_i/dt = F(T_i) + c_6 (T_j - T_i) \f$, state {T1, T2}
 * @li Newton cooling: \f$ dT/dt = -k (T - T_a) \f$ with closed-form solution, used
 *     for order-of-accuracy checks
 * @li Constant noise: f = 0, g = sigma; the zero-drift Monte Carlo reference case
 *
 * @section example Example Usage
 * @code{.cpp}
 * OdeSystem cell = make_single_cell_system();
 * Parameters params = default_pv_cell_parameters();
 * IntegrateOpts opts;
 * opts.t_end = 600.0;
 * opts.n_steps = 6000;
 * RK4Stepper rk4;
 * Trajectory traj = integrate(cell, params, {300.0}, opts, rk4);
 * @endcode
 */

#include "ode_system.hpp"
#include "parameters.hpp"
#include "trajectory.hpp"

#include <string>
#include <vector>

// Below this |T| the c4/T term is treated as singular.
constexpr double kSingularTemperature = 1e-12; // K

/**
 * @brief Illustrative coefficients for a cell near 300 K (steady state about 325 K)
 *
 * T_ambient = 290, c1 = 2.0, c2 = 0.05, c3 = 5e-11, c4 = 20, c5 = 0.5, c6 = 0.1
 */
Parameters default_pv_cell_parameters();

/// Names of the parameters read by the single-cell model.
std::vector<std::string> single_cell_parameter_names();

/**
 * @brief Net heating rate F(T) of one cell
 * @throws NumericalSingularityError if |T| < kSingularTemperature
 * @throws ConfigurationError if a coefficient is missing
 */
double cell_heating_rate(double t, double T, const Parameters &params);

/**
 * @brief Right-hand side of the single-cell model
 * @param t Time (s)
 * @param state {T}
 * @param params Requires T_ambient, c1..c4
 * @return {dT/dt}
 */
std::vector<double> single_cell_derivatives(double t, const std::vector<double> &state,
                                            const Parameters &params);

/// Additive irradiance noise: {c5}.
std::vector<double> single_cell_diffusion(double t, const std::vector<double> &state,
                                          const Parameters &params);

/**
 * @brief Right-hand side of two thermally coupled cells
 * @param state {T1, T2}
 * @param params Requires T_ambient, c1..c4, c6
 */
std::vector<double> coupled_cells_derivatives(double t, const std::vector<double> &state,
                                              const Parameters &params);

/// Independent irradiance noise on each cell: {c5, c5}.
std::vector<double> coupled_cells_diffusion(double t, const std::vector<double> &state,
                                            const Parameters &params);

/// dT/dt = -k (T - T_ambient)
std::vector<double> newton_cooling_derivatives(double t, const std::vector<double> &state,
                                               const Parameters &params);

/**
 * @brief Closed-form Newton cooling solution
 *
 * \f[ T(t) = T_a + (T_0 - T_a) e^{-k (t - t_0)} \f]
 */
double newton_cooling_exact(double t, double t0, double T0, const Parameters &params);

OdeSystem make_single_cell_system();
OdeSystem make_coupled_cells_system();
OdeSystem make_newton_cooling_system();

/// f = 0, g = sigma in every component; requires parameter "sigma".
OdeSystem make_constant_noise_system(std::size_t dimension = 1);

#endif // PV_CELL_MODEL_HPP
