#ifndef EXPLICIT_STEPS_HPP
#define EXPLICIT_STEPS_HPP

#include "trajectory.hpp"

#include <functional>
#include <stdexcept>
#include <vector>

/**
 * @file explicit_steps.hpp
 * @brief Single-step update rules for explicit fixed-step integration.
 *
 * @details
 * This file implements the one-step maps used by the integration driver for
 * initial value problems of the form:
 * \f{eqnarray*}{
 * \frac{dy}{dt} &=& f(t, y) \\
 * y(t_0) &=& y_0
 * \f}
 * and, for the stochastic case, Itô SDEs with diagonal noise:
 * \f[ dy = f(t, y)\,dt + g(t, y)\,dW \f]
 *
 * Every function takes the current state by value semantics (the input is never
 * modified) and returns the state at t + dt.
 *
 * | Method          | Stages | Global order        |
 * |-----------------|--------|---------------------|
 * | Forward Euler   | 1      | 1                   |
 * | RK2 (midpoint)  | 2      | 2                   |
 * | RK4 (classical) | 4      | 4                   |
 * | Euler-Maruyama  | 1      | strong 1/2, weak 1  |
 *
 * Example usage with Newton's law of cooling:
 * @code{.cpp}
 * // System: \f$\frac{dT}{dt} = -k(T - T_a)\f$
 * auto derivatives = [](double t, const std::vector<double>& state)
 *     -> std::vector<double>
 * {
 *     const double k = 1.0;      // Cooling rate (1/s)
 *     const double T_a = 290.0;  // Ambient temperature (K)
 *     return { -k * (state[0] - T_a) };
 * };
 * std::vector<double> next = rk4_step(0.0, 0.01, {300.0}, derivatives);
 * @endcode
 *
 * @warning Explicit methods; not suited to stiff systems
 * @see stepper.hpp for the polymorphic wrappers used by the driver
 */

using DerivativeFunction = std::function<std::vector<double>(double, const std::vector<double> &)>;

/**
 * @brief Performs one forward Euler step.
 *
 * \f[ y_{n+1} = y_n + h f(t_n, y_n) \f]
 *
 * Local truncation error \f$O(h^2)\f$, global error \f$O(h)\f$.
 *
 * @param t Current time
 * @param dt Time step size (must be positive)
 * @param state Current state vector
 * @param derivatives Function that computes f(t, y)
 * @return State at t + dt
 *
 * @throws std::runtime_error
 *         - If state vector is empty
 *         - If time step dt \f$\leq\f$ 0
 *         - If derivatives dimension \f$\neq\f$ state dimension
 */
std::vector<double> euler_step(double t, double dt, const std::vector<double> &state,
                               const DerivativeFunction &derivatives);

/**
 * @brief Performs one explicit midpoint (RK2) step.
 *
 * \f{eqnarray*}{
 * k_1 &=& h f(t_n, y_n) \\
 * k_2 &=& h f(t_n + \frac{h}{2}, y_n + \frac{k_1}{2}) \\
 * y_{n+1} &=& y_n + k_2
 * \f}
 *
 * Global error \f$O(h^2)\f$.
 *
 * @throws std::runtime_error on empty state, non-positive dt or dimension mismatch
 */
std::vector<double> rk2_midpoint_step(double t, double dt, const std::vector<double> &state,
                                      const DerivativeFunction &derivatives);

/**
 * @brief Performs one classical RK4 step.
 *
 * Four slope evaluations combined with the Butcher tableau
 * <pre>
 *   0   |
 *   1/2 | 1/2
 *   1/2 | 0    1/2
 *   1   | 0    0    1
 *   ----+-------------------
 *       | 1/6  1/3  1/3  1/6
 * </pre>
 * Each intermediate slope is evaluated at the state reached by the previous
 * one, so f is called exactly four times per step.
 *
 * @throws std::runtime_error on empty state, non-positive dt or dimension mismatch
 */
std::vector<double> rk4_step(double t, double dt, const std::vector<double> &state,
                             const DerivativeFunction &derivatives);

/**
 * @brief Performs one Euler-Maruyama step for an SDE with diagonal noise.
 *
 * \f[ y_{n+1} = y_n + h f(t_n, y_n) + g(t_n, y_n) \odot \Delta W_n \f]
 *
 * @param t Current time
 * @param dt Time step size (must be positive)
 * @param state Current state vector
 * @param drift Function that computes f(t, y)
 * @param diffusion Function that computes g(t, y)
 * @param dW Wiener increment for this step, one N(0, dt) draw per component
 * @return State at t + dt
 *
 * @throws std::runtime_error on empty state, non-positive dt, or when drift,
 *         diffusion or dW differ in size from the state
 */
std::vector<double> euler_maruyama_step(double t, double dt, const std::vector<double> &state,
                                        const DerivativeFunction &drift,
                                        const DerivativeFunction &diffusion,
                                        const std::vector<double> &dW);

#endif // EXPLICIT_STEPS_HPP
