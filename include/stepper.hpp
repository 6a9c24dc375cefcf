/**
 * @file stepper.hpp
 * @brief Interchangeable single-step integrators behind one interface
 *
 * Each stepper advances a state by one fixed time increment for a given OdeSystem.
 * Steppers are stateless: advance() is a pure function of its arguments, so one
 * instance can be shared by any number of integrations, including concurrent ones.
 *
 * Supported methods:
 * - Forward Euler
 * - Explicit RK2 (midpoint)
 * - Classical RK4
 * - Euler-Maruyama (stochastic)
 *
 * @example Basic Usage
 * ```cpp
 * auto stepper = createStepper(StepperType::RK4);
 * State next = stepper->advance(t, state, dt, system, params, {});
 * ```
 *
 * @example Selecting by Name
 * ```cpp
 * auto stepper = createStepper(parseStepperType("rk2"));
 * std::cout << stepper->getType() << " (order " << stepper->order() << ")" << std::endl;
 * ```
 */

#ifndef STEPPER_HPP
#define STEPPER_HPP

#include "ode_system.hpp"
#include "parameters.hpp"
#include "trajectory.hpp"

#include <memory>
#include <string>

/**
 * @brief Enumeration of supported stepping methods
 */
enum class StepperType {
    FORWARD_EULER,  ///< First-order explicit Euler
    RK2_MIDPOINT,   ///< Second-order explicit midpoint rule
    RK4,            ///< Fourth-order classical Runge-Kutta
    EULER_MARUYAMA  ///< Stochastic Euler for Itô SDEs
};

/**
 * @brief Abstract base class for single-step integrators
 *
 * Strategy interface: the integration driver is written once against it and
 * parameterized by the choice of method.
 */
class Stepper {
public:
    virtual ~Stepper() = default;

    /**
     * @brief Advance the state from t to t + dt
     *
     * @param t Current time
     * @param state Current state (not modified)
     * @param dt Time step (positive)
     * @param system Right-hand side and, for stochastic steppers, diffusion
     * @param params Parameters forwarded unchanged to every evaluation
     * @param dW Wiener increment for this step; ignored by deterministic steppers
     * @return State at t + dt
     */
    [[nodiscard]] virtual State advance(double t, const State &state, double dt,
                                        const OdeSystem &system, const Parameters &params,
                                        const State &dW) const = 0;

    /// True when advance() consumes a Wiener increment.
    [[nodiscard]] virtual bool isStochastic() const { return false; }

    /// Global order of accuracy (weak order for stochastic steppers).
    [[nodiscard]] virtual int order() const = 0;

    [[nodiscard]] virtual std::string getType() const = 0;
};

class ForwardEulerStepper : public Stepper {
public:
    [[nodiscard]] State advance(double t, const State &state, double dt, const OdeSystem &system,
                                const Parameters &params, const State &dW) const override;
    [[nodiscard]] int order() const override { return 1; }
    [[nodiscard]] std::string getType() const override { return "Forward Euler"; }
};

class MidpointRK2Stepper : public Stepper {
public:
    [[nodiscard]] State advance(double t, const State &state, double dt, const OdeSystem &system,
                                const Parameters &params, const State &dW) const override;
    [[nodiscard]] int order() const override { return 2; }
    [[nodiscard]] std::string getType() const override { return "RK2 (midpoint)"; }
};

class RK4Stepper : public Stepper {
public:
    [[nodiscard]] State advance(double t, const State &state, double dt, const OdeSystem &system,
                                const Parameters &params, const State &dW) const override;
    [[nodiscard]] int order() const override { return 4; }
    [[nodiscard]] std::string getType() const override { return "RK4"; }
};

/**
 * @brief Euler-Maruyama for dy = f dt + g dW
 *
 * Strong order 1/2, weak order 1. Requires the system to provide a diffusion
 * function and a dW of the same size as the state.
 */
class EulerMaruyamaStepper : public Stepper {
public:
    [[nodiscard]] State advance(double t, const State &state, double dt, const OdeSystem &system,
                                const Parameters &params, const State &dW) const override;
    [[nodiscard]] bool isStochastic() const override { return true; }
    [[nodiscard]] int order() const override { return 1; }
    [[nodiscard]] std::string getType() const override { return "Euler-Maruyama"; }
};

/**
 * @brief Create a stepper of the given type
 * @throws ConfigurationError for an unknown type
 */
std::unique_ptr<Stepper> createStepper(StepperType type);

/**
 * @brief Parse a method name
 *
 * Accepts (case-insensitive): euler, forward_euler, rk2, midpoint, rk2_midpoint, rk4,
 * em, euler_maruyama.
 *
 * @throws ConfigurationError for an unrecognized name
 */
StepperType parseStepperType(const std::string &name);

/**
 * @brief Short name used in file names and logs ("euler", "rk2", "rk4", "em")
 */
std::string stepperTypeToString(StepperType type);

#endif // STEPPER_HPP
