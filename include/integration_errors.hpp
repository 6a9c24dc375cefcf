#ifndef INTEGRATION_ERRORS_HPP
#define INTEGRATION_ERRORS_HPP

#include "trajectory.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * @file integration_errors.hpp
 * @brief Exception hierarchy for the fixed-step IVP engine.
 *
 * @details
 * Two families of failures are distinguished:
 * - ConfigurationError: the inputs are invalid (step count, time span, missing
 *   parameters). Raised before any stepping begins.
 * - IntegrationError: the numerics failed while stepping. The exception carries the
 *   step index, the time and state where the failure was detected, and the partial
 *   trajectory computed up to the last good step.
 *
 * @code{.cpp}
 * try {
 *     Trajectory traj = integrate(system, params, state0, opts, stepper);
 * } catch (const NonFiniteStateError& e) {
 *     std::cerr << e.what() << '\n';
 *     const Trajectory& usable = e.partialTrajectory();
 * }
 * @endcode
 */

class ConfigurationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

class IntegrationError : public std::runtime_error {
public:
  static constexpr std::size_t kUnknownStep = static_cast<std::size_t>(-1);

  /**
   * @param detail Description of the failure, without location information
   * @param t Time at which the failure was detected
   * @param state State at which the failure was detected
   * @param step_index Index of the step being taken, or kUnknownStep when raised
   *        outside the driver (e.g. directly from a right-hand side)
   * @param partial Trajectory up to the last finite step
   */
  IntegrationError(const std::string &detail, double t, State state,
                   std::size_t step_index = kUnknownStep, Trajectory partial = {});

  [[nodiscard]] const std::string &detail() const { return detail_; }
  [[nodiscard]] double time() const { return time_; }
  [[nodiscard]] const State &state() const { return state_; }
  [[nodiscard]] std::size_t stepIndex() const { return step_index_; }
  [[nodiscard]] bool hasStepIndex() const { return step_index_ != kUnknownStep; }
  [[nodiscard]] const Trajectory &partialTrajectory() const { return partial_; }

private:
  std::string detail_;
  double time_;
  State state_;
  std::size_t step_index_;
  Trajectory partial_;
};

/// The model is undefined at the evaluated state (e.g. division by a vanishing component).
class NumericalSingularityError : public IntegrationError {
public:
  using IntegrationError::IntegrationError;
};

/// A computed state component overflowed or became NaN.
class NonFiniteStateError : public IntegrationError {
public:
  using IntegrationError::IntegrationError;
};

/// The caller's cancellation check returned true between two steps.
class IntegrationCancelled : public IntegrationError {
public:
  using IntegrationError::IntegrationError;
};

#endif // INTEGRATION_ERRORS_HPP
