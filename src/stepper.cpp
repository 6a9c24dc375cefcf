#include "stepper.hpp"

#include "explicit_steps.hpp"
#include "integration_errors.hpp"

#include <algorithm>
#include <cctype>

namespace {
// Bind the parameters so the step rules see a plain f(t, y).
DerivativeFunction bind_rhs(const RhsFunction &rhs, const Parameters &params) {
  if (!rhs) {
    throw ConfigurationError("System has no right-hand side");
  }
  return [&rhs, &params](double t, const std::vector<double> &y) { return rhs(t, y, params); };
}
} // namespace

State ForwardEulerStepper::advance(double t, const State &state, double dt,
                                   const OdeSystem &system, const Parameters &params,
                                   [[maybe_unused]] const State &dW) const {
  return euler_step(t, dt, state, bind_rhs(system.rhs, params));
}

State MidpointRK2Stepper::advance(double t, const State &state, double dt,
                                  const OdeSystem &system, const Parameters &params,
                                  [[maybe_unused]] const State &dW) const {
  return rk2_midpoint_step(t, dt, state, bind_rhs(system.rhs, params));
}

State RK4Stepper::advance(double t, const State &state, double dt, const OdeSystem &system,
                          const Parameters &params, [[maybe_unused]] const State &dW) const {
  return rk4_step(t, dt, state, bind_rhs(system.rhs, params));
}

State EulerMaruyamaStepper::advance(double t, const State &state, double dt,
                                    const OdeSystem &system, const Parameters &params,
                                    const State &dW) const {
  if (!system.hasDiffusion()) {
    throw ConfigurationError("Euler-Maruyama requires a diffusion function");
  }
  return euler_maruyama_step(t, dt, state, bind_rhs(system.rhs, params),
                             bind_rhs(system.diffusion, params), dW);
}

std::unique_ptr<Stepper> createStepper(StepperType type) {
  switch (type) {
  case StepperType::FORWARD_EULER:
    return std::make_unique<ForwardEulerStepper>();
  case StepperType::RK2_MIDPOINT:
    return std::make_unique<MidpointRK2Stepper>();
  case StepperType::RK4:
    return std::make_unique<RK4Stepper>();
  case StepperType::EULER_MARUYAMA:
    return std::make_unique<EulerMaruyamaStepper>();
  default:
    throw ConfigurationError("Unknown stepper type");
  }
}

StepperType parseStepperType(const std::string &name) {
  std::string key = name;
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
  std::replace(key.begin(), key.end(), '-', '_');

  if (key == "euler" || key == "forward_euler") {
    return StepperType::FORWARD_EULER;
  } else if (key == "rk2" || key == "midpoint" || key == "rk2_midpoint") {
    return StepperType::RK2_MIDPOINT;
  } else if (key == "rk4") {
    return StepperType::RK4;
  } else if (key == "em" || key == "euler_maruyama") {
    return StepperType::EULER_MARUYAMA;
  }
  throw ConfigurationError("Unknown stepping method: " + name +
                           " (supported: euler, rk2, rk4, euler_maruyama)");
}

std::string stepperTypeToString(StepperType type) {
  switch (type) {
  case StepperType::FORWARD_EULER:
    return "euler";
  case StepperType::RK2_MIDPOINT:
    return "rk2";
  case StepperType::RK4:
    return "rk4";
  case StepperType::EULER_MARUYAMA:
    return "em";
  default:
    return "unknown";
  }
}
