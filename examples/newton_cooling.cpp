#include <cmath>
#include <cstdio>
#include <memory>
#include <vector>
#include "integrate.hpp"
#include "pv_cell_model.hpp"
#include "stepper.hpp"

int main() {
    // Cooling of a cell with the irradiance switched off:
    // dT/dt = -k (T - T_ambient), T(0) = 300 K
    Parameters params{{"k", 1.0}, {"T_ambient", 290.0}};
    double T0 = 300.0;

    IntegrateOpts opts;
    opts.t0 = 0.0;
    opts.t_end = 1.0;
    opts.n_steps = 1000;

    OdeSystem system = make_newton_cooling_system();
    double exact = newton_cooling_exact(opts.t_end, opts.t0, T0, params);

    printf("Exact T(%.1f) = %.6f K\n", opts.t_end, exact);

    for (StepperType type : {StepperType::FORWARD_EULER, StepperType::RK2_MIDPOINT, StepperType::RK4}) {
        auto stepper = createStepper(type);
        Trajectory traj = integrate(system, params, {T0}, opts, *stepper);
        double T_end = traj.finalState()[0];
        printf("%-16s T(%.1f) = %.6f K, error = %.3e\n", stepper->getType().c_str(),
               traj.finalTime(), T_end, std::abs(T_end - exact));
    }

    return 0;
}
