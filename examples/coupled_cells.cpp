#include "integrate.hpp"
#include "pv_cell_model.hpp"
#include "stepper.hpp"
#include "trajectory_io.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <vector>

int main() {
  // Two neighbouring cells starting 20 K apart relax towards a common steady state.
  Parameters params = default_pv_cell_parameters();
  OdeSystem system = make_coupled_cells_system();
  RK4Stepper rk4;

  std::vector<double> coupling_strengths = {0.0, 0.01, 0.1, 1.0};

  IntegrateOpts opts;
  opts.t0 = 0.0;
  opts.t_end = 120.0;
  opts.n_steps = 1200;

  std::filesystem::create_directories("data");

  for (size_t i = 0; i < coupling_strengths.size(); i++) {
    std::cout << "Processing " << (i + 1) << " of " << coupling_strengths.size()
              << " coupling strengths..." << std::endl;

    params.set("c6", coupling_strengths[i]);
    opts.output_filename = make_output_filename(
        "data/coupled_cells_c6_" + std::to_string(i), "rk4", opts.n_steps);

    Trajectory traj = integrate(system, params, {300.0, 320.0}, opts, rk4);
    const State &y = traj.finalState();

    std::cout << "c6 = " << coupling_strengths[i] << " 1/s" << std::endl;
    std::cout << "T1(" << traj.finalTime() << " s) = " << y[0] << " K, T2 = " << y[1]
              << " K, |T1 - T2| = " << std::abs(y[0] - y[1]) << " K" << std::endl;
  }
}
