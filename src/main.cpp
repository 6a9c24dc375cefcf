#include "convergence.hpp"
#include "integrate.hpp"
#include "monte_carlo.hpp"
#include "parameters.hpp"
#include "pv_cell_model.hpp"
#include "stepper.hpp"
#include "trajectory_io.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <gsl/gsl_errno.h>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {
struct CliOptions {
  std::string model = "single";
  std::string method = "rk4";
  int n_steps = 1000;
  double t_end = 600.0;
  double T0 = 300.0;
  std::string params_file;
  int n_trials = 100;
  unsigned long seed = 42;
  int n_threads = 1;
  std::string output_file;
  bool convergence = false;
};

void print_usage(const char *prog) {
  std::cerr << "Usage: " << prog << " [options]\n"
            << "  --model single|coupled|cooling   (default single)\n"
            << "  --method euler|rk2|rk4|em        (default rk4)\n"
            << "  --steps N                        (default 1000)\n"
            << "  --t-end T                        (default 600 s)\n"
            << "  --T0 T                           (initial temperature, default 300 K)\n"
            << "  --params FILE                    (CSV name,value overrides)\n"
            << "  --trials N                       (Monte Carlo trials for em, default 100)\n"
            << "  --seed S                         (default 42)\n"
            << "  --threads N                      (default 1)\n"
            << "  --output FILE                    (CSV output)\n"
            << "  --convergence                    (order study, cooling model only)\n";
}

bool parse_args(int argc, char *argv[], CliOptions &cli) {
  for (int i = 1; i < argc; i++) {
    if (strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
      cli.model = argv[++i];
    } else if (strcmp(argv[i], "--method") == 0 && i + 1 < argc) {
      cli.method = argv[++i];
    } else if (strcmp(argv[i], "--steps") == 0 && i + 1 < argc) {
      cli.n_steps = std::stoi(argv[++i]);
    } else if (strcmp(argv[i], "--t-end") == 0 && i + 1 < argc) {
      cli.t_end = std::stod(argv[++i]);
    } else if (strcmp(argv[i], "--T0") == 0 && i + 1 < argc) {
      cli.T0 = std::stod(argv[++i]);
    } else if (strcmp(argv[i], "--params") == 0 && i + 1 < argc) {
      cli.params_file = argv[++i];
    } else if (strcmp(argv[i], "--trials") == 0 && i + 1 < argc) {
      cli.n_trials = std::stoi(argv[++i]);
    } else if (strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
      cli.seed = std::stoul(argv[++i]);
    } else if (strcmp(argv[i], "--threads") == 0 && i + 1 < argc) {
      cli.n_threads = std::stoi(argv[++i]);
    } else if (strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
      cli.output_file = argv[++i];
    } else if (strcmp(argv[i], "--convergence") == 0) {
      cli.convergence = true;
    } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      return false;
    } else {
      std::cerr << "Unknown or incomplete option: " << argv[i] << '\n';
      return false;
    }
  }
  return true;
}

int run_convergence(const CliOptions &cli, const OdeSystem &system, const Parameters &params,
                    const Stepper &stepper) {
  const double t0 = 0.0;
  const double T0 = cli.T0;
  ExactSolution exact = [&params, t0, T0](double t) {
    return State{newton_cooling_exact(t, t0, T0, params)};
  };

  const int n_base = std::max(1, cli.n_steps / 16);
  ConvergenceReport report =
      convergence_study(system, params, {T0}, t0, cli.t_end, exact, stepper, n_base, 4);

  std::cout << "\n=== CONVERGENCE: " << stepper.getType() << " ===" << '\n';
  std::cout << std::setw(10) << "N" << std::setw(16) << "dt" << std::setw(16) << "error"
            << std::setw(12) << "ratio" << '\n';
  for (std::size_t i = 0; i < report.points.size(); ++i) {
    const auto &p = report.points[i];
    std::cout << std::setw(10) << p.n_steps << std::setw(16) << std::scientific
              << std::setprecision(4) << p.dt << std::setw(16) << p.error;
    if (i > 0) {
      std::cout << std::setw(12) << std::fixed << std::setprecision(3)
                << report.error_ratios[i - 1];
    }
    std::cout << std::defaultfloat << '\n';
  }
  std::cout << "Observed order: " << report.observed_order << " (expected " << stepper.order()
            << ")" << '\n';
  return 0;
}
} // namespace

int main(int argc, char *argv[]) {
  /*
   * PV CELL THERMAL SOLVER
   *
   * Integrates the photovoltaic-cell temperature models with a fixed-step explicit
   * method chosen on the command line:
   * - single:  one cell, dT/dt = c1 - c2 (T - Ta) - c3 (T^4 - Ta^4) - c4/T
   * - coupled: two cells exchanging heat through c6
   * - cooling: Newton cooling reference problem with closed-form solution
   *
   * With --method em the stochastic model (irradiance noise c5) is averaged over
   * --trials independent Euler-Maruyama runs.
   */

  gsl_set_error_handler_off();

  CliOptions cli;
  try {
    if (!parse_args(argc, argv, cli)) {
      print_usage(argv[0]);
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "Invalid option value: " << e.what() << '\n';
    print_usage(argv[0]);
    return 1;
  }

  try {
    OdeSystem system;
    Parameters params;
    State state0;

    if (cli.model == "single") {
      system = make_single_cell_system();
      params = default_pv_cell_parameters();
      state0 = {cli.T0};
    } else if (cli.model == "coupled") {
      system = make_coupled_cells_system();
      params = default_pv_cell_parameters();
      state0 = {cli.T0, cli.T0 + 10.0};
    } else if (cli.model == "cooling") {
      system = make_newton_cooling_system();
      params = Parameters{{"k", 1.0}, {"T_ambient", 290.0}};
      state0 = {cli.T0};
    } else {
      std::cerr << "Unknown model: " << cli.model << " (supported: single, coupled, cooling)\n";
      return 1;
    }

    if (!cli.params_file.empty()) {
      params.merge(read_parameter_file(cli.params_file));
      std::cout << "[Params] Loaded overrides from " << cli.params_file << '\n';
    }

    const StepperType type = parseStepperType(cli.method);
    auto stepper = createStepper(type);

    std::cout << "Model: " << system.name << ", method: " << stepper->getType()
              << ", steps: " << cli.n_steps << ", t_end: " << cli.t_end << '\n';
    for (const auto &name : params.names()) {
      std::cout << "  " << name << " = " << params.get(name) << '\n';
    }

    if (cli.convergence) {
      if (cli.model != "cooling") {
        std::cerr << "--convergence needs the cooling model (closed-form solution).\n";
        return 1;
      }
      return run_convergence(cli, system, params, *stepper);
    }

    if (cli.output_file.empty()) {
      std::error_code ec;
      std::filesystem::create_directories("data", ec);
      if (ec) {
        std::cerr << "Warning: could not create data/: " << ec.message() << '\n';
      }
    }

    IntegrateOpts opts;
    opts.t0 = 0.0;
    opts.t_end = cli.t_end;
    opts.n_steps = cli.n_steps;

    if (stepper->isStochastic()) {
      EnsembleOpts ens;
      ens.n_trials = cli.n_trials;
      ens.seed = cli.seed;
      ens.n_threads = cli.n_threads;
      ens.verbose = true;

      EnsembleResult result = simulate_ensemble(system, params, state0, opts, ens, *stepper);

      const std::string filename =
          cli.output_file.empty()
              ? make_output_filename("data/" + system.name, stepperTypeToString(type),
                                     cli.n_steps)
              : cli.output_file;
      if (write_ensemble_csv(filename, result, system.state_names)) {
        std::cout << "Ensemble statistics written to: " << filename << '\n';
      }
      return 0;
    }

    opts.output_filename = cli.output_file.empty()
                               ? make_output_filename("data/" + system.name,
                                                      stepperTypeToString(type), cli.n_steps)
                               : cli.output_file;
    opts.progress_stride = std::max(1, cli.n_steps / 10);

    Trajectory traj = integrate(system, params, state0, opts, *stepper);

    std::cout << "\n=== INTEGRATION COMPLETE ===" << '\n';
    std::cout << "Final time: " << traj.finalTime() << '\n';
    const State &y = traj.finalState();
    const auto columns = state_column_names(system.state_names, y.size());
    for (std::size_t i = 0; i < y.size(); ++i) {
      std::cout << "  " << columns[i] << " = " << std::setprecision(10) << y[i] << '\n';
    }
    if (cli.model == "cooling") {
      const double exact = newton_cooling_exact(traj.finalTime(), 0.0, cli.T0, params);
      std::cout << "  exact = " << exact << ", error = " << std::abs(y[0] - exact) << '\n';
    }
    std::cout << "Trajectory written to: " << *opts.output_filename << '\n';
  } catch (const ConfigurationError &e) {
    std::cerr << "Configuration error: " << e.what() << '\n';
    return 1;
  } catch (const IntegrationError &e) {
    std::cerr << "Integration failed: " << e.what() << '\n';
    std::cerr << "Partial trajectory has " << e.partialTrajectory().size() << " points.\n";
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 3;
  }

  return 0;
}
