#include "trajectory_io.hpp"

#include "monte_carlo.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

std::vector<std::string> state_column_names(const std::vector<std::string> &names,
                                            std::size_t dimension) {
  if (names.size() == dimension) {
    return names;
  }
  std::vector<std::string> columns;
  columns.reserve(dimension);
  for (std::size_t i = 0; i < dimension; ++i) {
    columns.push_back("y" + std::to_string(i));
  }
  return columns;
}

void write_trajectory_header(std::ostream &out, const std::vector<std::string> &columns) {
  out << "t";
  for (const auto &c : columns) {
    out << "," << c;
  }
  out << "\n";
}

void write_trajectory_row(std::ostream &out, double t, const State &state) {
  out << std::setprecision(std::numeric_limits<double>::max_digits10) << t;
  for (double v : state) {
    out << "," << v;
  }
  out << "\n";
}

bool write_trajectory_csv(const std::string &filename, const Trajectory &trajectory,
                          const std::vector<std::string> &state_names) {
  std::ofstream outfile(filename);
  if (!outfile.is_open()) {
    std::cerr << "Error opening output file: " << filename << '\n';
    return false;
  }

  write_trajectory_header(outfile, state_column_names(state_names, trajectory.dimension()));
  for (std::size_t j = 0; j < trajectory.size(); ++j) {
    write_trajectory_row(outfile, trajectory.times[j], trajectory.states[j]);
  }

  if (!outfile) {
    std::cerr << "Error writing trajectory to " << filename << '\n';
    return false;
  }
  return true;
}

bool write_ensemble_csv(const std::string &filename, const EnsembleResult &result,
                        const std::vector<std::string> &state_names) {
  std::ofstream outfile(filename);
  if (!outfile.is_open()) {
    std::cerr << "Error opening output file: " << filename << '\n';
    return false;
  }

  const std::size_t dim = result.mean.empty() ? 0 : result.mean.front().size();
  const auto columns = state_column_names(state_names, dim);

  outfile << "t";
  for (const auto &c : columns) {
    outfile << "," << c << "_mean," << c << "_var," << c << "_se";
  }
  outfile << "\n";

  outfile << std::setprecision(std::numeric_limits<double>::max_digits10);
  for (std::size_t j = 0; j < result.times.size(); ++j) {
    outfile << result.times[j];
    for (std::size_t c = 0; c < dim; ++c) {
      outfile << "," << result.mean[j][c] << "," << result.variance[j][c] << ","
              << result.standard_error[j][c];
    }
    outfile << "\n";
  }

  if (!outfile) {
    std::cerr << "Error writing ensemble statistics to " << filename << '\n';
    return false;
  }
  return true;
}

std::string make_output_filename(const std::string &prefix, const std::string &method,
                                 int n_steps) {
  std::ostringstream ss;
  ss << prefix << "_" << method << "_n" << n_steps << ".csv";
  return ss.str();
}
