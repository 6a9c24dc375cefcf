#pragma once
#include "trajectory.hpp"

#include <ostream>
#include <string>
#include <vector>

struct EnsembleResult;

// Column names for a state of the given dimension: the supplied names when they match,
// otherwise y0, y1, ...
std::vector<std::string> state_column_names(const std::vector<std::string> &names,
                                            std::size_t dimension);

// "t,<name0>,<name1>,..."
void write_trajectory_header(std::ostream &out, const std::vector<std::string> &columns);

// One row at full double precision.
void write_trajectory_row(std::ostream &out, double t, const State &state);

/**
 * @brief Write a trajectory as CSV (header "t,<names>", one row per grid point)
 * @return false (with a message on std::cerr) if the file cannot be written
 */
bool write_trajectory_csv(const std::string &filename, const Trajectory &trajectory,
                          const std::vector<std::string> &state_names = {});

/**
 * @brief Write ensemble statistics as CSV: t, then <name>_mean, <name>_var, <name>_se
 *        for each state component
 * @return false (with a message on std::cerr) if the file cannot be written
 */
bool write_ensemble_csv(const std::string &filename, const EnsembleResult &result,
                        const std::vector<std::string> &state_names = {});

// e.g. ("data/single_cell", "rk4", 1000) -> "data/single_cell_rk4_n1000.csv"
std::string make_output_filename(const std::string &prefix, const std::string &method,
                                 int n_steps);
