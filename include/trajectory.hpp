#pragma once
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

/**
 * @file trajectory.hpp
 * @brief State vector and trajectory containers shared by every integrator.
 *
 * @details
 * A State is a plain vector of reals; a scalar problem is the one-dimensional case.
 * A Trajectory stores the time grid and the state at each grid point, index-aligned:
 * `times[j]` belongs to `states[j]`.
 */

using State = std::vector<double>;

struct Trajectory {
  std::vector<double> times;
  std::vector<State> states;

  [[nodiscard]] std::size_t size() const { return times.size(); }
  [[nodiscard]] bool empty() const { return times.empty(); }

  [[nodiscard]] std::size_t dimension() const {
    return states.empty() ? 0 : states.front().size();
  }

  void reserve(std::size_t n) {
    times.reserve(n);
    states.reserve(n);
  }

  void append(double t, const State &state) {
    times.push_back(t);
    states.push_back(state);
  }

  [[nodiscard]] double finalTime() const {
    if (times.empty()) {
      throw std::out_of_range("Trajectory is empty");
    }
    return times.back();
  }

  [[nodiscard]] const State &finalState() const {
    if (states.empty()) {
      throw std::out_of_range("Trajectory is empty");
    }
    return states.back();
  }

  // Time series of one state component, e.g. for error norms or plotting.
  [[nodiscard]] std::vector<double> component(std::size_t index) const {
    std::vector<double> values;
    values.reserve(states.size());
    for (const auto &s : states) {
      values.push_back(s.at(index));
    }
    return values;
  }
};
