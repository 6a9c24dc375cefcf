#include "integration_errors.hpp"

#include <sstream>
#include <utility>

namespace {
std::string format_message(const std::string &detail, double t, const State &state,
                           std::size_t step_index) {
  std::ostringstream ss;
  ss << detail << " (";
  if (step_index != IntegrationError::kUnknownStep) {
    ss << "step " << step_index << ", ";
  }
  ss << "t = " << t << ", state = [";
  for (std::size_t i = 0; i < state.size(); ++i) {
    if (i > 0) {
      ss << ", ";
    }
    ss << state[i];
  }
  ss << "])";
  return ss.str();
}
} // namespace

IntegrationError::IntegrationError(const std::string &detail, double t, State state,
                                   std::size_t step_index, Trajectory partial)
    : std::runtime_error(format_message(detail, t, state, step_index)), detail_(detail),
      time_(t), state_(std::move(state)), step_index_(step_index), partial_(std::move(partial)) {}
