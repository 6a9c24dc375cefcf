#include "parameters.hpp"

#include "integration_errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

Parameters::Parameters(std::initializer_list<std::pair<const std::string, double>> values) {
  for (const auto &entry : values) {
    set(entry.first, entry.second);
  }
}

void Parameters::set(const std::string &name, double value) {
  if (name.empty()) {
    throw ConfigurationError("Parameter name cannot be empty");
  }
  if (!std::isfinite(value)) {
    throw ConfigurationError("Parameter '" + name + "' must be finite");
  }
  values_[name] = value;
}

double Parameters::get(const std::string &name) const {
  auto it = values_.find(name);
  if (it == values_.end()) {
    throw ConfigurationError("Missing required parameter: " + name);
  }
  return it->second;
}

bool Parameters::contains(const std::string &name) const {
  return values_.find(name) != values_.end();
}

std::vector<std::string> Parameters::names() const {
  std::vector<std::string> out;
  out.reserve(values_.size());
  for (const auto &entry : values_) {
    out.push_back(entry.first);
  }
  return out;
}

void Parameters::merge(const Parameters &overrides) {
  for (const auto &entry : overrides.values_) {
    values_[entry.first] = entry.second;
  }
}

void Parameters::require(const std::vector<std::string> &names) const {
  std::vector<std::string> missing;
  for (const auto &name : names) {
    if (!contains(name)) {
      missing.push_back(name);
    }
  }
  if (missing.empty()) {
    return;
  }

  std::string message = "Missing required parameter";
  message += (missing.size() > 1 ? "s: " : ": ");
  for (std::size_t i = 0; i < missing.size(); ++i) {
    if (i > 0) {
      message += ", ";
    }
    message += missing[i];
  }
  throw ConfigurationError(message);
}

namespace {
std::string trim(const std::string &s) {
  auto first = std::find_if_not(s.begin(), s.end(),
                                [](unsigned char ch) { return std::isspace(ch); });
  auto last = std::find_if_not(s.rbegin(), s.rend(),
                               [](unsigned char ch) { return std::isspace(ch); })
                  .base();
  return (first < last) ? std::string(first, last) : std::string();
}

std::vector<std::string> split_row(const std::string &line) {
  std::vector<std::string> toks;
  std::stringstream ss(line);
  std::string tok;
  while (std::getline(ss, tok, ',')) {
    toks.push_back(trim(tok));
  }
  return toks;
}
} // namespace

Parameters read_parameter_file(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw ConfigurationError("Could not open parameter file " + filename);
  }

  // Normalised header: lower case, no whitespace or quotes
  auto norm = [](std::string s) {
    s.erase(std::remove_if(
                s.begin(), s.end(),
                [](unsigned char ch) { return std::isspace(ch) || ch == '\"' || ch == '\''; }),
            s.end());
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return std::tolower(ch); });
    return s;
  };

  std::string line;
  int line_no = 0;
  int i_name = -1;
  int i_value = -1;
  bool have_header = false;
  Parameters params;

  while (std::getline(file, line)) {
    ++line_no;
    const std::string stripped = trim(line);
    if (stripped.empty() || stripped.front() == '#') {
      continue;
    }

    std::vector<std::string> toks = split_row(stripped);

    if (!have_header) {
      for (std::size_t i = 0; i < toks.size(); ++i) {
        const std::string col = norm(toks[i]);
        if (col == "name" || col == "parameter" || col == "key") {
          i_name = static_cast<int>(i);
        } else if (col == "value") {
          i_value = static_cast<int>(i);
        }
      }
      if (i_name < 0 || i_value < 0) {
        throw ConfigurationError("[Params] Unrecognized header in " + filename +
                                 " (need name,value)");
      }
      have_header = true;
      continue;
    }

    const auto needed = static_cast<std::size_t>(std::max(i_name, i_value));
    if (toks.size() <= needed) {
      throw ConfigurationError("[Params] Too few columns on line " + std::to_string(line_no) +
                               " of " + filename);
    }

    const std::string &name = toks[static_cast<std::size_t>(i_name)];
    const std::string &value_str = toks[static_cast<std::size_t>(i_value)];
    if (params.contains(name)) {
      throw ConfigurationError("[Params] Duplicate parameter '" + name + "' on line " +
                               std::to_string(line_no) + " of " + filename);
    }

    double value = 0.0;
    std::size_t consumed = 0;
    try {
      value = std::stod(value_str, &consumed);
    } catch (const std::exception &) {
      throw ConfigurationError("[Params] Malformed value '" + value_str + "' on line " +
                               std::to_string(line_no) + " of " + filename);
    }
    if (consumed != value_str.size()) {
      throw ConfigurationError("[Params] Trailing characters in value '" + value_str +
                               "' on line " + std::to_string(line_no) + " of " + filename);
    }

    params.set(name, value);
  }

  if (!have_header) {
    throw ConfigurationError("[Params] Empty parameter file " + filename);
  }
  return params;
}
