#ifndef PARAMETERS_HPP
#define PARAMETERS_HPP

#include <cstddef>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>

/**
 * @file parameters.hpp
 * @brief Named real-valued model parameters with up-front validation.
 *
 * @details
 * Parameters map a name (e.g. "T_ambient", "c1") to a finite real value. They are
 * supplied once per integration run and passed unchanged to every right-hand-side and
 * diffusion evaluation. The integration driver calls require() with the names a system
 * declares before the first step, so a missing key is reported as a configuration
 * error rather than surfacing mid-run.
 *
 * @example Basic Usage
 * ```cpp
 * Parameters params{{"T_ambient", 290.0}, {"k", 1.0}};
 * params.require({"T_ambient", "k"});
 * double t_amb = params.get("T_ambient");
 * ```
 *
 * @example Parameter File
 * ```
 * name,value
 * # ambient temperature in K
 * T_ambient,290
 * c1,2.0
 * ```
 */

class Parameters {
public:
  Parameters() = default;
  Parameters(std::initializer_list<std::pair<const std::string, double>> values);

  /**
   * @brief Set or overwrite a parameter
   * @throws ConfigurationError if the name is empty or the value is not finite
   */
  void set(const std::string &name, double value);

  /**
   * @brief Look up a parameter
   * @throws ConfigurationError if the name is absent
   */
  [[nodiscard]] double get(const std::string &name) const;

  [[nodiscard]] bool contains(const std::string &name) const;
  [[nodiscard]] std::size_t size() const { return values_.size(); }
  [[nodiscard]] bool empty() const { return values_.empty(); }
  [[nodiscard]] std::vector<std::string> names() const;

  /**
   * @brief Copy every entry of another set over this one
   */
  void merge(const Parameters &overrides);

  /**
   * @brief Check that all listed names are present
   * @throws ConfigurationError listing every missing name at once
   */
  void require(const std::vector<std::string> &names) const;

private:
  std::map<std::string, double> values_;
};

/**
 * @brief Read parameters from a two-column CSV file
 *
 * The first non-comment line is a header naming the columns; "name" (alias
 * "parameter" or "key") and "value" are recognised in any order and case. Blank lines
 * and lines starting with '#' are skipped. Parameter names keep their case.
 *
 * @param filename Path to the CSV file
 * @return Parsed parameters
 * @throws ConfigurationError on an unreadable file, unknown header, malformed value or
 *         duplicate name
 */
Parameters read_parameter_file(const std::string &filename);

#endif // PARAMETERS_HPP
