#ifndef WIENER_PROCESS_HPP
#define WIENER_PROCESS_HPP

#include "trajectory.hpp"

#include <cstddef>
#include <gsl/gsl_rng.h>
#include <memory>

/**
 * @file wiener_process.hpp
 * @brief Explicitly seeded source of Wiener increments.
 *
 * @details
 * Wraps a GSL Mersenne Twister generator (gsl_rng_mt19937). Each instance owns its
 * generator; nothing reads or writes global random state, so two processes built with
 * the same seed produce the same increments, and separate instances can be used from
 * separate threads.
 *
 * Independent child streams (e.g. one per Monte Carlo trial) are derived by drawing
 * seeds from a parent instance with nextSeed().
 */
class WienerProcess {
public:
  explicit WienerProcess(unsigned long seed);

  WienerProcess(const WienerProcess &) = delete;
  WienerProcess &operator=(const WienerProcess &) = delete;
  WienerProcess(WienerProcess &&) noexcept = default;
  WienerProcess &operator=(WienerProcess &&) noexcept = default;
  ~WienerProcess() = default;

  /**
   * @brief Draw one increment dW over a step of length dt
   * @param dt Step length (must be positive)
   * @param dimension Number of independent components
   * @return dimension draws from N(0, sqrt(dt))
   * @throws ConfigurationError if dt is not positive
   */
  State increment(double dt, std::size_t dimension);

  /// Draw a seed for an independent child stream.
  unsigned long nextSeed();

  [[nodiscard]] unsigned long seed() const { return seed_; }

private:
  struct RngDeleter {
    void operator()(gsl_rng *r) const { gsl_rng_free(r); }
  };

  std::unique_ptr<gsl_rng, RngDeleter> rng_;
  unsigned long seed_;
};

#endif // WIENER_PROCESS_HPP
