#include "wiener_process.hpp"

#include "integration_errors.hpp"

#include <cmath>
#include <gsl/gsl_randist.h>
#include <stdexcept>

WienerProcess::WienerProcess(unsigned long seed)
    : rng_(gsl_rng_alloc(gsl_rng_mt19937)), seed_(seed) {
  if (!rng_) {
    throw std::runtime_error("Failed to allocate GSL random number generator");
  }
  gsl_rng_set(rng_.get(), seed);
}

State WienerProcess::increment(double dt, std::size_t dimension) {
  if (!(dt > 0.0)) {
    throw ConfigurationError("Wiener increment requires a positive time step");
  }
  const double sigma = std::sqrt(dt);
  State dW(dimension);
  for (std::size_t i = 0; i < dimension; ++i) {
    dW[i] = gsl_ran_gaussian(rng_.get(), sigma);
  }
  return dW;
}

unsigned long WienerProcess::nextSeed() { return gsl_rng_get(rng_.get()); }
