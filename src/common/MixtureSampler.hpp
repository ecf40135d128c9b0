/*    Copyright (C) 2022 University of Southern California and
 *                       Andrew D. Smith
 *
 *    Authors: Andrew D. Smith
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation, either version 3 of the License, or
 *    (at your option) any later version.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 */

// Draws simulated observations from the exponential-Gaussian mixture.

#ifndef MIXTURE_SAMPLER_HPP_
#define MIXTURE_SAMPLER_HPP_

#include <vector>

#include <gsl/gsl_rng.h>

#include "MixtureParams.hpp"

class MixtureSampler {
public:
  MixtureSampler(const ExpGaussParams &params, const unsigned long seed);
  ~MixtureSampler();

  double operator()() const;
  std::vector<double> sample(const size_t n) const;

  double sample_exponential() const;
  double sample_gaussian() const;

  // n_exp exponential draws followed by n_gauss gaussian draws; the
  // proportion is ignored
  std::vector<double> sample_components(const size_t n_exp,
                                        const size_t n_gauss) const;

  const ExpGaussParams &params() const {return params_;}

private:
  MixtureSampler(const MixtureSampler &);
  MixtureSampler& operator=(const MixtureSampler &);

  ExpGaussParams params_;
  gsl_rng *rng;
};

#endif // MIXTURE_SAMPLER_HPP_
