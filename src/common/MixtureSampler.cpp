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

#include "MixtureSampler.hpp"

#include <vector>

#include <gsl/gsl_randist.h>

using std::vector;

MixtureSampler::MixtureSampler(const ExpGaussParams &params,
                               const unsigned long seed) : params_(params) {
  params_.validate();
  rng = gsl_rng_alloc(gsl_rng_mt19937);
  gsl_rng_set(rng, seed);
}

MixtureSampler::~MixtureSampler() {gsl_rng_free(rng);}

double
MixtureSampler::sample_exponential() const {
  return gsl_ran_exponential(rng, params_.beta);
}

double
MixtureSampler::sample_gaussian() const {
  return params_.mu + gsl_ran_gaussian(rng, params_.sigma);
}

double
MixtureSampler::operator()() const {
  return gsl_ran_bernoulli(rng, params_.proportion) ?
    sample_exponential() : sample_gaussian();
}

vector<double>
MixtureSampler::sample(const size_t n) const {
  vector<double> vals(n);
  for (size_t i = 0; i < n; ++i)
    vals[i] = (*this)();
  return vals;
}

vector<double>
MixtureSampler::sample_components(const size_t n_exp,
                                  const size_t n_gauss) const {
  vector<double> vals;
  vals.reserve(n_exp + n_gauss);
  for (size_t i = 0; i < n_exp; ++i)
    vals.push_back(sample_exponential());
  for (size_t i = 0; i < n_gauss; ++i)
    vals.push_back(sample_gaussian());
  return vals;
}
