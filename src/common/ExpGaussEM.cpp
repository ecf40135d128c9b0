/*
 * Copyright (C) 2011 University of Southern California
 *                    Andrew D Smith and Qiang Song
 * Author: Qiang Song and Andrew D. Smith
 *
 * This is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this software; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA
 * 02110-1301 USA
 */

#include <iomanip>
#include <iostream>
#include <cmath>
#include <limits>
#include <string>
#include <algorithm>

#include <gsl/gsl_rng.h>
#include <gsl/gsl_randist.h>

#include "ExpGaussEM.hpp"
#include "ExpGaussDensity.hpp"
#include "mixture_errors.hpp"
#include "numerical_utils.hpp"
#include "smithlab_utils.hpp"

using std::vector;
using std::cerr;
using std::endl;
using std::log;
using std::exp;
using std::isfinite;
using std::numeric_limits;

// a component holding less than this share of the sample has collapsed
static const double MIN_COMPONENT_PROPORTION = 1e-4;
// below this share on x >= 0, beta is held fixed instead of re-estimated
static const double MIN_SUPPORT_PROPORTION = 1e-3;

static void
check_sample(const vector<double> &sample) {
  if (sample.size() < 2)
    throw InsufficientDataError("need at least 2 observations, got " +
                                smithlab::toa(sample.size()));
  for (size_t i = 0; i < sample.size(); ++i)
    if (!isfinite(sample[i]))
      throw DomainError("observation " + smithlab::toa(i) +
                        " is not finite");
}

ExpGaussParams
initial_params(const vector<double> &sample) {
  check_sample(sample);

  vector<double> sorted(sample);
  std::sort(sorted.begin(), sorted.end());

  const double overall_sd = sample_sd(sorted.begin(), sorted.end());
  if (!(overall_sd > 0.0))
    throw DegenerateFitError("all observations are identical");

  const vector<double>::const_iterator first = sorted.begin();
  const vector<double>::const_iterator mid = first + sorted.size()/2;

  // exponential support is x >= 0
  const vector<double>::const_iterator first_non_negative =
    std::lower_bound(first, mid, 0.0);
  double beta = sample_mean(first_non_negative, mid);
  if (!(beta > 0.0))
    beta = overall_sd;

  const double mu = sample_mean(mid, sorted.end());
  double sigma = sample_sd(mid, sorted.end());
  if (!(sigma > 0.0))
    sigma = overall_sd;

  return ExpGaussParams(beta, mu, sigma, 0.5);
}

double
expectation_step(const vector<double> &sample,
                 const ExpGaussParams &params,
                 vector<double> &exp_probs) {
  const double exp_log_mixing = log(params.proportion);
  const double gauss_log_mixing = log(1.0 - params.proportion);

  exp_probs.resize(sample.size());
  CompensatedSum score;
  for (size_t i = 0; i < sample.size(); ++i) {
    const double exp_part = exp_log_mixing +
      exponential_log_pdf(sample[i], params.beta);
    const double gauss_part = gauss_log_mixing +
      gaussian_log_pdf(sample[i], params.mu, params.sigma);

    const double denom = log_sum_log(exp_part, gauss_part);
    if (denom == -numeric_limits<double>::infinity())
      exp_probs[i] = 0.5; // neither component can explain x: split evenly
    else
      exp_probs[i] = exp(exp_part - denom);
    score.add(denom);
  }
  return score.value();
}

ExpGaussParams
maximization_step(const vector<double> &sample,
                  const vector<double> &exp_probs,
                  const ExpGaussParams &params,
                  const double sigma_floor,
                  bool &near_degenerate) {
  CompensatedSum exp_mass, exp_support_mass, exp_weighted;
  CompensatedSum gauss_mass, gauss_weighted;
  for (size_t i = 0; i < sample.size(); ++i) {
    const double r_exp = exp_probs[i];
    const double r_gauss = 1.0 - r_exp;
    exp_mass.add(r_exp);
    if (sample[i] >= 0.0) {
      exp_support_mass.add(r_exp);
      exp_weighted.add(r_exp*sample[i]);
    }
    gauss_mass.add(r_gauss);
    gauss_weighted.add(r_gauss*sample[i]);
  }

  const double min_mass = MIN_COMPONENT_PROPORTION*sample.size();
  if (!(exp_mass.value() >= min_mass))
    throw DegenerateFitError("exponential component collapsed: proportion = " +
                             smithlab::toa(exp_mass.value()/sample.size()));
  if (!(gauss_mass.value() >= min_mass))
    throw DegenerateFitError("gaussian component collapsed: proportion = " +
                             smithlab::toa(gauss_mass.value()/sample.size()));

  ExpGaussParams updated(params);
  updated.proportion = exp_mass.value()/sample.size();

  if (exp_support_mass.value() >= MIN_SUPPORT_PROPORTION*sample.size()) {
    updated.beta = exp_weighted.value()/exp_support_mass.value();
    if (!(isfinite(updated.beta) && updated.beta > 0.0))
      throw DegenerateFitError("exponential scale collapsed: beta = " +
                               smithlab::toa(updated.beta));
  }
  else near_degenerate = true;

  updated.mu = gauss_weighted.value()/gauss_mass.value();

  CompensatedSum gauss_sq;
  for (size_t i = 0; i < sample.size(); ++i) {
    const double d = sample[i] - updated.mu;
    gauss_sq.add((1.0 - exp_probs[i])*d*d);
  }
  const double sigma = std::sqrt(gauss_sq.value()/gauss_mass.value());
  if (!isfinite(sigma) || !isfinite(updated.mu))
    throw DegenerateFitError("gaussian update is not finite");
  updated.sigma = std::max(sigma, sigma_floor);

  return updated;
}

ExpGaussParams
em_step(const vector<double> &sample, const ExpGaussParams &params,
        const double sigma_floor) {
  check_sample(sample);
  params.validate();
  vector<double> exp_probs;
  expectation_step(sample, params, exp_probs);
  bool near_degenerate = false;
  return maximization_step(sample, exp_probs, params, sigma_floor,
                           near_degenerate);
}

double
log_likelihood(const vector<double> &sample, const ExpGaussParams &params) {
  params.validate();
  CompensatedSum score;
  for (size_t i = 0; i < sample.size(); ++i)
    score.add(mixture_log_pdf(sample[i], params));
  return score.value();
}

static bool
has_converged(const double prev_score, const double score,
              const double tolerance) {
  const double delta = std::fabs(score - prev_score);
  return delta < tolerance || delta < tolerance*std::fabs(prev_score);
}

FitResult
fit_mixture(const vector<double> &sample, const FitOptions &options) {
  check_sample(sample);
  if (!(options.sigma_floor > 0.0))
    throw DomainError("sigma floor must be positive: " +
                      smithlab::toa(options.sigma_floor));

  ExpGaussParams params = options.has_initial_params ?
    options.initial_params : initial_params(sample);
  params.validate();

  FitResult result;
  vector<double> exp_probs;
  double prev_score = expectation_step(sample, params, exp_probs);
  result.log_likelihood_trace.push_back(prev_score);

  if (options.VERBOSE)
    cerr << "[initial] " << params << " | log_likelihood: "
         << prev_score << endl
         << std::setw(6) << "ITR" << std::setw(14) << "DELTA"
         << "\tPARAMS" << endl;

  for (size_t itr = 1; itr <= options.max_iterations; ++itr) {
    const ExpGaussParams updated =
      maximization_step(sample, exp_probs, params, options.sigma_floor,
                        result.near_degenerate);
    const double score = expectation_step(sample, updated, exp_probs);
    if (std::isnan(score))
      throw DegenerateFitError("log-likelihood is not a number at "
                               "iteration " + smithlab::toa(itr));

    params = updated;
    result.iterations = itr;
    result.log_likelihood_trace.push_back(score);

    if (options.VERBOSE)
      cerr << std::setw(6) << itr << std::setw(14) << std::setprecision(4)
           << (score - prev_score)/std::fabs(prev_score) << "\t"
           << params << endl;

    if (has_converged(prev_score, score, options.tolerance)) {
      result.converged = true;
      break;
    }
    prev_score = score;
  }

  result.params = params;
  result.log_likelihood = result.log_likelihood_trace.back();
  result.status = result.converged ?
    FIT_CONVERGED : FIT_MAX_ITERATIONS_REACHED;

  if (options.VERBOSE)
    cerr << "[" << fit_status_name(result.status) << " after "
         << result.iterations << " iterations] " << result.params << endl;

  return result;
}

FitResult
fit_mixture_multistart(const vector<double> &sample,
                       const vector<ExpGaussParams> &starts,
                       const FitOptions &options) {
  if (starts.empty())
    return fit_mixture(sample, options);

  bool found = false;
  FitResult best;
  std::string last_error;
  for (size_t i = 0; i < starts.size(); ++i) {
    FitOptions start_options(options);
    start_options.set_initial_params(starts[i]);
    try {
      const FitResult result = fit_mixture(sample, start_options);
      if (options.VERBOSE)
        cerr << "[start " << i << "] " << result << endl;
      if (!found || result.log_likelihood > best.log_likelihood) {
        best = result;
        found = true;
      }
    }
    catch (const DegenerateFitError &e) {
      if (options.VERBOSE)
        cerr << "[start " << i << "] degenerate: " << e.what() << endl;
      last_error = e.what();
    }
  }
  if (!found)
    throw DegenerateFitError("all " + smithlab::toa(starts.size()) +
                             " starting points degenerated, last: " +
                             last_error);
  return best;
}

vector<ExpGaussParams>
random_starting_points(const vector<double> &sample,
                       const size_t n_starts, const unsigned long seed) {
  check_sample(sample);
  const double lo = *std::min_element(sample.begin(), sample.end());
  const double hi = *std::max_element(sample.begin(), sample.end());
  const double sd = sample_sd(sample.begin(), sample.end());
  if (!(sd > 0.0))
    throw DegenerateFitError("all observations are identical");
  const double scale = std::max(hi, 0.0) > 0.0 ? std::max(hi, 0.0) : sd;

  gsl_rng *rng = gsl_rng_alloc(gsl_rng_mt19937);
  gsl_rng_set(rng, seed);

  vector<ExpGaussParams> starts;
  for (size_t i = 0; i < n_starts; ++i) {
    ExpGaussParams p;
    p.beta = gsl_ran_flat(rng, 0.01, 0.5)*scale;
    p.mu = gsl_ran_flat(rng, lo, hi);
    p.sigma = gsl_ran_flat(rng, 0.25, 1.5)*sd;
    p.proportion = gsl_ran_flat(rng, 0.1, 0.9);
    starts.push_back(p);
  }
  gsl_rng_free(rng);
  return starts;
}
