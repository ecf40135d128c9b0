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

#include <cmath>
#include <limits>
#include <vector>

// GSL headers.
#include <gsl/gsl_cdf.h>

// Google Mock headers.
#include "gmock/gmock.h"

// Local headers.
#include "ExpGaussEM.hpp"
#include "ExpGaussDensity.hpp"
#include "MixtureParams.hpp"
#include "MixtureSampler.hpp"
#include "mixture_errors.hpp"

using ::testing::Eq; using ::testing::Le; using ::testing::Gt;
using ::testing::DoubleEq; using ::testing::DoubleNear;
using ::testing::ElementsAreArray; using ::testing::Test;

using std::vector;

const double recovery_tolerance = 0.1;

MATCHER_P2(ParamsNear, value, tolerance, "") {
  return arg.max_parameter_difference(value) <= tolerance;
}

// i-th of n evenly spaced quantiles of each component
static vector<double>
quantile_sample(const ExpGaussParams &params, const size_t n) {
  vector<double> sample;
  for (size_t i = 0; i < n; ++i)
    sample.push_back(gsl_cdf_exponential_Pinv((i + 0.5)/n, params.beta));
  for (size_t i = 0; i < n; ++i)
    sample.push_back(params.mu +
                     gsl_cdf_gaussian_Pinv((i + 0.5)/n, params.sigma));
  return sample;
}

class ExponentialAndGaussianSample : public Test {
public:
  ExpGaussParams truth;
  vector<double> sample;

  void SetUp() override {
    truth = ExpGaussParams(1.0, 10.0, 1.0, 0.5);
    const MixtureSampler sampler(truth, 42);
    sample = sampler.sample_components(500, 500);
  }
};

TEST(sample_checks, reject_fewer_than_two_observations) {
  ASSERT_THROW(fit_mixture(vector<double>()), InsufficientDataError);
  ASSERT_THROW(fit_mixture(vector<double>(1, 3.0)), InsufficientDataError);
  ASSERT_THROW(initial_params(vector<double>(1, 3.0)), InsufficientDataError);
}

TEST(sample_checks, reject_non_finite_observations) {
  vector<double> sample = {1.0, 2.0, 10.0, 11.0};
  sample.push_back(std::numeric_limits<double>::quiet_NaN());
  ASSERT_THROW(fit_mixture(sample), DomainError);
  sample.back() = std::numeric_limits<double>::infinity();
  ASSERT_THROW(fit_mixture(sample), DomainError);
}

TEST(initial_params, are_valid_for_a_spread_sample) {
  const vector<double> sample = {0.2, 1.3, 0.7, 9.0, 10.5, 11.2};
  const ExpGaussParams params = initial_params(sample);
  ASSERT_TRUE(params.is_valid());
  ASSERT_THAT(params.beta, DoubleNear((0.2 + 0.7 + 1.3)/3, 1e-12));
  ASSERT_THAT(params.mu, DoubleNear((9.0 + 10.5 + 11.2)/3, 1e-12));
  ASSERT_THAT(params.proportion, Eq(0.5));
}

TEST(initial_params, fall_back_when_lower_half_is_negative) {
  const vector<double> sample = {-5.0, -4.0, -3.0, -2.0};
  const ExpGaussParams params = initial_params(sample);
  ASSERT_TRUE(params.is_valid());
  ASSERT_THAT(params.beta, DoubleNear(std::sqrt(1.25), 1e-12));
}

TEST(initial_params, seed_beta_from_non_negative_lower_values) {
  const vector<double> sample = {11.0, 0.5, -1.0, 9.0, 1.5, 10.0};
  const ExpGaussParams params = initial_params(sample);
  ASSERT_THAT(params.beta, DoubleNear(1.0, 1e-12));
  ASSERT_THAT(params.mu, DoubleNear(10.0, 1e-12));
  ASSERT_THAT(params.sigma, DoubleNear(std::sqrt(2.0/3.0), 1e-12));
}

TEST(initial_params, reject_a_constant_sample) {
  ASSERT_THROW(initial_params(vector<double>(20, 5.0)), DegenerateFitError);
}

TEST(expectation_step, splits_responsibility_when_both_weights_vanish) {
  // with all weight on the exponential, a negative value has zero
  // density under both components
  const ExpGaussParams params(1.0, 0.0, 1.0, 1.0);
  const vector<double> sample = {-1.0, 2.0};
  vector<double> exp_probs;
  expectation_step(sample, params, exp_probs);
  ASSERT_THAT(exp_probs.size(), Eq(2ul));
  ASSERT_THAT(exp_probs[0], Eq(0.5));
  ASSERT_THAT(exp_probs[1], DoubleEq(1.0));
}

TEST(expectation_step, returns_the_log_likelihood) {
  const ExpGaussParams params(1.5, 8.0, 2.0, 0.4);
  const vector<double> sample = {0.1, 0.9, 3.0, 7.5, 9.1, -0.5};
  vector<double> exp_probs;
  const double score = expectation_step(sample, params, exp_probs);
  ASSERT_THAT(score, DoubleNear(log_likelihood(sample, params), 1e-10));
  for (size_t i = 0; i < sample.size(); ++i) {
    const double w_exp = 0.4*exponential_pdf(sample[i], 1.5);
    const double w_gauss = 0.6*gaussian_pdf(sample[i], 8.0, 2.0);
    ASSERT_THAT(exp_probs[i], DoubleNear(w_exp/(w_exp + w_gauss), 1e-12));
  }
}

TEST(maximization_step, computes_weighted_updates) {
  const vector<double> sample = {0.5, 1.5, 9.0, 11.0};
  const vector<double> exp_probs = {1.0, 1.0, 0.0, 0.0};
  bool near_degenerate = false;
  const ExpGaussParams updated =
    maximization_step(sample, exp_probs, ExpGaussParams(), 1e-6,
                      near_degenerate);
  ASSERT_FALSE(near_degenerate);
  ASSERT_THAT(updated.proportion, DoubleEq(0.5));
  ASSERT_THAT(updated.beta, DoubleEq(1.0));
  ASSERT_THAT(updated.mu, DoubleEq(10.0));
  ASSERT_THAT(updated.sigma, DoubleEq(1.0));
}

TEST(maximization_step, keeps_beta_without_support_on_positive_values) {
  const vector<double> sample = {-2.0, -1.0, 3.0, 4.0};
  const vector<double> exp_probs = {0.5, 0.5, 0.0, 0.0};
  const ExpGaussParams params(7.0, 0.0, 1.0, 0.5);
  bool near_degenerate = false;
  const ExpGaussParams updated =
    maximization_step(sample, exp_probs, params, 1e-6, near_degenerate);
  ASSERT_TRUE(near_degenerate);
  ASSERT_THAT(updated.beta, Eq(7.0));
  ASSERT_THAT(updated.proportion, DoubleEq(0.25));
}

TEST(maximization_step, floors_sigma) {
  const vector<double> sample = {1.0, 2.0, 5.0, 5.0};
  const vector<double> exp_probs = {1.0, 1.0, 0.0, 0.0};
  bool near_degenerate = false;
  const ExpGaussParams updated =
    maximization_step(sample, exp_probs, ExpGaussParams(), 1e-3,
                      near_degenerate);
  ASSERT_THAT(updated.mu, DoubleEq(5.0));
  ASSERT_THAT(updated.sigma, Eq(1e-3));
}

TEST(maximization_step, fails_when_one_component_is_empty) {
  const vector<double> sample = {1.0, 2.0, 5.0, 6.0};
  bool near_degenerate = false;
  ASSERT_THROW(maximization_step(sample, vector<double>(4, 0.0),
                                 ExpGaussParams(), 1e-6, near_degenerate),
               DegenerateFitError);
  ASSERT_THROW(maximization_step(sample, vector<double>(4, 1.0),
                                 ExpGaussParams(), 1e-6, near_degenerate),
               DegenerateFitError);
}

TEST(maximization_step, fails_when_beta_collapses) {
  const vector<double> sample = {0.0, 0.0, 5.0, 6.0};
  const vector<double> exp_probs = {1.0, 1.0, 0.0, 0.0};
  bool near_degenerate = false;
  ASSERT_THROW(maximization_step(sample, exp_probs, ExpGaussParams(), 1e-6,
                                 near_degenerate),
               DegenerateFitError);
}

TEST(maximization_step, holds_beta_when_support_is_nearly_empty) {
  // 0.05% of the sample on the exponential: kept, but too little to
  // re-estimate beta from
  const vector<double> sample = {0.5, 1.0, 9.0, 9.5, 10.0,
                                 10.5, 11.0, 9.8, 10.2, 10.4};
  const vector<double> exp_probs(sample.size(), 5e-4);
  const ExpGaussParams params(2.0, 10.0, 1.0, 0.5);
  bool near_degenerate = false;
  const ExpGaussParams updated =
    maximization_step(sample, exp_probs, params, 1e-6, near_degenerate);
  ASSERT_TRUE(near_degenerate);
  ASSERT_THAT(updated.beta, Eq(2.0));
  ASSERT_THAT(updated.proportion, DoubleNear(5e-4, 1e-15));
}

TEST(maximization_step, fails_when_a_component_holds_a_negligible_share) {
  const vector<double> sample = {1.0, 1.0, 1.0, 1.0, 2.0};
  bool near_degenerate = false;
  ASSERT_THROW(maximization_step(sample, vector<double>(5, 1e-6),
                                 ExpGaussParams(), 1e-6, near_degenerate),
               DegenerateFitError);
  ASSERT_THROW(maximization_step(sample, vector<double>(5, 1.0 - 1e-6),
                                 ExpGaussParams(), 1e-6, near_degenerate),
               DegenerateFitError);
}

TEST(fit_mixture, reports_a_vanishing_component_as_degenerate) {
  const vector<double> sample = {1.0, 1.0, 1.0, 1.0, 2.0};
  FitOptions options;
  options.tolerance = 1e-12;
  ASSERT_THROW(fit_mixture(sample, options), DegenerateFitError);
}

TEST_F(ExponentialAndGaussianSample, em_step_leaves_its_input_unchanged) {
  const ExpGaussParams start(3.0, 5.0, 4.0, 0.5);
  const ExpGaussParams copy(start);
  const ExpGaussParams first = em_step(sample, start, 1e-6);
  const ExpGaussParams second = em_step(sample, start, 1e-6);
  ASSERT_THAT(start, Eq(copy));
  ASSERT_THAT(first, Eq(second));
  ASSERT_THAT(first, ::testing::Ne(start));
}

TEST_F(ExponentialAndGaussianSample, recovers_generating_parameters) {
  const FitResult result = fit_mixture(sample);
  ASSERT_TRUE(result.converged);
  ASSERT_THAT(result.status, Eq(FIT_CONVERGED));
  ASSERT_THAT(result.iterations, Le(1000ul));
  ASSERT_THAT(result.params, ParamsNear(truth, recovery_tolerance))
    << result.params;
  ASSERT_THAT(result.log_likelihood,
              DoubleNear(log_likelihood(sample, result.params), 1e-8));
}

TEST_F(ExponentialAndGaussianSample, log_likelihood_never_decreases) {
  FitOptions options;
  options.set_initial_params(ExpGaussParams(5.0, 2.0, 5.0, 0.5));
  const FitResult result = fit_mixture(sample, options);
  const vector<double> &trace = result.log_likelihood_trace;
  ASSERT_THAT(trace.size(), Eq(result.iterations + 1));
  ASSERT_THAT(trace.size(), Gt(3ul));
  for (size_t i = 1; i < trace.size(); ++i)
    ASSERT_GE(trace[i], trace[i - 1] - 1e-9*std::fabs(trace[i - 1]))
      << "iteration " << i;
}

TEST_F(ExponentialAndGaussianSample, stops_at_the_iteration_cap) {
  FitOptions options;
  options.set_initial_params(ExpGaussParams(5.0, 2.0, 5.0, 0.5));
  options.max_iterations = 3;
  const FitResult result = fit_mixture(sample, options);
  ASSERT_FALSE(result.converged);
  ASSERT_THAT(result.status, Eq(FIT_MAX_ITERATIONS_REACHED));
  ASSERT_THAT(result.iterations, Eq(3ul));
  ASSERT_TRUE(result.params.is_valid());
}

TEST_F(ExponentialAndGaussianSample, repeated_fits_are_identical) {
  FitOptions options;
  options.set_initial_params(ExpGaussParams(2.0, 8.0, 3.0, 0.4));
  const FitResult a = fit_mixture(sample, options);
  const FitResult b = fit_mixture(sample, options);
  ASSERT_THAT(a.params, Eq(b.params));
  ASSERT_THAT(a.iterations, Eq(b.iterations));
  ASSERT_THAT(a.log_likelihood_trace, ElementsAreArray(b.log_likelihood_trace));
}

TEST_F(ExponentialAndGaussianSample, rejects_invalid_starting_parameters) {
  FitOptions options;
  options.set_initial_params(ExpGaussParams(-1.0, 10.0, 1.0, 0.5));
  ASSERT_THROW(fit_mixture(sample, options), DomainError);
  options.set_initial_params(ExpGaussParams(1.0, 10.0, 1.0, 1.2));
  ASSERT_THROW(fit_mixture(sample, options), DomainError);
  options = FitOptions();
  options.sigma_floor = 0.0;
  ASSERT_THROW(fit_mixture(sample, options), DomainError);
}

TEST_F(ExponentialAndGaussianSample, multistart_skips_degenerate_starts) {
  vector<ExpGaussParams> starts;
  starts.push_back(ExpGaussParams(1.0, 10.0, 1.0, 0.0));
  starts.push_back(ExpGaussParams(3.0, 5.0, 4.0, 0.5));
  const FitResult result = fit_mixture_multistart(sample, starts);
  ASSERT_TRUE(result.converged);
  ASSERT_THAT(result.params, ParamsNear(truth, recovery_tolerance));
}

TEST_F(ExponentialAndGaussianSample, multistart_keeps_the_best_start) {
  const vector<ExpGaussParams> starts = random_starting_points(sample, 4, 1);
  const FitResult best = fit_mixture_multistart(sample, starts);
  for (size_t i = 0; i < starts.size(); ++i) {
    FitOptions options;
    options.set_initial_params(starts[i]);
    try {
      const FitResult single = fit_mixture(sample, options);
      ASSERT_GE(best.log_likelihood, single.log_likelihood);
    }
    catch (const DegenerateFitError &) {
      // skipped by the multistart fit as well
    }
  }
}

TEST_F(ExponentialAndGaussianSample, multistart_fails_if_every_start_fails) {
  vector<ExpGaussParams> starts(2, ExpGaussParams(1.0, 10.0, 1.0, 0.0));
  ASSERT_THROW(fit_mixture_multistart(sample, starts), DegenerateFitError);
}

TEST(random_starting_points, are_valid_and_reproducible) {
  const vector<double> sample = {0.1, 0.4, 2.0, 9.0, 10.0, 12.0};
  const vector<ExpGaussParams> a = random_starting_points(sample, 10, 7);
  const vector<ExpGaussParams> b = random_starting_points(sample, 10, 7);
  ASSERT_THAT(a.size(), Eq(10ul));
  for (size_t i = 0; i < a.size(); ++i) {
    ASSERT_TRUE(a[i].is_valid()) << a[i];
    ASSERT_THAT(a[i], Eq(b[i]));
  }
}

TEST(fit_mixture, recovers_parameters_from_exact_quantiles) {
  const ExpGaussParams truth(1.0, 10.0, 1.0, 0.5);
  const FitResult result = fit_mixture(quantile_sample(truth, 2000));
  ASSERT_TRUE(result.converged);
  ASSERT_THAT(result.params, ParamsNear(truth, 0.02)) << result.params;
}

TEST(fit_mixture, constant_sample_does_not_produce_nan) {
  const vector<double> sample(10, 5.0);
  ASSERT_THROW(fit_mixture(sample), DegenerateFitError);

  FitOptions options;
  options.set_initial_params(ExpGaussParams(1.0, 0.0, 100.0, 0.5));
  try {
    const FitResult result = fit_mixture(sample, options);
    ASSERT_THAT(result.params.sigma, Eq(options.sigma_floor));
    ASSERT_FALSE(std::isnan(result.log_likelihood));
  }
  catch (const DegenerateFitError &) {
    SUCCEED();
  }
}
