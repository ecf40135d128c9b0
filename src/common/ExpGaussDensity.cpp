/*
  Copyright (C) 2008 Cold Spring Harbor Laboratory
  Authors: Andrew D. Smith

  This file is part of rmap.

  rmap is free software; you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation; either version 2 of the License, or
  (at your option) any later version.

  rmap is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with rmap; if not, write to the Free Software
  Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA  02110-1301  USA
*/

#include "ExpGaussDensity.hpp"
#include "mixture_errors.hpp"
#include "numerical_utils.hpp"
#include "smithlab_utils.hpp"

#include <cmath>
#include <limits>
#include <vector>

#include <gsl/gsl_math.h>
#include <gsl/gsl_randist.h>
#include <gsl/gsl_cdf.h>

using std::vector;
using std::log;
using std::numeric_limits;

static void
check_beta(const double beta) {
  if (!(beta > 0.0))
    throw DomainError("exponential scale beta must be positive: " +
                      smithlab::toa(beta));
}

static void
check_sigma(const double sigma) {
  if (!(sigma > 0.0))
    throw DomainError("gaussian sigma must be positive: " +
                      smithlab::toa(sigma));
}

// log(sqrt(2 pi))
static const double LOG_SQRT_2PI = 0.5*(M_LN2 + M_LNPI);

////////////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////
// EXPONENTIAL

double
exponential_pdf(const double x, const double beta) {
  check_beta(beta);
  return (x < 0.0) ? 0.0 : gsl_ran_exponential_pdf(x, beta);
}

vector<double>
exponential_pdf(const vector<double> &x, const double beta) {
  check_beta(beta);
  vector<double> d(x.size());
  for (size_t i = 0; i < x.size(); ++i)
    d[i] = exponential_pdf(x[i], beta);
  return d;
}

double
exponential_cdf(const double x, const double beta) {
  check_beta(beta);
  return (x < 0.0) ? 0.0 : gsl_cdf_exponential_P(x, beta);
}

vector<double>
exponential_cdf(const vector<double> &x, const double beta) {
  check_beta(beta);
  vector<double> p(x.size());
  for (size_t i = 0; i < x.size(); ++i)
    p[i] = exponential_cdf(x[i], beta);
  return p;
}

double
exponential_log_pdf(const double x, const double beta) {
  check_beta(beta);
  if (x < 0.0)
    return -numeric_limits<double>::infinity();
  return -log(beta) - x/beta;
}

////////////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////
// GAUSSIAN

double
gaussian_pdf(const double x, const double mu, const double sigma) {
  check_sigma(sigma);
  return gsl_ran_gaussian_pdf(x - mu, sigma);
}

vector<double>
gaussian_pdf(const vector<double> &x, const double mu, const double sigma) {
  check_sigma(sigma);
  vector<double> d(x.size());
  for (size_t i = 0; i < x.size(); ++i)
    d[i] = gaussian_pdf(x[i], mu, sigma);
  return d;
}

double
gaussian_cdf(const double x, const double mu, const double sigma) {
  check_sigma(sigma);
  return gsl_cdf_gaussian_P(x - mu, sigma);
}

vector<double>
gaussian_cdf(const vector<double> &x, const double mu, const double sigma) {
  check_sigma(sigma);
  vector<double> p(x.size());
  for (size_t i = 0; i < x.size(); ++i)
    p[i] = gaussian_cdf(x[i], mu, sigma);
  return p;
}

double
gaussian_log_pdf(const double x, const double mu, const double sigma) {
  check_sigma(sigma);
  const double z = (x - mu)/sigma;
  return -0.5*z*z - log(sigma) - LOG_SQRT_2PI;
}

////////////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////
// MIXTURE

double
mixture_pdf(const double x, const ExpGaussParams &params) {
  params.validate();
  return params.proportion*exponential_pdf(x, params.beta) +
    (1.0 - params.proportion)*gaussian_pdf(x, params.mu, params.sigma);
}

vector<double>
mixture_pdf(const vector<double> &x, const ExpGaussParams &params) {
  params.validate();
  vector<double> d(x.size());
  for (size_t i = 0; i < x.size(); ++i)
    d[i] = mixture_pdf(x[i], params);
  return d;
}

double
mixture_cdf(const double x, const ExpGaussParams &params) {
  params.validate();
  return params.proportion*exponential_cdf(x, params.beta) +
    (1.0 - params.proportion)*gaussian_cdf(x, params.mu, params.sigma);
}

vector<double>
mixture_cdf(const vector<double> &x, const ExpGaussParams &params) {
  params.validate();
  vector<double> p(x.size());
  for (size_t i = 0; i < x.size(); ++i)
    p[i] = mixture_cdf(x[i], params);
  return p;
}

double
mixture_log_pdf(const double x, const ExpGaussParams &params) {
  params.validate();
  return log_sum_log(log(params.proportion) +
                     exponential_log_pdf(x, params.beta),
                     log(1.0 - params.proportion) +
                     gaussian_log_pdf(x, params.mu, params.sigma));
}
