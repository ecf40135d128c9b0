/*
 * Copyright (C) 2012 University of Southern California
 *                    Andrew D Smith and Qiang Song
 * Author: Qiang Song
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

#ifndef MIXTURE_PARAMS_HPP
#define MIXTURE_PARAMS_HPP

#include <string>
#include <vector>
#include <iostream>

/* Parameters of the exponential-Gaussian mixture. The exponential
 * component has scale beta (rate 1/beta) and weight proportion; the
 * Gaussian component has mean mu, standard deviation sigma and weight
 * 1 - proportion.
 */
struct ExpGaussParams {
  ExpGaussParams() : beta(1.0), mu(0.0), sigma(1.0), proportion(0.5) {}
  ExpGaussParams(const double b, const double m,
                 const double s, const double p) :
    beta(b), mu(m), sigma(s), proportion(p) {}

  bool is_valid() const;
  // throws DomainError naming the first bad parameter
  void validate() const;

  double max_parameter_difference(const ExpGaussParams &other) const;
  std::vector<double> as_vector() const;
  std::string tostring() const;

  bool operator==(const ExpGaussParams &other) const;
  bool operator!=(const ExpGaussParams &other) const {
    return !(*this == other);
  }

  double beta;
  double mu;
  double sigma;
  double proportion;
};

std::ostream&
operator<<(std::ostream &os, const ExpGaussParams &params);

struct FitOptions {
  FitOptions() : tolerance(1e-6), max_iterations(1000), sigma_floor(1e-6),
                 has_initial_params(false), VERBOSE(false) {}

  void set_initial_params(const ExpGaussParams &p) {
    initial_params = p;
    has_initial_params = true;
  }

  // stop once the log-likelihood changes by less than tolerance, either
  // absolutely or relative to its magnitude
  double tolerance;
  size_t max_iterations;
  double sigma_floor;
  bool has_initial_params;
  ExpGaussParams initial_params;
  bool VERBOSE;
};

enum FitStatus {
  FIT_CONVERGED,
  FIT_MAX_ITERATIONS_REACHED
};

std::string
fit_status_name(const FitStatus status);

struct FitResult {
  FitResult() : log_likelihood(0.0), iterations(0), converged(false),
                status(FIT_MAX_ITERATIONS_REACHED), near_degenerate(false) {}

  ExpGaussParams params;
  double log_likelihood;
  size_t iterations;
  bool converged;
  FitStatus status;
  // set when a beta update had no support on x >= 0 and was skipped
  bool near_degenerate;
  // entry 0 is the log-likelihood of the starting parameters
  std::vector<double> log_likelihood_trace;
};

std::ostream&
operator<<(std::ostream &os, const FitResult &result);

ExpGaussParams
read_params_file(const std::string &params_file);

void
write_params_file(const std::string &outfile, const ExpGaussParams &params);

void
write_params_file(const std::string &outfile, const FitResult &result);

#endif
