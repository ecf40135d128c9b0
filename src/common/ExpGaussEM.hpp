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

#ifndef EXP_GAUSS_EM_HPP
#define EXP_GAUSS_EM_HPP

#include <vector>

#include "MixtureParams.hpp"

/* Expectation-maximization for the exponential-Gaussian mixture. The
 * sample is never modified. Each call owns its own responsibilities,
 * so concurrent fits may share one sample.
 */

// Starting point derived from the sample: the lower half of the sorted
// values seeds the exponential, the upper half the Gaussian.
// Throws DegenerateFitError for a sample with no spread.
ExpGaussParams
initial_params(const std::vector<double> &sample);

// Fills exp_probs with the posterior probability that each observation
// came from the exponential component (the Gaussian responsibility is
// 1 - exp_probs[i]) and returns the log-likelihood of params.
double
expectation_step(const std::vector<double> &sample,
                 const ExpGaussParams &params,
                 std::vector<double> &exp_probs);

// Closed-form update from the responsibilities. beta is left unchanged,
// and near_degenerate set, when the observations x >= 0 carry less than
// 0.1% of the sample as exponential responsibility. Throws
// DegenerateFitError when either component holds less than 0.01% of the
// sample.
ExpGaussParams
maximization_step(const std::vector<double> &sample,
                  const std::vector<double> &exp_probs,
                  const ExpGaussParams &params,
                  const double sigma_floor,
                  bool &near_degenerate);

ExpGaussParams
em_step(const std::vector<double> &sample, const ExpGaussParams &params,
        const double sigma_floor);

double
log_likelihood(const std::vector<double> &sample,
               const ExpGaussParams &params);

FitResult
fit_mixture(const std::vector<double> &sample,
            const FitOptions &options = FitOptions());

// Fits from every starting point and keeps the highest likelihood.
// Starting points that degenerate are skipped; DegenerateFitError is
// thrown only if all of them do.
FitResult
fit_mixture_multistart(const std::vector<double> &sample,
                       const std::vector<ExpGaussParams> &starts,
                       const FitOptions &options = FitOptions());

// Random starting points spread over the range of the sample.
std::vector<ExpGaussParams>
random_starting_points(const std::vector<double> &sample,
                       const size_t n_starts, const unsigned long seed);

#endif
