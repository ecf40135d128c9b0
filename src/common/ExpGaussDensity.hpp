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

#ifndef EXP_GAUSS_DENSITY_HPP
#define EXP_GAUSS_DENSITY_HPP

#include <vector>

#include "MixtureParams.hpp"

/* Densities and distribution functions of the two mixture components
 * and of the mixture itself. Every function is pure. The vector
 * versions evaluate element by element and return a vector of the
 * same length and order as the input.
 *
 * A non-positive (or NaN) beta or sigma throws DomainError.
 */

////////////////////////////////////////////////////////////////////////
// EXPONENTIAL (support x >= 0)

double
exponential_pdf(const double x, const double beta);
std::vector<double>
exponential_pdf(const std::vector<double> &x, const double beta);

double
exponential_cdf(const double x, const double beta);
std::vector<double>
exponential_cdf(const std::vector<double> &x, const double beta);

// -inf for x < 0
double
exponential_log_pdf(const double x, const double beta);

////////////////////////////////////////////////////////////////////////
// GAUSSIAN

double
gaussian_pdf(const double x, const double mu, const double sigma);
std::vector<double>
gaussian_pdf(const std::vector<double> &x, const double mu, const double sigma);

double
gaussian_cdf(const double x, const double mu, const double sigma);
std::vector<double>
gaussian_cdf(const std::vector<double> &x, const double mu, const double sigma);

double
gaussian_log_pdf(const double x, const double mu, const double sigma);

////////////////////////////////////////////////////////////////////////
// MIXTURE

double
mixture_pdf(const double x, const ExpGaussParams &params);
std::vector<double>
mixture_pdf(const std::vector<double> &x, const ExpGaussParams &params);

double
mixture_cdf(const double x, const ExpGaussParams &params);
std::vector<double>
mixture_cdf(const std::vector<double> &x, const ExpGaussParams &params);

double
mixture_log_pdf(const double x, const ExpGaussParams &params);

#endif
