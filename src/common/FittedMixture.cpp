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

#include "FittedMixture.hpp"
#include "ExpGaussDensity.hpp"

#include <stdexcept>

using std::vector;

FittedMixture::FittedMixture(const ExpGaussParams &params) : params_(params) {
  params_.validate();
}

FittedMixture::FittedMixture(const FitResult &result) : params_(result.params) {
  params_.validate();
}

double
FittedMixture::pdf(const double x) const {return mixture_pdf(x, params_);}

vector<double>
FittedMixture::pdf(const vector<double> &x) const {
  return mixture_pdf(x, params_);
}

double
FittedMixture::cdf(const double x) const {return mixture_cdf(x, params_);}

vector<double>
FittedMixture::cdf(const vector<double> &x) const {
  return mixture_cdf(x, params_);
}

std::ostream&
operator<<(std::ostream &os, const FittedMixture &mixture) {
  return os << mixture.params_;
}

vector<double>
evaluation_grid(const double lo, const double hi, const size_t n) {
  if (n < 2 || !(hi > lo))
    throw std::invalid_argument("grid needs at least 2 points and lo < hi");
  vector<double> grid(n);
  const double step = (hi - lo)/(n - 1);
  for (size_t i = 0; i < n; ++i)
    grid[i] = lo + i*step;
  grid.back() = hi;
  return grid;
}
