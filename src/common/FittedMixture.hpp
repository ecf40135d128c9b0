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

// Contains declaration of the FittedMixture class, the density and
// distribution function of a mixture at fixed parameters.

#ifndef FITTED_MIXTURE_HPP_
#define FITTED_MIXTURE_HPP_

#include <vector>
#include <iostream>

#include "MixtureParams.hpp"

// A FittedMixture is usually made from the result of a fit:
//
//  FitResult result = fit_mixture(sample);
//  FittedMixture mixture(result);
//  vector<double> density = mixture.pdf(grid);

class FittedMixture {
public:
  explicit FittedMixture(const ExpGaussParams &params);
  explicit FittedMixture(const FitResult &result);

  double pdf(const double x) const;
  std::vector<double> pdf(const std::vector<double> &x) const;
  double cdf(const double x) const;
  std::vector<double> cdf(const std::vector<double> &x) const;

  const ExpGaussParams &params() const {return params_;}

  friend std::ostream& operator<<(std::ostream &os,
                                  const FittedMixture &mixture);
private:
  ExpGaussParams params_;
};

// n evenly spaced points from lo to hi inclusive
std::vector<double>
evaluation_grid(const double lo, const double hi, const size_t n);

#endif // FITTED_MIXTURE_HPP_
