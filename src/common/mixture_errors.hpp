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

// Exceptions thrown by the density functions and the EM estimator.

#ifndef MIXTURE_ERRORS_HPP_
#define MIXTURE_ERRORS_HPP_

#include <stdexcept>
#include <string>

class MixtureError : public std::runtime_error {
public:
  explicit MixtureError(const std::string &m) : std::runtime_error(m) {}
};

// A density received beta <= 0, sigma <= 0 or a proportion outside [0, 1].
class DomainError : public MixtureError {
public:
  explicit DomainError(const std::string &m) : MixtureError(m) {}
};

// An EM update collapsed a component. The caller may retry with another
// starting point.
class DegenerateFitError : public MixtureError {
public:
  explicit DegenerateFitError(const std::string &m) : MixtureError(m) {}
};

class InsufficientDataError : public MixtureError {
public:
  explicit InsufficientDataError(const std::string &m) : MixtureError(m) {}
};

#endif // MIXTURE_ERRORS_HPP_
