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

#include "MixtureParams.hpp"
#include "mixture_errors.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>

#include "smithlab_utils.hpp"

using std::string;
using std::vector;
using std::endl;
using std::runtime_error;
using std::isfinite;

bool
ExpGaussParams::is_valid() const {
  return isfinite(beta) && beta > 0.0 &&
    isfinite(mu) &&
    isfinite(sigma) && sigma > 0.0 &&
    proportion >= 0.0 && proportion <= 1.0;
}

void
ExpGaussParams::validate() const {
  if (!(isfinite(beta) && beta > 0.0))
    throw DomainError("beta must be positive: " + smithlab::toa(beta));
  if (!isfinite(mu))
    throw DomainError("mu must be finite: " + smithlab::toa(mu));
  if (!(isfinite(sigma) && sigma > 0.0))
    throw DomainError("sigma must be positive: " + smithlab::toa(sigma));
  if (!(proportion >= 0.0 && proportion <= 1.0))
    throw DomainError("proportion must be in [0, 1]: " +
                      smithlab::toa(proportion));
}

double
ExpGaussParams::max_parameter_difference(const ExpGaussParams &other) const {
  const vector<double> a(as_vector()), b(other.as_vector());
  double diff = 0.0;
  for (size_t i = 0; i < a.size(); ++i)
    diff = std::max(diff, std::fabs(a[i] - b[i]));
  return diff;
}

vector<double>
ExpGaussParams::as_vector() const {
  vector<double> v;
  v.push_back(beta);
  v.push_back(mu);
  v.push_back(sigma);
  v.push_back(proportion);
  return v;
}

string
ExpGaussParams::tostring() const {
  std::ostringstream os;
  os << std::fixed << std::setprecision(5)
     << "beta: " << beta << " | mu: " << mu
     << " | sigma: " << sigma << " | proportion: " << proportion;
  return os.str();
}

bool
ExpGaussParams::operator==(const ExpGaussParams &other) const {
  return beta == other.beta && mu == other.mu &&
    sigma == other.sigma && proportion == other.proportion;
}

std::ostream&
operator<<(std::ostream &os, const ExpGaussParams &params) {
  return os << params.tostring();
}

string
fit_status_name(const FitStatus status) {
  switch (status) {
  case FIT_CONVERGED: return "converged";
  case FIT_MAX_ITERATIONS_REACHED: return "max_iterations_reached";
  }
  return "unknown";
}

std::ostream&
operator<<(std::ostream &os, const FitResult &result) {
  return os << result.params << " | log_likelihood: "
            << result.log_likelihood << " | iterations: "
            << result.iterations << " | " << fit_status_name(result.status);
}

////////////////////////////////////////////////////////////////////////
// params files

static void
convert_to_stringstream(const string &infile, std::stringstream &ss) {
  std::ifstream in(infile.c_str());
  if (!in)
    throw runtime_error("failed to open params file: " + infile);

  string line;
  while (getline(in, line)) {
    const size_t comment_start = line.find("#");
    if (comment_start != string::npos)
      line.erase(comment_start);
    line = smithlab::strip(line);
    if (!line.empty())
      ss << line << endl;
  }
}

ExpGaussParams
read_params_file(const string &params_file) {
  std::stringstream ss;
  convert_to_stringstream(params_file, ss);

  bool has_beta = false, has_mu = false;
  bool has_sigma = false, has_proportion = false;
  ExpGaussParams params;

  string key;
  double val = 0.0;
  while (ss >> key) {
    if (!(ss >> val))
      throw runtime_error("failed to parse value for " + key +
                          " in params file: " + params_file);
    if (key == "BETA") {params.beta = val; has_beta = true;}
    else if (key == "MU") {params.mu = val; has_mu = true;}
    else if (key == "SIGMA") {params.sigma = val; has_sigma = true;}
    else if (key == "PROPORTION") {params.proportion = val; has_proportion = true;}
    // fit summaries written with the parameters are not needed here
    else if (key != "LOG_LIKELIHOOD" && key != "ITERATIONS" &&
             key != "CONVERGED")
      throw runtime_error("unknown key " + key +
                          " in params file: " + params_file);
  }
  if (!(has_beta && has_mu && has_sigma && has_proportion))
    throw runtime_error("params file must give BETA, MU, SIGMA and "
                        "PROPORTION: " + params_file);
  params.validate();
  return params;
}

static void
write_params(std::ostream &out, const ExpGaussParams &params) {
  out.precision(17);
  out << "BETA\t" << params.beta << endl
      << "MU\t" << params.mu << endl
      << "SIGMA\t" << params.sigma << endl
      << "PROPORTION\t" << params.proportion << endl;
}

void
write_params_file(const string &outfile, const ExpGaussParams &params) {
  std::ofstream of;
  if (!outfile.empty()) of.open(outfile.c_str());
  if (!outfile.empty() && !of)
    throw runtime_error("failed to open output file: " + outfile);
  std::ostream out(outfile.empty() ? std::cout.rdbuf() : of.rdbuf());
  write_params(out, params);
}

void
write_params_file(const string &outfile, const FitResult &result) {
  std::ofstream of;
  if (!outfile.empty()) of.open(outfile.c_str());
  if (!outfile.empty() && !of)
    throw runtime_error("failed to open output file: " + outfile);
  std::ostream out(outfile.empty() ? std::cout.rdbuf() : of.rdbuf());
  write_params(out, result.params);
  out << "LOG_LIKELIHOOD\t" << result.log_likelihood << endl
      << "ITERATIONS\t" << result.iterations << endl
      << "CONVERGED\t" << (result.converged ? 1 : 0) << endl;
}
