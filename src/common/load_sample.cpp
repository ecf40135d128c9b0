/*
 *    Part of expgauss software
 *
 *    Copyright (C) 2022 University of Southern California and
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
 *
 *    You should have received a copy of the GNU General Public License
 *    along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "load_sample.hpp"
#include "smithlab_utils.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

using std::vector;
using std::string;
using std::runtime_error;

void
load_sample(std::istream &in, vector<double> &sample) {
  string line;
  size_t line_count = 0;
  while (getline(in, line)) {
    ++line_count;
    const size_t comment_start = line.find("#");
    if (comment_start != string::npos)
      line.erase(comment_start);

    std::istringstream line_is(line);
    string token;
    while (line_is >> token) {
      char *end = 0;
      const double val = strtod(token.c_str(), &end);
      if (end == token.c_str() || *end != '\0')
        throw runtime_error("bad number \"" + token + "\" on line " +
                            smithlab::toa(line_count));
      sample.push_back(val);
    }
  }
}

void
load_sample(const string &filename, vector<double> &sample) {
  if (filename == "-") {
    load_sample(std::cin, sample);
    return;
  }
  std::ifstream in(filename.c_str());
  if (!in)
    throw runtime_error("failed opening file: " + filename);
  load_sample(in, sample);
}

void
write_sample(std::ostream &out, const vector<double> &sample) {
  out.precision(17);
  for (size_t i = 0; i < sample.size(); ++i)
    out << sample[i] << '\n';
}
