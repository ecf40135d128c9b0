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

#ifndef LOAD_SAMPLE_HPP
#define LOAD_SAMPLE_HPP

#include <vector>
#include <string>
#include <iostream>

// Whitespace separated numbers; '#' starts a comment that runs to the
// end of the line. Throws std::runtime_error on anything else.
void
load_sample(std::istream &in, std::vector<double> &sample);

// "-" reads standard input
void
load_sample(const std::string &filename, std::vector<double> &sample);

void
write_sample(std::ostream &out, const std::vector<double> &sample);

#endif
