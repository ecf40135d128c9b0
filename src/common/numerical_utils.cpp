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

#include "numerical_utils.hpp"

#include <cmath>
#include <vector>
#include <iterator>

using std::vector;

double
sample_mean(vector<double>::const_iterator begin,
            vector<double>::const_iterator end)
{
    if (begin == end) return 0.0;
    CompensatedSum total;
    for (vector<double>::const_iterator i = begin; i != end; ++i)
        total.add(*i);
    return total.value()/std::distance(begin, end);
}

double
sample_sd(vector<double>::const_iterator begin,
          vector<double>::const_iterator end)
{
    if (begin == end) return 0.0;
    const double mean = sample_mean(begin, end);
    CompensatedSum sq;
    for (vector<double>::const_iterator i = begin; i != end; ++i)
        sq.add((*i - mean)*(*i - mean));
    return std::sqrt(sq.value()/std::distance(begin, end));
}
