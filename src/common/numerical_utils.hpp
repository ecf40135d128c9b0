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

#ifndef NUMERICAL_UTILS_HPP
#define NUMERICAL_UTILS_HPP

#include <cmath>
#include <vector>
#include <limits>

// log(exp(p) + exp(q)) without leaving log space. Either argument may be
// -inf (a zero weight).
inline double
log_sum_log(const double p, const double q)
{
    if (p == -std::numeric_limits<double>::infinity()) return q;
    if (q == -std::numeric_limits<double>::infinity()) return p;
    const double larger = (p > q) ? p : q;
    const double smaller = (p > q) ? q : p;
    return larger + std::log1p(std::exp(smaller - larger));
}

// Neumaier's compensated summation. Terms are added in the order
// given, so two runs over the same sequence give the same bits.
class CompensatedSum {
public:
    CompensatedSum() : sum(0.0), correction(0.0) {}
    void add(const double x)
    {
        const double t = sum + x;
        if (std::fabs(sum) >= std::fabs(x))
            correction += (sum - t) + x;
        else
            correction += (x - t) + sum;
        sum = t;
    }
    double value() const {return sum + correction;}

private:
    double sum;
    double correction;
};

double
sample_mean(std::vector<double>::const_iterator begin,
            std::vector<double>::const_iterator end);

// Population (maximum likelihood) standard deviation of [begin, end).
double
sample_sd(std::vector<double>::const_iterator begin,
          std::vector<double>::const_iterator end);

#endif
