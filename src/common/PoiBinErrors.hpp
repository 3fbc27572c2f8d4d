/* Copyright (C) 2019 University of Southern California
 *                    Jianghan Qu and Andrew D Smith
 *
 * Author: Andrew D. Smith and Jianghan Qu
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

#ifndef POIBIN_ERRORS_HPP
#define POIBIN_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <sstream>

// no success probabilities given
struct EmptyInput : public std::invalid_argument {
  EmptyInput() :
    std::invalid_argument("ERROR: empty probability vector") {}
};

// a success probability outside [0, 1] (or NaN)
struct InvalidProbability : public std::invalid_argument {
  InvalidProbability(const size_t i, const double v) :
    std::invalid_argument(format(i, v)), index(i), value(v) {}

  size_t index;
  double value;

private:
  static std::string format(const size_t i, const double v) {
    std::ostringstream oss;
    oss << "ERROR: invalid probability at index " << i << ": " << v
        << " (must be in [0, 1])";
    return oss.str();
  }
};

/* a query for a support value outside [0, n], or one that is not an
   integer; the value is kept as text since it may not be integral */
struct IndexOutOfRange : public std::out_of_range {
  IndexOutOfRange(const std::string &v, const size_t n) :
    std::out_of_range("ERROR: invalid support value: " + v +
                      " (must be an integer in [0, " +
                      std::to_string(n) + "])"), value(v) {}

  std::string value;
};

// skewness of a point mass (zero variance)
struct DegenerateDistribution : public std::domain_error {
  DegenerateDistribution() :
    std::domain_error("ERROR: skewness undefined for zero variance") {}
};

/* the inverted characteristic function did not give a valid pmf even
   after clipping and renormalizing */
struct NumericalInstability : public std::runtime_error {
  NumericalInstability(const std::string &msg) :
    std::runtime_error("ERROR: numerical instability: " + msg) {}
};

#endif
