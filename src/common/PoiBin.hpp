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

#ifndef POIBIN_HPP
#define POIBIN_HPP

#include <vector>
#include <string>
#include <ostream>

#include "poibin_dft.hpp"

/* Poisson Binomial distribution: the number of successes among n
   independent Bernoulli trials with success probabilities p_1..p_n.
   The pmf, cdf and survival function over 0..n are computed once in
   the constructor (Hong 2013) and never change afterwards.
 */
class PoiBin {
public:
  PoiBin(const std::vector<double> &probs);
  PoiBin(const std::vector<double> &probs, const PoiBinTolerance &tol);

  // Pr(X = x)
  double pmf(const long x) const;
  std::vector<double> pmf(const std::vector<long> &x) const;

  // Pr(X <= x)
  double cdf(const long x) const;
  std::vector<double> cdf(const std::vector<long> &x) const;

  // right-tailed p-value, Pr(X >= x)
  double pval(const long x) const;
  std::vector<double> pval(const std::vector<long> &x) const;

  // moments from the success probabilities
  double mean() const;
  double var() const;
  double std_dev() const;
  double skew() const;

  /* mode: the largest mass, and the first value whose mass is within
     tie_tol of it (exactly tied modes differ by rounding noise) */
  double amax() const;
  size_t argmax() const;

  size_t get_n() const {return n;}
  const std::vector<double> &get_probs() const {return p;}
  const std::vector<double> &get_pmf() const {return pmf_vals;}
  const std::vector<double> &get_cdf() const {return cdf_vals;}
  const std::vector<double> &get_sf() const {return sf_vals;}

  std::string tostring() const;

private:
  void initialize(const PoiBinTolerance &tol);
  size_t check_support(const long x) const;
  std::vector<double> lookup(const std::vector<double> &table,
                             const std::vector<long> &x) const;

  size_t n;
  double tie_tol;
  std::vector<double> p;
  std::vector<double> pmf_vals;
  std::vector<double> cdf_vals; // cdf_vals[k] = Pr(X <= k)
  std::vector<double> sf_vals;  // sf_vals[k] = Pr(X >= k)
};

std::ostream &
operator<<(std::ostream &os, const PoiBin &pb);

/* converts a query value that may not be integral (e.g. read as text)
   into a support index, throwing IndexOutOfRange unless it is an
   integer in [0, n] */
long
to_support_value(const double x, const size_t n);

#endif
