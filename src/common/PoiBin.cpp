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

#include "PoiBin.hpp"
#include "PoiBinErrors.hpp"

#include <cmath>
#include <numeric>
#include <algorithm>
#include <sstream>

using std::vector;
using std::string;
using std::to_string;


PoiBin::PoiBin(const vector<double> &probs) :
  n(probs.size()), tie_tol(PoiBinTolerance().tie_tol), p(probs) {
  initialize(PoiBinTolerance());
}

PoiBin::PoiBin(const vector<double> &probs, const PoiBinTolerance &tol) :
  n(probs.size()), tie_tol(tol.tie_tol), p(probs) {
  initialize(tol);
}


/* builds the pmf from the characteristic function, then the cdf and
   survival function as running sums from either end */
void
PoiBin::initialize(const PoiBinTolerance &tol) {

  poibin_pmf_dft(p, tol, pmf_vals);

  cdf_vals.resize(n + 1);
  std::partial_sum(pmf_vals.begin(), pmf_vals.end(), cdf_vals.begin());

  sf_vals.resize(n + 1);
  std::partial_sum(pmf_vals.rbegin(), pmf_vals.rend(), sf_vals.rbegin());

  // rounding can push running sums just past one
  for (size_t k = 0; k <= n; ++k) {
    cdf_vals[k] = std::min(cdf_vals[k], 1.0);
    sf_vals[k] = std::min(sf_vals[k], 1.0);
  }
  cdf_vals[n] = 1.0;
  sf_vals[0] = 1.0;

  // Pr(X >= k) summed directly must agree with 1 - Pr(X <= k - 1)
  for (size_t k = 1; k <= n; ++k) {
    const double complement = 1.0 - cdf_vals[k - 1];
    if (!(std::abs(sf_vals[k] - complement) <= tol.tail_tol)) {
      std::ostringstream oss;
      oss << "tail sum " << sf_vals[k] << " and complement "
          << complement << " disagree at " << k;
      throw NumericalInstability(oss.str());
    }
  }
}


size_t
PoiBin::check_support(const long x) const {
  if (x < 0 || static_cast<size_t>(x) > n)
    throw IndexOutOfRange(to_string(x), n);
  return static_cast<size_t>(x);
}


vector<double>
PoiBin::lookup(const vector<double> &table, const vector<long> &x) const {
  vector<double> r(x.size());
  for (size_t i = 0; i < x.size(); ++i)
    r[i] = table[check_support(x[i])];
  return r;
}


double
PoiBin::pmf(const long x) const {
  return pmf(vector<long>(1, x)).front();
}

vector<double>
PoiBin::pmf(const vector<long> &x) const {
  return lookup(pmf_vals, x);
}


double
PoiBin::cdf(const long x) const {
  return cdf(vector<long>(1, x)).front();
}

vector<double>
PoiBin::cdf(const vector<long> &x) const {
  return lookup(cdf_vals, x);
}


double
PoiBin::pval(const long x) const {
  return pval(vector<long>(1, x)).front();
}

vector<double>
PoiBin::pval(const vector<long> &x) const {
  return lookup(sf_vals, x);
}


double
PoiBin::mean() const {
  return std::accumulate(p.begin(), p.end(), 0.0);
}


double
PoiBin::var() const {
  double total = 0.0;
  for (size_t i = 0; i < n; ++i)
    total += p[i]*(1.0 - p[i]);
  return total;
}


double
PoiBin::std_dev() const {
  return std::sqrt(var());
}


double
PoiBin::skew() const {
  const double v = var();
  if (v == 0.0)
    throw DegenerateDistribution();
  double third = 0.0;
  for (size_t i = 0; i < n; ++i)
    third += p[i]*(1.0 - p[i])*(1.0 - 2.0*p[i]);
  // v^1.5 underflows for tiny v
  return third/v/std::sqrt(v);
}


double
PoiBin::amax() const {
  return *std::max_element(pmf_vals.begin(), pmf_vals.end());
}


size_t
PoiBin::argmax() const {
  const double threshold = amax() - tie_tol;
  size_t k = 0;
  while (pmf_vals[k] < threshold)
    ++k;
  return k;
}


string
PoiBin::tostring() const {
  std::ostringstream oss;
  oss << "n\t" << n << '\n'
      << "mean\t" << mean() << '\n'
      << "var\t" << var() << '\n'
      << "std\t" << std_dev() << '\n';
  if (var() > 0.0)
    oss << "skew\t" << skew() << '\n';
  else
    oss << "skew\tNA\n";
  oss << "amax\t" << amax() << '\n'
      << "argmax\t" << argmax();
  return oss.str();
}


std::ostream &
operator<<(std::ostream &os, const PoiBin &pb) {
  return os << pb.tostring();
}


long
to_support_value(const double x, const size_t n) {
  if (!std::isfinite(x) || x != std::floor(x) ||
      x < 0.0 || x > static_cast<double>(n)) {
    std::ostringstream oss;
    oss << x;
    throw IndexOutOfRange(oss.str(), n);
  }
  return static_cast<long>(x);
}
