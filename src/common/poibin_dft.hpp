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

#ifndef POIBIN_DFT_HPP
#define POIBIN_DFT_HPP

#include <vector>
#include <complex>
#include <string>

/* Tolerances used when turning the inverted characteristic function
   into a pmf. All are absolute: pmf values are bounded by 1. */
struct PoiBinTolerance {
  PoiBinTolerance() : clip_tol(1e-10), imag_tol(1e-10), norm_tol(1e-6),
                      tail_tol(1e-9), tie_tol(1e-12) {}
  PoiBinTolerance(const double c, const double i, const double s,
                  const double t = 1e-9, const double m = 1e-12) :
    clip_tol(c), imag_tol(i), norm_tol(s), tail_tol(t), tie_tol(m) {}

  std::string tostring() const;

  double clip_tol; // negative values above -clip_tol are set to zero
  double imag_tol; // largest imaginary residue accepted from the dft
  double norm_tol; // largest |sum(pmf) - 1| accepted before rescaling
  double tail_tol; // largest |Pr(X >= k) - (1 - Pr(X <= k - 1))|
  double tie_tol;  // masses this close to the maximum count as modes
};

// throws EmptyInput or InvalidProbability
void
check_probabilities(const std::vector<double> &p);

/* Characteristic function of the sum of Bernoulli(p_i), sampled at
   the n+1 frequencies 2*pi*k/(n+1). Each sample is accumulated as a
   sum of log-moduli and a sum of arguments of the per-trial factors;
   only the first half of the frequencies is evaluated, the rest are
   complex conjugates. */
void
characteristic_function(const std::vector<double> &p,
                        std::vector<std::complex<double> > &chi);

/* in-place forward complex dft (GSL mixed-radix, any length); calls
   from different threads are serialized since the GSL error handler
   is process-wide */
void
forward_dft(std::vector<std::complex<double> > &x);

/* The pmf over 0..n by inverting the characteristic function, with
   rounding noise clipped and the result renormalized; throws
   NumericalInstability if the dft output is not a valid pmf within
   the given tolerances */
void
poibin_pmf_dft(const std::vector<double> &p, const PoiBinTolerance &tol,
               std::vector<double> &pmf);

/* Exact O(n^2) convolution recursion; reference for checking the dft
   path */
void
poibin_pmf_direct(const std::vector<double> &p, std::vector<double> &pmf);

#endif
