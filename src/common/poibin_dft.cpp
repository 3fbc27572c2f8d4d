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

#include "poibin_dft.hpp"
#include "PoiBinErrors.hpp"

#include <cmath>
#include <memory>
#include <mutex>
#include <numeric>
#include <sstream>

#include <gsl/gsl_errno.h>
#include <gsl/gsl_fft_complex.h>

using std::vector;
using std::string;
using std::complex;
using std::runtime_error;
using std::to_string;


string
PoiBinTolerance::tostring() const {
  std::ostringstream oss;
  oss << "clip_tol\t" << clip_tol << '\n'
      << "imag_tol\t" << imag_tol << '\n'
      << "norm_tol\t" << norm_tol << '\n'
      << "tail_tol\t" << tail_tol << '\n'
      << "tie_tol\t" << tie_tol;
  return oss.str();
}


void
check_probabilities(const vector<double> &p) {
  if (p.empty())
    throw EmptyInput();
  // negated test so that NaN is rejected
  for (size_t i = 0; i < p.size(); ++i)
    if (!(p[i] >= 0.0 && p[i] <= 1.0))
      throw InvalidProbability(i, p[i]);
}


void
characteristic_function(const vector<double> &p,
                        vector<complex<double> > &chi) {

  static const double two_pi = 2.0*std::acos(-1.0);

  const size_t n_trials = p.size();
  const size_t n_freq = n_trials + 1;
  const double omega = two_pi/n_freq;

  chi.resize(n_freq);
  chi[0] = complex<double>(1.0, 0.0);

  const size_t half = n_freq/2;
  for (size_t k = 1; k <= half; ++k) {
    const double c = std::cos(omega*k);
    const double s = std::sin(omega*k);

    // factor for trial i: 1 - p_i + p_i*exp(i*omega*k)
    double log_modulus = 0.0;
    double phase = 0.0;
    for (size_t i = 0; i < n_trials; ++i) {
      const double re = 1.0 - p[i] + p[i]*c;
      const double im = p[i]*s;
      log_modulus += std::log(std::hypot(re, im)); // -inf for a zero factor
      phase += std::atan2(im, re);
    }
    const double modulus = std::exp(log_modulus);
    chi[k] = complex<double>(modulus*std::cos(phase), modulus*std::sin(phase));
  }

  // the middle frequency for even n_freq is its own conjugate
  if (n_freq % 2 == 0)
    chi[half] = complex<double>(chi[half].real(), 0.0);

  for (size_t k = half + 1; k < n_freq; ++k)
    chi[k] = std::conj(chi[n_freq - k]);
}


/* GSL reports errors through a global handler that aborts by
   default; switch it off while the transform runs so failures come
   back as status codes. The handler is global, so the swap and
   restore happen under one lock for all threads. */
static std::mutex gsl_handler_mutex;

struct gsl_handler_guard {
  gsl_handler_guard() : lock(gsl_handler_mutex),
                        previous(gsl_set_error_handler_off()) {}
  ~gsl_handler_guard() {gsl_set_error_handler(previous);}
  std::lock_guard<std::mutex> lock;
  gsl_error_handler_t *previous;
};

typedef std::unique_ptr<gsl_fft_complex_wavetable,
                        void (*)(gsl_fft_complex_wavetable *)> wavetable_ptr;
typedef std::unique_ptr<gsl_fft_complex_workspace,
                        void (*)(gsl_fft_complex_workspace *)> workspace_ptr;

void
forward_dft(vector<complex<double> > &x) {
  const size_t n = x.size();
  if (n == 0)
    return;

  gsl_handler_guard guard;

  wavetable_ptr wavetable(gsl_fft_complex_wavetable_alloc(n),
                          gsl_fft_complex_wavetable_free);
  workspace_ptr workspace(gsl_fft_complex_workspace_alloc(n),
                          gsl_fft_complex_workspace_free);
  if (!wavetable || !workspace)
    throw runtime_error("ERROR: cannot allocate dft of length " +
                        to_string(n));

  // std::complex<double> is layout compatible with a packed double pair
  const int status =
    gsl_fft_complex_forward(reinterpret_cast<double *>(x.data()), 1, n,
                            wavetable.get(), workspace.get());
  if (status != GSL_SUCCESS)
    throw runtime_error(string("ERROR: dft failed: ") + gsl_strerror(status));
}


void
poibin_pmf_dft(const vector<double> &p, const PoiBinTolerance &tol,
               vector<double> &pmf) {

  check_probabilities(p);

  vector<complex<double> > xi;
  characteristic_function(p, xi);

  const size_t n_freq = xi.size();
  for (size_t k = 0; k < n_freq; ++k)
    xi[k] /= static_cast<double>(n_freq);

  forward_dft(xi);

  pmf.resize(n_freq);
  for (size_t k = 0; k < n_freq; ++k) {
    if (!(std::abs(xi[k].imag()) <= tol.imag_tol)) {
      std::ostringstream oss;
      oss << "imaginary part " << xi[k].imag() << " at " << k;
      throw NumericalInstability(oss.str());
    }
    double val = xi[k].real();
    if (val < 0.0) {
      if (val < -tol.clip_tol) {
        std::ostringstream oss;
        oss << "negative mass " << val << " at " << k;
        throw NumericalInstability(oss.str());
      }
      val = 0.0;
    }
    pmf[k] = val;
  }

  const double total = std::accumulate(pmf.begin(), pmf.end(), 0.0);
  if (!(std::abs(total - 1.0) <= tol.norm_tol)) {
    std::ostringstream oss;
    oss << "total mass " << total;
    throw NumericalInstability(oss.str());
  }
  for (size_t k = 0; k < n_freq; ++k)
    pmf[k] /= total;
}


void
poibin_pmf_direct(const vector<double> &p, vector<double> &pmf) {

  check_probabilities(p);

  const size_t n_trials = p.size();
  pmf.assign(n_trials + 1, 0.0);
  pmf[0] = 1.0;

  // after trial i, pmf[0..i+1] is the distribution of the first i+1 sums
  for (size_t i = 0; i < n_trials; ++i) {
    const double q = 1.0 - p[i];
    for (size_t k = i + 1; k > 0; --k)
      pmf[k] = pmf[k]*q + pmf[k - 1]*p[i];
    pmf[0] *= q;
  }
}
