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

#include <gtest/gtest.h>

#include <vector>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <string>

#include "PoiBin.hpp"
#include "PoiBinErrors.hpp"
#include "poibin_dft.hpp"

using std::vector;


static vector<double>
random_probabilities(const size_t n, const unsigned seed) {
  std::mt19937 gen(seed);
  std::uniform_real_distribution<double> unif(0.0, 1.0);
  vector<double> p(n);
  for (size_t i = 0; i < n; ++i)
    p[i] = unif(gen);
  return p;
}


TEST(PoiBinTest, BinomialHalf) {
  const PoiBin pb(vector<double>(4, 0.5));
  const double expected[] = {0.0625, 0.25, 0.375, 0.25, 0.0625};
  ASSERT_EQ(pb.get_n(), 4u);
  ASSERT_EQ(pb.get_pmf().size(), 5u);
  for (long k = 0; k <= 4; ++k)
    EXPECT_NEAR(pb.pmf(k), expected[k], 1e-12);
  EXPECT_EQ(pb.argmax(), 2u);
  EXPECT_NEAR(pb.amax(), 0.375, 1e-12);
}


TEST(PoiBinTest, SingleTrial) {
  const PoiBin pb(vector<double>(1, 0.3));
  EXPECT_NEAR(pb.pmf(0), 0.7, 1e-12);
  EXPECT_NEAR(pb.pmf(1), 0.3, 1e-12);
  EXPECT_EQ(pb.argmax(), 0u);
  EXPECT_NEAR(pb.amax(), 0.7, 1e-12);
  EXPECT_NEAR(pb.cdf(0), 0.7, 1e-12);
  EXPECT_NEAR(pb.pval(1), 0.3, 1e-12);
}


TEST(PoiBinTest, ArgmaxTakesFirstOfTies) {
  const PoiBin pb(vector<double>(1, 0.5));
  EXPECT_EQ(pb.pmf(0), pb.pmf(1));
  EXPECT_EQ(pb.argmax(), 0u);
  EXPECT_DOUBLE_EQ(pb.amax(), 0.5);
}


TEST(PoiBinTest, ArgmaxTakesLowerOfTwoModes) {
  // equal p = 1/2 with odd n: modes at (n - 1)/2 and (n + 1)/2
  for (size_t n = 3; n < 60; n += 2) {
    const PoiBin pb(vector<double>(n, 0.5));
    EXPECT_EQ(pb.argmax(), (n - 1)/2) << "n=" << n;
    EXPECT_NEAR(pb.pmf((n - 1)/2), pb.pmf((n + 1)/2), 1e-14) << "n=" << n;
  }
}


TEST(PoiBinTest, AllOnesIsPointMass) {
  const size_t n = 6;
  const PoiBin pb(vector<double>(n, 1.0));
  for (size_t k = 0; k < n; ++k)
    EXPECT_NEAR(pb.pmf(k), 0.0, 1e-12);
  EXPECT_NEAR(pb.pmf(n), 1.0, 1e-12);
  EXPECT_DOUBLE_EQ(pb.mean(), static_cast<double>(n));
  EXPECT_DOUBLE_EQ(pb.var(), 0.0);
  EXPECT_DOUBLE_EQ(pb.std_dev(), 0.0);
  EXPECT_EQ(pb.argmax(), n);
  EXPECT_THROW(pb.skew(), DegenerateDistribution);
}


TEST(PoiBinTest, AllZerosIsPointMass) {
  const PoiBin pb(vector<double>(3, 0.0));
  EXPECT_NEAR(pb.pmf(0), 1.0, 1e-12);
  EXPECT_NEAR(pb.pmf(3), 0.0, 1e-12);
  EXPECT_DOUBLE_EQ(pb.mean(), 0.0);
  EXPECT_EQ(pb.argmax(), 0u);
  EXPECT_THROW(pb.skew(), DegenerateDistribution);
}


TEST(PoiBinTest, PmfIsNormalizedAndNonNegative) {
  for (unsigned seed = 1; seed <= 5; ++seed) {
    const PoiBin pb(random_probabilities(100*seed, seed));
    const vector<double> &pmf = pb.get_pmf();
    double total = 0.0;
    for (size_t k = 0; k < pmf.size(); ++k) {
      EXPECT_GE(pmf[k], 0.0);
      total += pmf[k];
    }
    EXPECT_NEAR(total, 1.0, 1e-9);
  }
}


TEST(PoiBinTest, AgreesWithConvolution) {
  const vector<double> p = random_probabilities(300, 17);
  const PoiBin pb(p);
  vector<double> exact;
  poibin_pmf_direct(p, exact);
  ASSERT_EQ(exact.size(), pb.get_pmf().size());
  for (size_t k = 0; k < exact.size(); ++k)
    EXPECT_NEAR(pb.get_pmf()[k], exact[k], 1e-10) << "k=" << k;
}


TEST(PoiBinTest, ExtremeProbabilities) {
  vector<double> p = {1e-9, 1.0 - 1e-9, 0.5, 1e-12, 1.0 - 1e-12,
                      0.25, 0.75, 0.0, 1.0, 1e-15};
  for (size_t i = 0; i < 200; ++i)
    p.push_back(i % 2 == 0 ? 1e-10*(i + 1) : 1.0 - 1e-10*(i + 1));

  const PoiBin pb(p);
  const vector<double> &pmf = pb.get_pmf();
  double total = 0.0;
  for (size_t k = 0; k < pmf.size(); ++k) {
    EXPECT_GE(pmf[k], 0.0) << "k=" << k;
    total += pmf[k];
  }
  EXPECT_NEAR(total, 1.0, 1e-9);

  vector<double> exact;
  poibin_pmf_direct(p, exact);
  for (size_t k = 0; k < exact.size(); ++k)
    EXPECT_NEAR(pmf[k], exact[k], 1e-10) << "k=" << k;
}


TEST(PoiBinTest, CdfIsMonotoneAndEndsAtOne) {
  const PoiBin pb(random_probabilities(50, 3));
  const vector<double> &cdf = pb.get_cdf();
  for (size_t k = 1; k < cdf.size(); ++k)
    EXPECT_GE(cdf[k], cdf[k - 1]);
  EXPECT_DOUBLE_EQ(pb.cdf(50), 1.0);
  EXPECT_NEAR(pb.cdf(0), pb.pmf(0), 1e-15);
}


TEST(PoiBinTest, PvalIsComplementOfCdf) {
  const size_t n = 80;
  const PoiBin pb(random_probabilities(n, 11));
  EXPECT_DOUBLE_EQ(pb.pval(0), 1.0);
  for (long x = 1; x <= static_cast<long>(n); ++x)
    EXPECT_NEAR(pb.pval(x), 1.0 - pb.cdf(x - 1), 1e-9) << "x=" << x;
  EXPECT_NEAR(pb.pval(n), pb.pmf(n), 1e-15);
}


TEST(PoiBinTest, VectorQueriesKeepOrder) {
  const PoiBin pb(random_probabilities(10, 5));
  const vector<long> x = {7, 0, 10, 3, 3};
  const vector<double> pmf = pb.pmf(x);
  const vector<double> cdf = pb.cdf(x);
  const vector<double> pval = pb.pval(x);
  ASSERT_EQ(pmf.size(), x.size());
  ASSERT_EQ(cdf.size(), x.size());
  ASSERT_EQ(pval.size(), x.size());
  for (size_t i = 0; i < x.size(); ++i) {
    EXPECT_EQ(pmf[i], pb.pmf(x[i]));
    EXPECT_EQ(cdf[i], pb.cdf(x[i]));
    EXPECT_EQ(pval[i], pb.pval(x[i]));
  }
  EXPECT_TRUE(pb.pmf(vector<long>()).empty());
}


TEST(PoiBinTest, OutOfRangeQueries) {
  const PoiBin pb(vector<double>(5, 0.2));
  EXPECT_THROW(pb.pmf(6), IndexOutOfRange);
  EXPECT_THROW(pb.pmf(-1), IndexOutOfRange);
  EXPECT_THROW(pb.cdf(6), IndexOutOfRange);
  EXPECT_THROW(pb.cdf(-1), IndexOutOfRange);
  EXPECT_THROW(pb.pval(6), IndexOutOfRange);
  EXPECT_THROW(pb.pval(-1), IndexOutOfRange);
  EXPECT_THROW(pb.pmf(vector<long>({0, 1, 9})), IndexOutOfRange);

  // the distribution is still usable
  EXPECT_NEAR(pb.pmf(0), std::pow(0.8, 5), 1e-12);
}


TEST(PoiBinTest, ClosedFormMoments) {
  const vector<double> p = {0.1, 0.9, 0.35, 0.5, 0.02, 0.77};
  const PoiBin pb(p);
  double mean = 0.0, var = 0.0, third = 0.0;
  for (size_t i = 0; i < p.size(); ++i) {
    mean += p[i];
    var += p[i]*(1.0 - p[i]);
    third += p[i]*(1.0 - p[i])*(1.0 - 2.0*p[i]);
  }
  EXPECT_DOUBLE_EQ(pb.mean(), mean);
  EXPECT_DOUBLE_EQ(pb.var(), var);
  EXPECT_DOUBLE_EQ(pb.std_dev(), std::sqrt(var));
  EXPECT_NEAR(pb.skew(), third/std::pow(var, 1.5), 1e-12);
}


TEST(PoiBinTest, SkewOfTinyVariance) {
  // variance 1e-250: its 1.5 power is below the double range
  const PoiBin pb(vector<double>(1, 1e-250));
  const double s = pb.skew();
  EXPECT_TRUE(std::isfinite(s));
  EXPECT_NEAR(s/1e125, 1.0, 1e-9);
}


TEST(PoiBinTest, MomentsMatchPmf) {
  const PoiBin pb(random_probabilities(60, 23));
  const vector<double> &pmf = pb.get_pmf();
  double m1 = 0.0;
  for (size_t k = 0; k < pmf.size(); ++k)
    m1 += k*pmf[k];
  double m2 = 0.0, m3 = 0.0;
  for (size_t k = 0; k < pmf.size(); ++k) {
    const double d = k - m1;
    m2 += d*d*pmf[k];
    m3 += d*d*d*pmf[k];
  }
  EXPECT_NEAR(m1, pb.mean(), 1e-9);
  EXPECT_NEAR(m2, pb.var(), 1e-8);
  EXPECT_NEAR(m3/std::pow(m2, 1.5), pb.skew(), 1e-7);
}


TEST(PoiBinTest, ConstructionErrors) {
  EXPECT_THROW({PoiBin pb(vector<double>());}, EmptyInput);
  EXPECT_THROW({PoiBin pb(vector<double>({0.2, -0.1}));}, InvalidProbability);
  EXPECT_THROW({PoiBin pb(vector<double>(1, 1.0 + 1e-12));},
               InvalidProbability);
  const vector<double> with_nan = {0.5, std::numeric_limits<double>::quiet_NaN()};
  EXPECT_THROW({PoiBin pb(with_nan);}, InvalidProbability);
}


TEST(PoiBinTest, InvalidProbabilityIdentifiesEntry) {
  try {
    const PoiBin pb(vector<double>({0.2, 0.4, 1.5, 0.1}));
    FAIL() << "expected InvalidProbability";
  }
  catch (const InvalidProbability &e) {
    EXPECT_EQ(e.index, 2u);
    EXPECT_DOUBLE_EQ(e.value, 1.5);
    EXPECT_NE(std::string(e.what()).find("index 2"), std::string::npos);
  }
}


TEST(PoiBinTest, ToleranceSafeguard) {
  const vector<double> p(10, 0.3);
  // no tolerance on total mass: rounding alone is an instability
  const PoiBinTolerance no_norm_tol(1e-10, 1e-10, -1.0);
  EXPECT_THROW({PoiBin pb(p, no_norm_tol);}, NumericalInstability);
  const PoiBinTolerance no_imag_tol(1e-10, -1.0, 1e-6);
  EXPECT_THROW({PoiBin pb(p, no_imag_tol);}, NumericalInstability);
  // no tolerance between tail sums and 1 - cdf
  const PoiBinTolerance no_tail_tol(1e-10, 1e-10, 1e-6, -1.0);
  EXPECT_THROW({PoiBin pb(p, no_tail_tol);}, NumericalInstability);
  const PoiBinTolerance defaults;
  EXPECT_DOUBLE_EQ(defaults.tail_tol, 1e-9);
  EXPECT_NO_THROW({PoiBin pb(p, defaults);});
}


TEST(PoiBinTest, SupportValueConversion) {
  EXPECT_EQ(to_support_value(2.0, 4), 2);
  EXPECT_EQ(to_support_value(0.0, 4), 0);
  EXPECT_EQ(to_support_value(4.0, 4), 4);
  EXPECT_THROW(to_support_value(2.5, 4), IndexOutOfRange);
  EXPECT_THROW(to_support_value(-1.0, 4), IndexOutOfRange);
  EXPECT_THROW(to_support_value(5.0, 4), IndexOutOfRange);
  EXPECT_THROW(to_support_value(std::numeric_limits<double>::quiet_NaN(), 4),
               IndexOutOfRange);
  EXPECT_THROW(to_support_value(std::numeric_limits<double>::infinity(), 4),
               IndexOutOfRange);
}


TEST(PoiBinTest, SummaryString) {
  const PoiBin pb(vector<double>(2, 1.0));
  const std::string s = pb.tostring();
  EXPECT_NE(s.find("mean\t2"), std::string::npos);
  EXPECT_NE(s.find("skew\tNA"), std::string::npos);
  EXPECT_NE(s.find("argmax\t2"), std::string::npos);
}
