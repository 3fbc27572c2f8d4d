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

#include <string>
#include <vector>
#include <iostream>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <sstream>
#include <limits>
#include <cstdlib>

#include "OptionParser.hpp"
#include "smithlab_utils.hpp"
#include "smithlab_os.hpp"

#include "PoiBin.hpp"
#include "PoiBinErrors.hpp"
#include "poibin_io.hpp"

using std::vector;
using std::string;
using std::endl;
using std::cerr;
using std::cout;


static void
write_output(const PoiBin &pb, const vector<long> &values,
             const bool write_summary, std::ostream &out) {

  const vector<double> pmf = pb.pmf(values);
  const vector<double> cdf = pb.cdf(values);
  const vector<double> pval = pb.pval(values);

  out << std::setprecision(std::numeric_limits<double>::max_digits10);
  out << "#k\tpmf\tcdf\tpval\n";
  for (size_t i = 0; i < values.size(); ++i)
    out << values[i] << '\t' << pmf[i] << '\t'
        << cdf[i] << '\t' << pval[i] << '\n';

  if (write_summary) {
    std::istringstream iss(pb.tostring());
    string line;
    while (getline(iss, line))
      out << '#' << line << '\n';
  }
}


int main(int argc, const char **argv) {

  try {

    string outfile;
    string values_arg;
    bool VERBOSE = false;
    bool write_summary = false;

    PoiBinTolerance tol;

    ////////////////////////////////////////////////////////////////////////
    OptionParser opt_parse(strip_path(argv[0]), "distribution of the number "
                           "of successes in independent Bernoulli trials "
                           "(Poisson Binomial)", "<probabilities-file>");
    opt_parse.add_opt("output", 'o', "output file (default: stdout)",
                      false, outfile);
    opt_parse.add_opt("values", 'x', "comma separated numbers of successes "
                      "(default: 0 to n)", false, values_arg);
    opt_parse.add_opt("summary", 'S', "write mean, variance, skewness "
                      "and mode", false, write_summary);
    opt_parse.add_opt("clip-tol", '\0', "negative mass clipped to zero",
                      false, tol.clip_tol);
    opt_parse.add_opt("imag-tol", '\0', "imaginary residue accepted from "
                      "the dft", false, tol.imag_tol);
    opt_parse.add_opt("norm-tol", '\0', "deviation of total mass from one "
                      "accepted", false, tol.norm_tol);
    opt_parse.add_opt("tail-tol", '\0', "disagreement accepted between tail "
                      "sums and one minus the cdf", false, tol.tail_tol);
    opt_parse.add_opt("tie-tol", '\0', "masses this close to the maximum "
                      "count as tied modes", false, tol.tie_tol);
    opt_parse.add_opt("verbose", 'v', "print more run info", false, VERBOSE);
    opt_parse.set_show_defaults();
    vector<string> leftover_args;
    opt_parse.parse(argc, argv, leftover_args);
    if (argc == 1 || opt_parse.help_requested()) {
      cerr << opt_parse.help_message() << endl
           << opt_parse.about_message() << endl;
      return EXIT_SUCCESS;
    }
    if (opt_parse.about_requested()) {
      cerr << opt_parse.about_message() << endl;
      return EXIT_SUCCESS;
    }
    if (opt_parse.option_missing()) {
      cerr << opt_parse.option_missing_message() << endl;
      return EXIT_SUCCESS;
    }
    if (leftover_args.size() != 1) {
      cerr << opt_parse.help_message() << endl;
      return EXIT_SUCCESS;
    }
    const string probs_file(leftover_args.front());
    ////////////////////////////////////////////////////////////////////////

    if (VERBOSE)
      cerr << "[READING PROBABILITIES: " << probs_file << "]" << endl;
    vector<double> p;
    read_probabilities(probs_file, p);
    if (VERBOSE)
      cerr << "[n trials: " << p.size() << "]" << endl
           << "[TOLERANCES]" << endl << tol.tostring() << endl;

    if (VERBOSE)
      cerr << "[COMPUTING DISTRIBUTION]" << endl;
    const PoiBin pb(p, tol);
    if (VERBOSE)
      cerr << pb << endl;

    vector<long> values;
    if (values_arg.empty())
      for (size_t k = 0; k <= pb.get_n(); ++k)
        values.push_back(k);
    else
      parse_support_values(values_arg, pb.get_n(), values);

    if (VERBOSE)
      cerr << "[WRITING OUTPUT: " << values.size() << " values]" << endl;
    if (outfile.empty())
      write_output(pb, values, write_summary, cout);
    else {
      std::ofstream out(outfile);
      if (!out)
        throw std::runtime_error("bad output file: " + outfile);
      write_output(pb, values, write_summary, out);
    }
  }
  catch (const std::exception &e) {
    cerr << e.what() << endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
