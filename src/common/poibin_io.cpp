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

#include "poibin_io.hpp"
#include "PoiBin.hpp"
#include "PoiBinErrors.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

using std::string;
using std::vector;
using std::runtime_error;


// true if the whole token is a number
static bool
parse_number(const string &token, double &val) {
  std::istringstream iss(token);
  if (!(iss >> val))
    return false;
  char c = 0;
  return !(iss >> c);
}


void
read_probabilities(std::istream &in, vector<double> &p) {
  p.clear();
  string buffer;
  size_t line_number = 0;
  while (getline(in, buffer)) {
    ++line_number;
    if (buffer.empty() || buffer[0] == '#')
      continue;
    std::istringstream iss(buffer);
    string token;
    while (iss >> token) {
      double val = 0.0;
      if (!parse_number(token, val))
        throw runtime_error("bad probability on line " +
                            std::to_string(line_number) + ": " + token);
      p.push_back(val);
    }
  }
}


void
read_probabilities(const string &probs_file, vector<double> &p) {
  std::ifstream in(probs_file);
  if (!in)
    throw runtime_error("cannot read: " + probs_file);
  read_probabilities(in, p);
}


void
parse_support_values(const string &text, const size_t n,
                     vector<long> &values) {
  values.clear();
  std::istringstream iss(text);
  string token;
  while (getline(iss, token, ',')) {
    double val = 0.0;
    if (!parse_number(token, val))
      throw IndexOutOfRange(token, n);
    values.push_back(to_support_value(val, n));
  }
}
