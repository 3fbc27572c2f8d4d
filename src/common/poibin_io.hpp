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

#ifndef POIBIN_IO_HPP
#define POIBIN_IO_HPP

#include <string>
#include <vector>
#include <istream>

/* whitespace separated success probabilities; lines starting with
   '#' are comments. Range checks are left to PoiBin. */
void
read_probabilities(std::istream &in, std::vector<double> &p);

void
read_probabilities(const std::string &probs_file, std::vector<double> &p);

// comma separated support values, each an integer in [0, n]
void
parse_support_values(const std::string &text, const size_t n,
                     std::vector<long> &values);

#endif
