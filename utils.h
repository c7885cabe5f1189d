/* The MIT License

   Copyright (c) 2013 Adrian Tan <atks@umich.edu>
   Copyright (c) 2026 The stree authors

   Permission is hereby granted, free of charge, to any person obtaining a copy
   of this software and associated documentation files (the "Software"), to deal
   in the Software without restriction, including without limitation the rights
   to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
   copies of the Software, and to permit persons to whom the Software is
   furnished to do so, subject to the following conditions:

   The above copyright notice and this permission notice shall be included in
   all copies or substantial portions of the Software.

   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
   IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
   FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
   AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
   LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
   OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
   THE SOFTWARE.
*/

#ifndef UTILS_H
#define UTILS_H

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <map>
#include <random>

/**
 * Splits a line into a vector - PERL style
 */
void split(std::vector<std::string>& vec, const char* delims, const std::string& str, uint32_t limit=UINT_MAX, bool clear=true, bool collapse=true);

/**
 * Joins a vector of strings into a string - PERL style
 */
std::string join(const std::vector<std::string>& vec, std::string delim);

/**
 * Joins a vector of positions into a string.
 */
std::string join(const std::vector<uint32_t>& vec, std::string delim);

/**
 * Casts a string into int32.  Returns true if successful.
 */
bool str2int32(const std::string& s, int32_t& i);

/**
 * Casts a string into uint32.  Returns true if successful.
 */
bool str2uint32(const std::string& s, uint32_t& i);

/**
 * Returns a string in upper case.
 */
std::string to_upper(const std::string& s);

/**
 * Shows a match of length len at pos with flank bases on each side.
 *
 * e.g. ...ACGTACGTAC[GATT]ACAGTTTACG...
 */
std::string extract_context(const std::string& seq, uint32_t pos, uint32_t len, uint32_t flank);

/**
 * Samples k of positions at random, sorted.  All positions are kept when
 * there are no more than k.  The same seed gives the same sample.
 */
void sample_positions(const std::vector<uint32_t>& positions, uint32_t k, uint32_t seed, std::vector<uint32_t>& sampled);

#endif
