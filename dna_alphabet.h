/* The MIT License

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

#ifndef DNA_ALPHABET_H
#define DNA_ALPHABET_H

#include <cstdint>
#include <cstddef>
#include <vector>
#include "st_error.h"

#define BASE_A 0
#define BASE_C 1
#define BASE_G 2
#define BASE_T 3

//appended to every sequence, never produced by encoding
#define TERMINATOR 4

#define INVALID_BASE -1

#define NO_SYMBOLS 5

#define index2char(i) ("ACGT$"[(i)])

/**
 * Converts base to index, INVALID_BASE for anything outside ACGT.
 */
int32_t base2index(char base);

/**
 * Converts index to base, '$' for the terminator and 'N' otherwise.
 */
char index2base(int32_t index);

/**
 * Encodes sequence of length len into encoded.
 *
 * Fails with ST_INVALID_SYMBOL at the first offending character,
 * encoded is left empty in that case.
 */
bool encode_sequence(const char* seq, size_t len, std::vector<uint8_t>& encoded, STError& error);

#endif
