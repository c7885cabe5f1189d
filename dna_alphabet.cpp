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

#include "dna_alphabet.h"

/**
 * Converts base to index, INVALID_BASE for anything outside ACGT.
 */
int32_t base2index(char base)
{
    switch (base)
    {
        case 'A':
            return BASE_A;
        case 'C':
            return BASE_C;
        case 'G':
            return BASE_G;
        case 'T':
            return BASE_T;
        default:
            return INVALID_BASE;
    }
};

/**
 * Converts index to base, '$' for the terminator and 'N' otherwise.
 */
char index2base(int32_t index)
{
    if (index>=BASE_A && index<=TERMINATOR)
    {
        return index2char(index);
    }

    return 'N';
};

/**
 * Encodes sequence of length len into encoded.
 */
bool encode_sequence(const char* seq, size_t len, std::vector<uint8_t>& encoded, STError& error)
{
    encoded.clear();
    encoded.reserve(len);

    for (size_t i=0; i<len; ++i)
    {
        int32_t b = base2index(seq[i]);
        if (b==INVALID_BASE)
        {
            error.set(ST_INVALID_SYMBOL, (uint32_t)i, seq[i]);
            encoded.clear();
            return false;
        }
        encoded.push_back((uint8_t)b);
    }

    error.clear();
    return true;
};
