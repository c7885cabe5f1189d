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

#ifndef SEQUENCE_BUFFER_H
#define SEQUENCE_BUFFER_H

#include <cstdint>
#include <string>
#include <vector>
#include "dna_alphabet.h"
#include "st_error.h"

//keeps 2(n+1) node ids and every position below the NIL sentinel
#define MAX_SEQUENCE_LENGTH 0x7FFFFFFEU

/**
 * Encoded DNA sequence with a terminator appended.
 *
 *  0                         n
 *  +--+--+--+--+--+--+--+--+--+
 *  |A |C |G |T |A |C |G |T |$ |
 *  +--+--+--+--+--+--+--+--+--+
 *
 * length() is n, size() is n+1.
 */
class SequenceBuffer
{
    public:

    /**
     * Constructor.
     */
    SequenceBuffer();

    /**
     * Sets the sequence, fails without modifying the buffer.
     */
    bool set_sequence(const char* seq, size_t len, STError& error);

    /**
     * Sets the sequence, fails without modifying the buffer.
     */
    bool set_sequence(const std::string& seq, STError& error);

    /**
     * Empties the buffer.
     */
    void clear();

    /**
     * Returns the number of bases, terminator excluded.
     */
    uint32_t length() const { return (uint32_t)seq.size() - 1; };

    /**
     * Returns the number of symbols, terminator included.
     */
    uint32_t size() const { return (uint32_t)seq.size(); };

    /**
     * Returns the symbol at i.
     */
    uint8_t operator[] (uint32_t i) const { return seq[i]; };

    /**
     * Decodes [beg0, end0) for diagnostics.
     */
    std::string decode(uint32_t beg0, uint32_t end0) const;

    private:
    std::vector<uint8_t> seq;
};

#endif
