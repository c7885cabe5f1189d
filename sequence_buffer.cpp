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

#include "sequence_buffer.h"

/**
 * Constructor.
 */
SequenceBuffer::SequenceBuffer()
{
    clear();
};

/**
 * Sets the sequence, fails without modifying the buffer.
 */
bool SequenceBuffer::set_sequence(const char* seq, size_t len, STError& error)
{
    if (len>MAX_SEQUENCE_LENGTH)
    {
        error.set(ST_RESOURCE_EXHAUSTED, MAX_SEQUENCE_LENGTH);
        return false;
    }

    std::vector<uint8_t> encoded;
    if (!encode_sequence(seq, len, encoded, error))
    {
        return false;
    }

    encoded.push_back(TERMINATOR);
    this->seq.swap(encoded);

    return true;
};

/**
 * Sets the sequence, fails without modifying the buffer.
 */
bool SequenceBuffer::set_sequence(const std::string& seq, STError& error)
{
    return set_sequence(seq.c_str(), seq.size(), error);
};

/**
 * Empties the buffer.
 */
void SequenceBuffer::clear()
{
    seq.assign(1, TERMINATOR);
};

/**
 * Decodes [beg0, end0) for diagnostics.
 */
std::string SequenceBuffer::decode(uint32_t beg0, uint32_t end0) const
{
    std::string s;
    if (end0>size()) end0 = size();
    for (uint32_t i=beg0; i<end0; ++i)
    {
        s.append(1, index2base(seq[i]));
    }

    return s;
};
