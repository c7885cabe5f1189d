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

#ifndef SEQUENCE_REGION_H
#define SEQUENCE_REGION_H

#include <cstdint>
#include <string>
#include <vector>
#include "htslib/kstring.h"
#include "utils.h"

//end1 of a region covering the rest of the sequence
#define REGION_END_MAX ((1<<29) - 1)

/**
 * A region of a reference sequence in 1 based inclusive coordinates.
 */
class SequenceRegion
{
    public:
    std::string chrom;
    int32_t beg1;
    int32_t end1;

    /**
     * Constructs an empty region.
     */
    SequenceRegion();

    /**
     * Parses a region.
     *
     * e.g chr2:2000-4000   position 2000 to 4000 on chr2
     *     chr2:2000        position 2000 on chr2
     *     chr2             the entirety of chr2
     *
     * Returns false if the region is malformed.
     */
    bool parse(const std::string& region);

    /**
     * Returns true if the region spans the whole sequence.
     */
    bool is_whole() const;

    /**
     * Resolves this region against a sequence of seq_len bases into
     * 0 based inclusive coordinates.  A whole region takes the full length.
     *
     * Returns false if the region does not lie within the sequence.
     */
    bool resolve(int32_t seq_len, int32_t& beg0, int32_t& end0) const;

    /**
     * Returns a string representation of this region.
     */
    std::string to_string() const;
};

#endif
