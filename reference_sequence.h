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

#ifndef REFERENCE_SEQUENCE_H
#define REFERENCE_SEQUENCE_H

#include <cstdio>
#include <cstdlib>
#include <string>
#include "htslib/faidx.h"
#include "sequence_region.h"

/**
 * A Reference Sequence object wrapping htslib's faidx.
 */
class ReferenceSequence
{
    public:
    std::string ref_fasta_file;

    //fai index
    faidx_t *fai;

    /**
     * Constructor.
     */
    ReferenceSequence();

    /**
     * Destructor.
     */
    ~ReferenceSequence();

    /**
     * Loads the index of ref_fasta_file, building it if absent.
     */
    bool load(const std::string& ref_fasta_file);

    /**
     * Fetch length of sequence chrom, -1 if absent.
     */
    int32_t fetch_seq_len(const std::string& chrom);

    /**
     * Fetches the sequence of region, upper cased if uppercase is set.
     * Returns false if the region cannot be read.
     */
    bool fetch_seq(const SequenceRegion& region, std::string& seq, bool uppercase=false);

    private:
    ReferenceSequence(const ReferenceSequence&);
    ReferenceSequence& operator=(const ReferenceSequence&);
};

#endif
