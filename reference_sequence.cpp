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

#include "reference_sequence.h"

/**
 * Constructor.
 */
ReferenceSequence::ReferenceSequence()
{
    ref_fasta_file = "";
    fai = NULL;
};

/**
 * Destructor.
 */
ReferenceSequence::~ReferenceSequence()
{
    if (fai) fai_destroy(fai);
    fai = NULL;
};

/**
 * Loads the index of ref_fasta_file, building it if absent.
 */
bool ReferenceSequence::load(const std::string& ref_fasta_file)
{
    if (fai) fai_destroy(fai);

    this->ref_fasta_file = ref_fasta_file;
    fai = fai_load(ref_fasta_file.c_str());

    return fai!=NULL;
};

/**
 * Fetch length of sequence chrom, -1 if absent.
 */
int32_t ReferenceSequence::fetch_seq_len(const std::string& chrom)
{
    if (!fai || !faidx_has_seq(fai, chrom.c_str()))
    {
        return -1;
    }

    return faidx_seq_len(fai, chrom.c_str());
};

/**
 * Fetches the sequence of region, upper cased if uppercase is set.
 */
bool ReferenceSequence::fetch_seq(const SequenceRegion& region, std::string& seq, bool uppercase)
{
    seq.clear();

    int32_t seq_len = fetch_seq_len(region.chrom);
    if (seq_len<0)
    {
        fprintf(stderr, "[W:%s:%d %s] %s not found in reference sequence file %s\n", __FILE__, __LINE__, __FUNCTION__, region.chrom.c_str(), ref_fasta_file.c_str());
        return false;
    }

    int32_t beg0, end0;
    if (!region.resolve(seq_len, beg0, end0))
    {
        fprintf(stderr, "[W:%s:%d %s] %s does not lie within %s (%d bases)\n", __FILE__, __LINE__, __FUNCTION__, region.to_string().c_str(), region.chrom.c_str(), seq_len);
        return false;
    }

    int len = 0;
    char* s = faidx_fetch_seq(fai, region.chrom.c_str(), beg0, end0, &len);
    if (s==NULL || len<0)
    {
        fprintf(stderr, "[E:%s:%d %s] fatal error in extracting %s from reference sequence file: %s\n", __FILE__, __LINE__, __FUNCTION__, region.to_string().c_str(), ref_fasta_file.c_str());
        if (s) free(s);
        return false;
    }

    seq.assign(s, len);
    free(s);

    if (uppercase)
    {
        seq = to_upper(seq);
    }

    return true;
};
