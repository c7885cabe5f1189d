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

#include "sequence_region.h"

/**
 * Constructs an empty region.
 */
SequenceRegion::SequenceRegion()
{
    chrom = "";
    beg1 = 1;
    end1 = REGION_END_MAX;
};

/**
 * Parses a region.
 */
bool SequenceRegion::parse(const std::string& region)
{
    std::vector<std::string> v;
    split(v, ":-", region);

    if (v.size()==1)
    {
        chrom = v[0];
        beg1 = 1;
        end1 = REGION_END_MAX;
    }
    else if (v.size()==2)
    {
        chrom = v[0];
        if (!str2int32(v[1], beg1)) return false;
        end1 = beg1;
    }
    else if (v.size()==3)
    {
        chrom = v[0];
        if (!str2int32(v[1], beg1) || !str2int32(v[2], end1)) return false;
    }
    else
    {
        return false;
    }

    return beg1>=1 && beg1<=end1;
};

/**
 * Returns true if the region spans the whole sequence.
 */
bool SequenceRegion::is_whole() const
{
    return beg1==1 && end1==REGION_END_MAX;
};

/**
 * Resolves this region against a sequence of seq_len bases.
 */
bool SequenceRegion::resolve(int32_t seq_len, int32_t& beg0, int32_t& end0) const
{
    beg0 = -1;
    end0 = -1;

    if (is_whole())
    {
        if (seq_len<1) return false;
        beg0 = 0;
        end0 = seq_len-1;
        return true;
    }

    if (beg1<1 || beg1>end1 || end1>seq_len)
    {
        return false;
    }

    beg0 = beg1-1;
    end0 = end1-1;
    return true;
};

/**
 * Returns a string representation of this region.
 */
std::string SequenceRegion::to_string() const
{
    kstring_t s = {0,0,0};
    kputs(chrom.c_str(), &s);
    if (!is_whole())
    {
        kputc(':', &s);
        kputw(beg1, &s);
        kputc('-', &s);
        kputw(end1, &s);
    }
    std::string region(s.s ? s.s : "");
    if (s.m) free(s.s);
    return region;
};
