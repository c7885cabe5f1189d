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

#include "utils.h"

/**
 * Splits a line into a vector - PERL style
 */
void split(std::vector<std::string>& vec, const char *delims, const std::string& str, uint32_t limit, bool clear, bool collapse)
{
    std::map<char, int32_t> delim_set;

    for (uint32_t i=0; i<strlen(delims); ++i)
    {
        delim_set[delims[i]] = 1;
    }

    if (clear)
    {
        vec.clear();
    }
    const char* tempStr = str.c_str();
    int32_t i=0, lastIndex = str.size()-1;
    std::stringstream token;

    if (lastIndex<0) return;

    uint32_t noTokens = 0;
    bool isDelim = false;
    while (i<=lastIndex)
    {
        isDelim = (delim_set.find(tempStr[i])!=delim_set.end());

        if (!isDelim || noTokens>=limit-1)
        {
            token << tempStr[i];
        }

        if ((isDelim && noTokens<limit-1) || i==lastIndex)
        {
            if (collapse && token.str()!="")
            {
                vec.push_back(token.str());
                ++noTokens;
                token.str("");
            }
        }

        ++i;
    }
};

/**
 * Joins a vector of strings into a string - PERL style
 */
std::string join(const std::vector<std::string>& vec, std::string delim)
{
    std::string s;
    for (uint32_t i=0; i<vec.size(); ++i)
    {
        if (i) s += delim;
        s += vec[i];
    }

    return s;
}

/**
 * Joins a vector of positions into a string.
 */
std::string join(const std::vector<uint32_t>& vec, std::string delim)
{
    std::stringstream ss;
    for (uint32_t i=0; i<vec.size(); ++i)
    {
        if (i) ss << delim;
        ss << vec[i];
    }

    return ss.str();
}

/**
 * Casts a string into int32.  Returns true if successful.
 */
bool str2int32(const std::string& s, int32_t& i)
{
    const char* start = s.c_str();
    char *end = 0;
    i = std::strtol(s.c_str(), &end, 10);
    return (end!=start);
};

/**
 * Casts a string into uint32.  Returns true if successful.
 */
bool str2uint32(const std::string& s, uint32_t& i)
{
    const char* start = s.c_str();
    char *end = 0;
    i = std::strtoul(s.c_str(), &end, 10);
    return (end!=start);
};

/**
 * Returns a string in upper case.
 */
std::string to_upper(const std::string& s)
{
    std::string t = s;
    for (size_t i=0; i<t.size(); ++i)
    {
        t[i] = toupper((unsigned char)t[i]);
    }

    return t;
};

/**
 * Shows a match of length len at pos with flank bases on each side.
 */
std::string extract_context(const std::string& seq, uint32_t pos, uint32_t len, uint32_t flank)
{
    size_t n = seq.size();
    if (pos>n) pos = n;
    size_t beg = pos>flank ? pos-flank : 0;
    size_t mend = std::min((size_t)pos+len, n);
    size_t end = std::min(mend+flank, n);

    std::string s;
    if (beg>0) s.append("...");
    s.append(seq, beg, pos-beg);
    s.append("[");
    s.append(seq, pos, mend-pos);
    s.append("]");
    s.append(seq, mend, end-mend);
    if (end<n) s.append("...");

    return s;
};

/**
 * Samples k of positions at random, sorted.
 */
void sample_positions(const std::vector<uint32_t>& positions, uint32_t k, uint32_t seed, std::vector<uint32_t>& sampled)
{
    sampled = positions;
    if (k>=sampled.size()) return;

    //partial Fisher-Yates shuffle
    std::mt19937 rng(seed);
    for (uint32_t i=0; i<k; ++i)
    {
        std::uniform_int_distribution<size_t> pick(i, sampled.size()-1);
        std::swap(sampled[i], sampled[pick(rng)]);
    }
    sampled.resize(k);
    std::sort(sampled.begin(), sampled.end());
};
