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

#ifndef PATTERN_MATCHER_H
#define PATTERN_MATCHER_H

#include <cstdint>
#include <string>
#include <vector>
#include <algorithm>
#include <utility>
#include "dna_alphabet.h"
#include "suffix_tree.h"
#include "st_error.h"

/**
 * Exact pattern search on a constructed suffix tree.
 *
 * find() does not modify the tree and keeps no state of its own,
 * so one matcher may serve several threads.
 */
class PatternMatcher
{
    public:

    /**
     * Constructor.
     */
    PatternMatcher(const SuffixTree& tree);

    /**
     * Finds all 0 based positions of pattern in the sequence, in ascending order.
     *
     * The empty pattern occurs at every position of the sequence.
     * Fails with ST_INVALID_SYMBOL before the search if pattern is not over ACGT.
     */
    bool find(const std::string& pattern, std::vector<uint32_t>& positions, STError& error) const;

    /**
     * Counts the occurrences of pattern.
     */
    bool count(const std::string& pattern, uint32_t& no, STError& error) const;

    private:
    const SuffixTree& tree;

    /**
     * Descends along pattern from the root.
     *
     * Returns false on a mismatch, otherwise node is the topmost node whose
     * path spells pattern as a prefix and depth is the string depth at node.
     */
    bool locate(const std::vector<uint8_t>& pattern, uint32_t& node, uint32_t& depth) const;

    /**
     * Collects the suffix positions of all leaves below node.
     */
    void collect_leaves(uint32_t node, uint32_t depth, std::vector<uint32_t>& positions) const;
};

/**
 * Finds all 0 based positions of pattern in sequence by direct comparison.
 *
 * Same contract as PatternMatcher::find, used to cross check the suffix tree.
 */
bool naive_find(const std::string& sequence, const std::string& pattern, std::vector<uint32_t>& positions, STError& error);

#endif
