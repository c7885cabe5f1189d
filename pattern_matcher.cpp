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

#include "pattern_matcher.h"

/**
 * Constructor.
 */
PatternMatcher::PatternMatcher(const SuffixTree& tree) : tree(tree)
{
};

/**
 * Finds all 0 based positions of pattern in the sequence, in ascending order.
 */
bool PatternMatcher::find(const std::string& pattern, std::vector<uint32_t>& positions, STError& error) const
{
    positions.clear();

    if (!tree.is_built())
    {
        error.set(ST_TREE_NOT_BUILT);
        return false;
    }

    std::vector<uint8_t> p;
    if (!encode_sequence(pattern.c_str(), pattern.size(), p, error))
    {
        return false;
    }

    if (p.size()>tree.get_sequence().length())
    {
        error.clear();
        return true;
    }

    uint32_t node = ROOT_ID;
    uint32_t depth = 0;
    if (locate(p, node, depth))
    {
        collect_leaves(node, depth, positions);
        std::sort(positions.begin(), positions.end());
    }

    error.clear();
    return true;
};

/**
 * Counts the occurrences of pattern.
 */
bool PatternMatcher::count(const std::string& pattern, uint32_t& no, STError& error) const
{
    std::vector<uint32_t> positions;
    no = 0;
    if (!find(pattern, positions, error))
    {
        return false;
    }
    no = (uint32_t)positions.size();

    return true;
};

/**
 * Descends along pattern from the root.
 */
bool PatternMatcher::locate(const std::vector<uint8_t>& pattern, uint32_t& node, uint32_t& depth) const
{
    const NodeArena& nodes = tree.get_nodes();
    const SequenceBuffer& seq = tree.get_sequence();

    node = ROOT_ID;
    depth = 0;
    size_t i = 0;
    while (i<pattern.size())
    {
        uint32_t next = nodes.child(node, pattern[i]);
        if (next==NIL)
        {
            return false;
        }

        uint32_t start = nodes[next].start;
        uint32_t len = tree.edge_length(next);
        for (uint32_t j=0; j<len && i<pattern.size(); ++j, ++i)
        {
            if (seq[start+j]!=pattern[i])
            {
                return false;
            }
        }

        //pattern may end inside this edge, the subtree below is the same
        node = next;
        depth += len;
    }

    return true;
};

/**
 * Collects the suffix positions of all leaves below node.
 *
 * A leaf at string depth d spells the suffix starting at (n+1)-d,
 * the suffix made of the terminator alone is skipped.
 */
void PatternMatcher::collect_leaves(uint32_t node, uint32_t depth, std::vector<uint32_t>& positions) const
{
    const NodeArena& nodes = tree.get_nodes();
    uint32_t n = tree.get_sequence().length();

    std::vector<std::pair<uint32_t, uint32_t> > s;
    s.push_back(std::make_pair(node, depth));
    while (!s.empty())
    {
        uint32_t id = s.back().first;
        uint32_t d = s.back().second;
        s.pop_back();

        if (nodes[id].is_leaf())
        {
            uint32_t pos = n + 1 - d;
            if (pos<n)
            {
                positions.push_back(pos);
            }
            continue;
        }

        for (int32_t b=NO_SYMBOLS-1; b>=0; --b)
        {
            uint32_t child = nodes.child(id, b);
            if (child!=NIL)
            {
                s.push_back(std::make_pair(child, d+tree.edge_length(child)));
            }
        }
    }
};

/**
 * Finds all 0 based positions of pattern in sequence by direct comparison.
 */
bool naive_find(const std::string& sequence, const std::string& pattern, std::vector<uint32_t>& positions, STError& error)
{
    positions.clear();

    std::vector<uint8_t> p;
    if (!encode_sequence(pattern.c_str(), pattern.size(), p, error))
    {
        return false;
    }

    std::vector<uint8_t> s;
    if (!encode_sequence(sequence.c_str(), sequence.size(), s, error))
    {
        return false;
    }

    size_t n = s.size();
    size_t m = p.size();
    for (size_t i=0; i+m<=n; ++i)
    {
        if (m==0 && i==n) break;

        size_t j = 0;
        while (j<m && s[i+j]==p[j]) ++j;
        if (j==m)
        {
            positions.push_back((uint32_t)i);
        }
    }

    error.clear();
    return true;
};
