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

#include "suffix_tree.h"

/**
 * Constructor.
 */
SuffixTree::SuffixTree(uint32_t max_nodes) : nodes(max_nodes)
{
    debug = 0;
    clear();
};

/**
 * Constructs the suffix tree of sequence.
 *
 * One phase per position of the sequence, terminator included.
 */
bool SuffixTree::build(const char* seq, size_t len, STError& error, const BuildCheckpoint& checkpoint)
{
    clear();

    if (!sequence.set_sequence(seq, len, error))
    {
        clear();
        return false;
    }

    uint32_t n = sequence.size();

    //at most n leaves and n-1 internal nodes besides the root
    nodes.reserve(2*n);

    uint32_t root;
    if (!nodes.create(0, 0, root))
    {
        error.set(ST_RESOURCE_EXHAUSTED, 0);
        clear();
        return false;
    }

    for (uint32_t pos=0; pos<n; ++pos)
    {
        if (!extend(pos))
        {
            if (debug)
            {
                fprintf(stderr, "[W:%s:%d %s] node limit %u reached at position %u\n", __FILE__, __LINE__, __FUNCTION__, nodes.get_max_nodes(), pos);
            }
            error.set(ST_RESOURCE_EXHAUSTED, pos);
            clear();
            return false;
        }

        if (debug) print_state(pos);

        if (checkpoint && !checkpoint(pos))
        {
            error.set(ST_CANCELLED, pos);
            clear();
            return false;
        }
    }

    built = true;
    error.clear();
    return true;
};

/**
 * Constructs the suffix tree of sequence.
 */
bool SuffixTree::build(const std::string& seq, STError& error, const BuildCheckpoint& checkpoint)
{
    return build(seq.c_str(), seq.size(), error, checkpoint);
};

/**
 * Drops the tree.
 */
void SuffixTree::clear()
{
    sequence.clear();
    nodes.clear();
    active.clear();
    remaining = 0;
    leaf_end = 0;
    pending = NIL;
    built = false;
};

/**
 * Extends the tree with the symbol at pos.
 *
 * rule 1 - open leaves grow through leaf_end
 * rule 2 - new leaf, at a node or after splitting an edge
 * rule 3 - symbol already present, ends the phase
 */
bool SuffixTree::extend(uint32_t pos)
{
    leaf_end = pos + 1;
    ++remaining;
    pending = NIL;

    uint8_t b = sequence[pos];

    while (remaining)
    {
        if (active.length==0)
        {
            active.edge = pos;
        }

        uint8_t e = sequence[active.edge];
        uint32_t next = nodes.child(active.node, e);

        if (next==NIL)
        {
            uint32_t leaf;
            if (!nodes.create(pos, OPEN_END, leaf)) return false;
            nodes.set_child(active.node, e, leaf);

            if (pending!=NIL)
            {
                link_pending(active.node);
                pending = NIL;
            }
        }
        else
        {
            if (walk_down(next)) continue;

            uint32_t start = nodes[next].start;
            if (sequence[start+active.length]==b)
            {
                ++active.length;
                if (pending!=NIL)
                {
                    link_pending(active.node);
                }
                break;
            }

            //    active.node          active.node
            //        |                    |
            //        |        ==>       split
            //        |                  |   |
            //      next               next  leaf
            uint32_t split;
            if (!nodes.create(start, start+active.length, split)) return false;
            nodes.set_child(active.node, e, split);

            uint32_t leaf;
            if (!nodes.create(pos, OPEN_END, leaf)) return false;
            nodes.set_child(split, b, leaf);

            nodes[next].start += active.length;
            nodes.set_child(split, sequence[nodes[next].start], next);

            if (pending!=NIL)
            {
                link_pending(split);
            }
            pending = split;
        }

        --remaining;

        if (active.node==ROOT_ID && active.length)
        {
            --active.length;
            active.edge = pos - remaining + 1;
        }
        else if (active.node!=ROOT_ID)
        {
            active.node = nodes.suffix_link(active.node);
        }
    }

    return true;
};

/**
 * Moves the active point to node if the active length spans its edge.
 */
bool SuffixTree::walk_down(uint32_t node)
{
    uint32_t len = edge_length(node);
    if (active.length>=len)
    {
        active.edge += len;
        active.length -= len;
        active.node = node;
        return true;
    }

    return false;
};

/**
 * Links the pending internal node to target.
 */
void SuffixTree::link_pending(uint32_t target)
{
    nodes.set_suffix_link(pending, target);
};

/**
 * Returns the number of leaves.
 */
uint32_t SuffixTree::get_no_leaves() const
{
    uint32_t no_leaves = 0;
    for (uint32_t i=0; i<nodes.size(); ++i)
    {
        if (nodes[i].is_leaf()) ++no_leaves;
    }

    return no_leaves;
};

/**
 * Returns the number of internal nodes, root excluded.
 */
uint32_t SuffixTree::get_no_internal_nodes() const
{
    if (nodes.size()==0) return 0;
    return nodes.size() - get_no_leaves() - 1;
};

/**
 * Print construction state.
 */
void SuffixTree::print_state(uint32_t pos) const
{
    std::clog << "phase " << pos << " (" << index2base(sequence[pos]) << ")\n";
    std::clog << "  active node   : " << active.node << "\n";
    std::clog << "  active edge   : " << active.edge << " (" << index2base(sequence[active.edge]) << ")\n";
    std::clog << "  active length : " << active.length << "\n";
    std::clog << "  remaining     : " << remaining << "\n";
    std::clog << "  nodes         : " << nodes.size() << "\n";
};

/**
 * Print this tree.
 */
void SuffixTree::print() const
{
    if (nodes.size()==0)
    {
        std::clog << "empty tree\n";
        return;
    }

    //node and depth in the tree
    std::vector<std::pair<uint32_t, uint32_t> > s;
    s.push_back(std::make_pair((uint32_t)ROOT_ID, (uint32_t)0));
    while (!s.empty())
    {
        uint32_t id = s.back().first;
        uint32_t depth = s.back().second;
        s.pop_back();

        const SuffixTreeNode& node = nodes[id];
        std::clog << std::string(depth*2, ' ');
        if (id==ROOT_ID)
        {
            std::clog << "root\n";
        }
        else
        {
            uint32_t end = node.start + edge_length(id);
            std::clog << sequence.decode(node.start, end)
                      << " [" << node.start << "," << end << ")"
                      << " #" << id;
            if (!node.is_leaf())
            {
                std::clog << " -> #" << node.suffix_link;
            }
            std::clog << "\n";
        }

        for (int32_t b=NO_SYMBOLS-1; b>=0; --b)
        {
            if (node.children[b]!=NIL)
            {
                s.push_back(std::make_pair(node.children[b], depth+1));
            }
        }
    }
};
