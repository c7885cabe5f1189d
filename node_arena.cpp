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

#include "node_arena.h"

/**
 * Constructs a SuffixTreeNode with edge [start, end).
 */
SuffixTreeNode::SuffixTreeNode(uint32_t start, uint32_t end)
{
    for (int32_t b=0; b<NO_SYMBOLS; ++b)
    {
        children[b] = NIL;
    }
    this->start = start;
    this->end = end;
    suffix_link = ROOT_ID;
};

/**
 * Constructor.
 */
NodeArena::NodeArena(uint32_t max_nodes)
{
    this->max_nodes = max_nodes;
};

/**
 * Creates a node with edge [start, end), end may be OPEN_END.
 */
bool NodeArena::create(uint32_t start, uint32_t end, uint32_t& id)
{
    if ((max_nodes && nodes.size()>=max_nodes) || nodes.size()>=NIL)
    {
        id = NIL;
        return false;
    }

    id = (uint32_t)nodes.size();
    nodes.push_back(SuffixTreeNode(start, end));

    return true;
};

/**
 * Reserves space for n nodes, capped by the node limit.
 */
void NodeArena::reserve(uint32_t n)
{
    if (max_nodes && n>max_nodes)
    {
        n = max_nodes;
    }
    nodes.reserve(n);
};

/**
 * Drops all nodes.
 */
void NodeArena::clear()
{
    std::vector<SuffixTreeNode>().swap(nodes);
};
