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

#ifndef NODE_ARENA_H
#define NODE_ARENA_H

#include <cstdint>
#include <vector>
#include "dna_alphabet.h"

#define ROOT_ID 0
#define NIL 0xFFFFFFFFU

//edge end of a leaf, reads the tree wide leaf end instead
#define OPEN_END 0xFFFFFFFFU

/**
 * A node of the suffix tree and the edge leading into it.
 *
 * The edge label is [start, end) of the sequence buffer.
 */
class SuffixTreeNode
{
    public:
    uint32_t children[NO_SYMBOLS];
    uint32_t start;
    uint32_t end;
    uint32_t suffix_link;

    /**
     * Constructs a SuffixTreeNode with edge [start, end).
     */
    SuffixTreeNode(uint32_t start, uint32_t end);

    /**
     * Returns true if the edge end is open.
     */
    bool is_leaf() const { return end==OPEN_END; };
};

/**
 * Owns all nodes of a suffix tree, addressed by stable ids.
 *
 * Nodes are never freed individually.
 */
class NodeArena
{
    public:

    /**
     * Constructor.
     *
     * @max_nodes - maximum number of nodes, 0 for no limit.
     */
    NodeArena(uint32_t max_nodes=0);

    /**
     * Creates a node with edge [start, end), end may be OPEN_END.
     * Returns false if the node limit is reached.
     */
    bool create(uint32_t start, uint32_t end, uint32_t& id);

    /**
     * Gets the child of id for symbol, NIL if absent.
     */
    uint32_t child(uint32_t id, int32_t symbol) const { return nodes[id].children[symbol]; };

    /**
     * Sets the child of id for symbol.
     */
    void set_child(uint32_t id, int32_t symbol, uint32_t child_id) { nodes[id].children[symbol] = child_id; };

    /**
     * Length of the edge into id given the current leaf end.
     */
    uint32_t edge_length(uint32_t id, uint32_t leaf_end) const
    {
        const SuffixTreeNode& node = nodes[id];
        return (node.is_leaf() ? leaf_end : node.end) - node.start;
    };

    /**
     * Gets the suffix link of id, the root if it was never set.
     */
    uint32_t suffix_link(uint32_t id) const { return nodes[id].suffix_link; };

    /**
     * Sets the suffix link of id.
     */
    void set_suffix_link(uint32_t id, uint32_t target) { nodes[id].suffix_link = target; };

    /**
     * Overloads subscript operator for accessing nodes.
     */
    SuffixTreeNode& operator[] (uint32_t id) { return nodes[id]; };
    const SuffixTreeNode& operator[] (uint32_t id) const { return nodes[id]; };

    /**
     * Reserves space for n nodes, capped by the node limit.
     */
    void reserve(uint32_t n);

    /**
     * Drops all nodes.
     */
    void clear();

    /**
     * Returns the number of nodes.
     */
    uint32_t size() const { return (uint32_t)nodes.size(); };

    /**
     * Returns the node limit, 0 if unlimited.
     */
    uint32_t get_max_nodes() const { return max_nodes; };

    /**
     * Sets the node limit, 0 for no limit.
     */
    void set_max_nodes(uint32_t max_nodes) { this->max_nodes = max_nodes; };

    private:
    std::vector<SuffixTreeNode> nodes;
    uint32_t max_nodes;
};

#endif
