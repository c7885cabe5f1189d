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

#ifndef SUFFIX_TREE_H
#define SUFFIX_TREE_H

#include <cstdint>
#include <vector>
#include <string>
#include <iostream>
#include <functional>
#include <cstdio>
#include "dna_alphabet.h"
#include "sequence_buffer.h"
#include "node_arena.h"
#include "st_error.h"

/**
 * Called after every phase with the position just consumed.
 * Returning false cancels the construction.
 */
typedef std::function<bool(uint32_t)> BuildCheckpoint;

/**
 * Where the next suffix insertion resumes.
 *
 * The active edge is a sequence offset, the symbol there selects
 * the outgoing edge of the active node.
 */
class ActivePoint
{
    public:
    uint32_t node;
    uint32_t edge;
    uint32_t length;

    /**
     * Constructor.
     */
    ActivePoint() { clear(); };

    /**
     * Resets to the root.
     */
    void clear() { node = ROOT_ID; edge = 0; length = 0; };
};

/**
 * Suffix tree over a DNA sequence built with Ukkonen's algorithm.
 *
 * The tree is read only once build() returns successfully and may
 * then be shared by concurrent readers.
 */
class SuffixTree
{
    public:

    /**
     * Constructor.
     *
     * @max_nodes - maximum number of nodes, 0 for no limit.
     */
    SuffixTree(uint32_t max_nodes=0);

    /**
     * Constructs the suffix tree of sequence.
     *
     * On failure the tree is left empty and unbuilt.
     */
    bool build(const char* sequence, size_t len, STError& error, const BuildCheckpoint& checkpoint=BuildCheckpoint());

    /**
     * Constructs the suffix tree of sequence.
     */
    bool build(const std::string& sequence, STError& error, const BuildCheckpoint& checkpoint=BuildCheckpoint());

    /**
     * Drops the tree.
     */
    void clear();

    /**
     * Returns true if the tree is completely constructed.
     */
    bool is_built() const { return built; };

    /**
     * Gets the sequence buffer.
     */
    const SequenceBuffer& get_sequence() const { return sequence; };

    /**
     * Gets the nodes.
     */
    const NodeArena& get_nodes() const { return nodes; };

    /**
     * Gets the end of all open edges.
     */
    uint32_t get_leaf_end() const { return leaf_end; };

    /**
     * Length of the edge into node id.
     */
    uint32_t edge_length(uint32_t id) const { return nodes.edge_length(id, leaf_end); };

    /**
     * Returns the number of nodes, root included.
     */
    uint32_t get_no_nodes() const { return nodes.size(); };

    /**
     * Returns the number of leaves.
     */
    uint32_t get_no_leaves() const;

    /**
     * Returns the number of internal nodes, root excluded.
     */
    uint32_t get_no_internal_nodes() const;

    /**
     * Sets the node limit, 0 for no limit. Applies to the next build.
     */
    void set_max_nodes(uint32_t max_nodes) { nodes.set_max_nodes(max_nodes); };

    /**
     * Set debug.
     */
    void set_debug(int32_t debug) { this->debug = debug; };

    /**
     * Print construction state.
     */
    void print_state(uint32_t pos) const;

    /**
     * Print this tree.
     */
    void print() const;

    private:
    SequenceBuffer sequence;
    NodeArena nodes;

    //construction state
    ActivePoint active;
    uint32_t remaining;
    uint32_t leaf_end;
    uint32_t pending;

    bool built;
    int32_t debug;

    /**
     * Extends the tree with the symbol at pos.
     * Returns false if the node limit is reached.
     */
    bool extend(uint32_t pos);

    /**
     * Moves the active point to node if the active length spans its edge.
     */
    bool walk_down(uint32_t node);

    /**
     * Links the pending internal node to target.
     */
    void link_pending(uint32_t target);
};

#endif
