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

#include "gtest/gtest.h"
#include "node_arena.h"

TEST(NodeArenaTest, CreatesNodesWithStableIds)
{
    NodeArena nodes;
    uint32_t root, leaf, internal;

    ASSERT_TRUE(nodes.create(0, 0, root));
    ASSERT_TRUE(nodes.create(3, OPEN_END, leaf));
    ASSERT_TRUE(nodes.create(1, 4, internal));

    EXPECT_EQ((uint32_t)ROOT_ID, root);
    EXPECT_EQ(1u, leaf);
    EXPECT_EQ(2u, internal);
    EXPECT_EQ(3u, nodes.size());

    EXPECT_TRUE(nodes[leaf].is_leaf());
    EXPECT_FALSE(nodes[internal].is_leaf());
    EXPECT_EQ(3u, nodes[leaf].start);
}

TEST(NodeArenaTest, ChildrenAreAbsentUntilSet)
{
    NodeArena nodes;
    uint32_t root, child;
    ASSERT_TRUE(nodes.create(0, 0, root));
    ASSERT_TRUE(nodes.create(0, OPEN_END, child));

    for (int32_t b=0; b<NO_SYMBOLS; ++b)
    {
        EXPECT_EQ(NIL, nodes.child(root, b));
    }

    nodes.set_child(root, BASE_G, child);
    EXPECT_EQ(child, nodes.child(root, BASE_G));
    EXPECT_EQ(NIL, nodes.child(root, BASE_C));

    nodes.set_child(root, TERMINATOR, child);
    EXPECT_EQ(child, nodes.child(root, TERMINATOR));
}

TEST(NodeArenaTest, EdgeLengthIsHalfOpen)
{
    NodeArena nodes;
    uint32_t leaf, internal;
    ASSERT_TRUE(nodes.create(2, OPEN_END, leaf));
    ASSERT_TRUE(nodes.create(5, 9, internal));

    //open edges follow the leaf end
    EXPECT_EQ(1u, nodes.edge_length(leaf, 3));
    EXPECT_EQ(8u, nodes.edge_length(leaf, 10));

    //fixed edges do not
    EXPECT_EQ(4u, nodes.edge_length(internal, 3));
    EXPECT_EQ(4u, nodes.edge_length(internal, 100));
}

TEST(NodeArenaTest, SuffixLinkDefaultsToRoot)
{
    NodeArena nodes;
    uint32_t root, a, b;
    ASSERT_TRUE(nodes.create(0, 0, root));
    ASSERT_TRUE(nodes.create(0, 2, a));
    ASSERT_TRUE(nodes.create(1, 2, b));

    EXPECT_EQ((uint32_t)ROOT_ID, nodes.suffix_link(a));
    nodes.set_suffix_link(a, b);
    EXPECT_EQ(b, nodes.suffix_link(a));
    EXPECT_EQ((uint32_t)ROOT_ID, nodes.suffix_link(b));
}

TEST(NodeArenaTest, RefusesNodesBeyondLimit)
{
    NodeArena nodes(2);
    uint32_t id;

    EXPECT_TRUE(nodes.create(0, 0, id));
    EXPECT_TRUE(nodes.create(0, OPEN_END, id));
    EXPECT_FALSE(nodes.create(1, OPEN_END, id));
    EXPECT_EQ(NIL, id);
    EXPECT_EQ(2u, nodes.size());

    nodes.set_max_nodes(0);
    EXPECT_TRUE(nodes.create(1, OPEN_END, id));
    EXPECT_EQ(2u, id);
}

TEST(NodeArenaTest, ClearDropsAllNodes)
{
    NodeArena nodes;
    uint32_t id;
    nodes.reserve(16);
    ASSERT_TRUE(nodes.create(0, 0, id));
    ASSERT_TRUE(nodes.create(0, OPEN_END, id));

    nodes.clear();
    EXPECT_EQ(0u, nodes.size());
    ASSERT_TRUE(nodes.create(0, 0, id));
    EXPECT_EQ((uint32_t)ROOT_ID, id);
}
