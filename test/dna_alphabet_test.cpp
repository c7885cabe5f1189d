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
#include "dna_alphabet.h"
#include "sequence_buffer.h"
#include "st_error.h"

TEST(DNAAlphabetTest, EncodesBases)
{
    EXPECT_EQ(BASE_A, base2index('A'));
    EXPECT_EQ(BASE_C, base2index('C'));
    EXPECT_EQ(BASE_G, base2index('G'));
    EXPECT_EQ(BASE_T, base2index('T'));
}

TEST(DNAAlphabetTest, RejectsEverythingElse)
{
    EXPECT_EQ(INVALID_BASE, base2index('a'));
    EXPECT_EQ(INVALID_BASE, base2index('t'));
    EXPECT_EQ(INVALID_BASE, base2index('N'));
    EXPECT_EQ(INVALID_BASE, base2index('U'));
    EXPECT_EQ(INVALID_BASE, base2index('$'));
    EXPECT_EQ(INVALID_BASE, base2index('\0'));
}

TEST(DNAAlphabetTest, DecodesIndices)
{
    for (int32_t b=BASE_A; b<=BASE_T; ++b)
    {
        EXPECT_EQ(b, base2index(index2base(b)));
    }
    EXPECT_EQ('$', index2base(TERMINATOR));
    EXPECT_EQ('N', index2base(7));
    EXPECT_EQ('N', index2base(-1));
}

TEST(DNAAlphabetTest, EncodeSequenceStopsAtFirstInvalidSymbol)
{
    std::vector<uint8_t> encoded;
    STError error;

    ASSERT_TRUE(encode_sequence("GATTACA", 7, encoded, error));
    EXPECT_TRUE(error.ok());
    ASSERT_EQ(7u, encoded.size());
    EXPECT_EQ(BASE_G, encoded[0]);
    EXPECT_EQ(BASE_A, encoded[6]);

    EXPECT_FALSE(encode_sequence("ACgTN", 5, encoded, error));
    EXPECT_EQ(ST_INVALID_SYMBOL, error.code);
    EXPECT_EQ(2u, error.pos);
    EXPECT_EQ('g', error.symbol);
    EXPECT_TRUE(encoded.empty());
}

TEST(SequenceBufferTest, AppendsTerminator)
{
    SequenceBuffer buffer;
    STError error;

    ASSERT_TRUE(buffer.set_sequence(std::string("ACGT"), error));
    EXPECT_EQ(4u, buffer.length());
    EXPECT_EQ(5u, buffer.size());
    EXPECT_EQ(BASE_C, buffer[1]);
    EXPECT_EQ(TERMINATOR, buffer[4]);
    EXPECT_EQ("ACGT$", buffer.decode(0, buffer.size()));
    EXPECT_EQ("GT", buffer.decode(2, 4));
}

TEST(SequenceBufferTest, EmptySequenceHoldsOnlyTerminator)
{
    SequenceBuffer buffer;
    STError error;

    ASSERT_TRUE(buffer.set_sequence(std::string(""), error));
    EXPECT_EQ(0u, buffer.length());
    EXPECT_EQ(1u, buffer.size());
    EXPECT_EQ(TERMINATOR, buffer[0]);
}

TEST(SequenceBufferTest, FailedSetLeavesBufferUnchanged)
{
    SequenceBuffer buffer;
    STError error;

    ASSERT_TRUE(buffer.set_sequence(std::string("AC"), error));
    EXPECT_FALSE(buffer.set_sequence(std::string("ACGX"), error));
    EXPECT_EQ(ST_INVALID_SYMBOL, error.code);
    EXPECT_EQ(3u, error.pos);
    EXPECT_EQ("AC$", buffer.decode(0, buffer.size()));
}

TEST(SequenceBufferTest, RejectsOverlongSequence)
{
    SequenceBuffer buffer;
    STError error;

    //the length is checked before any character is read
    EXPECT_FALSE(buffer.set_sequence("A", (size_t)MAX_SEQUENCE_LENGTH+1, error));
    EXPECT_EQ(ST_RESOURCE_EXHAUSTED, error.code);
    EXPECT_EQ(0u, buffer.length());
}

TEST(STErrorTest, DescribesInvalidSymbol)
{
    STError error;
    EXPECT_TRUE(error.ok());
    EXPECT_EQ("ok", error.to_string());

    error.set(ST_INVALID_SYMBOL, 3, 'X');
    EXPECT_FALSE(error.ok());
    EXPECT_EQ("invalid symbol: 'X' at index 3", error.to_string());

    error.set(ST_INVALID_SYMBOL, 0, '\n');
    EXPECT_EQ("invalid symbol: '\\xa' at index 0", error.to_string());

    error.set(ST_RESOURCE_EXHAUSTED, 12);
    EXPECT_EQ("resource exhausted at position 12", error.to_string());

    error.clear();
    EXPECT_TRUE(error.ok());
    EXPECT_STREQ("tree not built", st_error2string(ST_TREE_NOT_BUILT));
}
