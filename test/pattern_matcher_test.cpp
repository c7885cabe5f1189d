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

#include <algorithm>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include "gtest/gtest.h"
#include "pattern_matcher.h"

namespace
{

std::vector<uint32_t> positions_of(const std::string& sequence, const std::string& pattern)
{
    SuffixTree tree;
    STError error;
    EXPECT_TRUE(tree.build(sequence, error));

    PatternMatcher matcher(tree);
    std::vector<uint32_t> positions;
    EXPECT_TRUE(matcher.find(pattern, positions, error));
    EXPECT_TRUE(error.ok());
    return positions;
}

std::vector<uint32_t> make_positions(uint32_t n, const uint32_t* p)
{
    return std::vector<uint32_t>(p, p+n);
}

std::string random_dna(std::mt19937& rng, uint32_t len, int32_t no_bases=4)
{
    std::uniform_int_distribution<int32_t> base(0, no_bases-1);
    std::string s(len, 'A');
    for (uint32_t i=0; i<len; ++i)
    {
        s[i] = index2base(base(rng));
    }
    return s;
}

/**
 * Every string over ACGT of length len.
 */
void all_dna(uint32_t len, std::vector<std::string>& strings)
{
    strings.clear();
    strings.push_back("");
    for (uint32_t i=0; i<len; ++i)
    {
        std::vector<std::string> longer;
        for (size_t j=0; j<strings.size(); ++j)
        {
            for (int32_t b=BASE_A; b<=BASE_T; ++b)
            {
                longer.push_back(strings[j] + index2base(b));
            }
        }
        strings.swap(longer);
    }
}

}

TEST(PatternMatcherTest, FindsRepeatedPattern)
{
    const uint32_t expected[] = {0, 4};
    EXPECT_EQ(make_positions(2, expected), positions_of("ACGTACGT", "ACGT"));
}

TEST(PatternMatcherTest, FindsOverlappingOccurrences)
{
    const uint32_t expected[] = {0, 1, 2};
    EXPECT_EQ(make_positions(3, expected), positions_of("AAAA", "AA"));
}

TEST(PatternMatcherTest, MissingPatternGivesNothing)
{
    EXPECT_TRUE(positions_of("ACGT", "TG").empty());
    EXPECT_TRUE(positions_of("ACGT", "ACGA").empty());
    EXPECT_TRUE(positions_of("AAAA", "C").empty());
}

TEST(PatternMatcherTest, PatternEndingInsideEdge)
{
    //the match ends halfway along the edge into a leaf
    const uint32_t expected[] = {1};
    EXPECT_EQ(make_positions(1, expected), positions_of("GATTACA", "ATT"));

    const uint32_t expected2[] = {1, 4, 6};
    EXPECT_EQ(make_positions(3, expected2), positions_of("GATTACA", "A"));
}

TEST(PatternMatcherTest, WholeSequenceMatchesOnlyAtStart)
{
    const uint32_t expected[] = {0};
    EXPECT_EQ(make_positions(1, expected), positions_of("GATTACA", "GATTACA"));
    EXPECT_EQ(make_positions(1, expected), positions_of("AAAA", "AAAA"));
    EXPECT_EQ(make_positions(1, expected), positions_of("C", "C"));
}

TEST(PatternMatcherTest, PatternLongerThanSequenceGivesNothing)
{
    EXPECT_TRUE(positions_of("ACGT", "ACGTA").empty());
    EXPECT_TRUE(positions_of("", "A").empty());
    EXPECT_TRUE(positions_of("A", "AA").empty());
}

TEST(PatternMatcherTest, EmptyPatternMatchesEveryPosition)
{
    const uint32_t expected[] = {0, 1, 2, 3, 4, 5, 6};
    EXPECT_EQ(make_positions(7, expected), positions_of("GATTACA", ""));
    EXPECT_TRUE(positions_of("", "").empty());
}

TEST(PatternMatcherTest, RejectsInvalidPattern)
{
    SuffixTree tree;
    STError error;
    ASSERT_TRUE(tree.build("ACGTACGT", error));

    PatternMatcher matcher(tree);
    std::vector<uint32_t> positions(3, 9);

    EXPECT_FALSE(matcher.find("ACGN", positions, error));
    EXPECT_EQ(ST_INVALID_SYMBOL, error.code);
    EXPECT_EQ(3u, error.pos);
    EXPECT_EQ('N', error.symbol);
    EXPECT_TRUE(positions.empty());

    //rejected even though the prefix already mismatches
    EXPECT_FALSE(matcher.find("TTTTTTTTTTTTx", positions, error));
    EXPECT_EQ(ST_INVALID_SYMBOL, error.code);
    EXPECT_EQ(12u, error.pos);

    EXPECT_FALSE(matcher.find("acgt", positions, error));
    EXPECT_EQ(0u, error.pos);

    uint32_t no = 7;
    EXPECT_FALSE(matcher.count("$", no, error));
    EXPECT_EQ(0u, no);
}

TEST(PatternMatcherTest, RequiresConstructedTree)
{
    SuffixTree tree;
    STError error;
    PatternMatcher matcher(tree);
    std::vector<uint32_t> positions;

    EXPECT_FALSE(matcher.find("A", positions, error));
    EXPECT_EQ(ST_TREE_NOT_BUILT, error.code);

    EXPECT_FALSE(tree.build("ACGX", error));
    EXPECT_FALSE(matcher.find("A", positions, error));
    EXPECT_EQ(ST_TREE_NOT_BUILT, error.code);
}

TEST(PatternMatcherTest, CountsOccurrences)
{
    SuffixTree tree;
    STError error;
    ASSERT_TRUE(tree.build("CAGCAGCAGTT", error));

    PatternMatcher matcher(tree);
    uint32_t no = 0;
    ASSERT_TRUE(matcher.count("CAG", no, error));
    EXPECT_EQ(3u, no);
    ASSERT_TRUE(matcher.count("AGT", no, error));
    EXPECT_EQ(1u, no);
    ASSERT_TRUE(matcher.count("GG", no, error));
    EXPECT_EQ(0u, no);
}

TEST(PatternMatcherTest, EverySubstringIsFoundWhereItWasTaken)
{
    std::mt19937 rng(11);
    std::string sequence = random_dna(rng, 300, 3);

    SuffixTree tree;
    STError error;
    ASSERT_TRUE(tree.build(sequence, error));
    PatternMatcher matcher(tree);

    std::vector<uint32_t> positions;
    for (uint32_t i=0; i<sequence.size(); ++i)
    {
        for (uint32_t len=1; len<=12 && i+len<=sequence.size(); ++len)
        {
            ASSERT_TRUE(matcher.find(sequence.substr(i, len), positions, error));
            EXPECT_TRUE(std::binary_search(positions.begin(), positions.end(), i))
                << sequence.substr(i, len) << " not found at " << i;
        }
    }
}

TEST(PatternMatcherTest, AgreesWithNaiveScanOnAllShortSequences)
{
    std::vector<std::string> patterns;
    for (uint32_t len=0; len<=3; ++len)
    {
        std::vector<std::string> v;
        all_dna(len, v);
        patterns.insert(patterns.end(), v.begin(), v.end());
    }

    std::vector<uint32_t> positions, expected;
    STError error;
    for (uint32_t len=0; len<=5; ++len)
    {
        std::vector<std::string> sequences;
        all_dna(len, sequences);
        for (size_t i=0; i<sequences.size(); ++i)
        {
            SuffixTree tree;
            ASSERT_TRUE(tree.build(sequences[i], error));
            PatternMatcher matcher(tree);

            for (size_t j=0; j<patterns.size(); ++j)
            {
                ASSERT_TRUE(matcher.find(patterns[j], positions, error));
                ASSERT_TRUE(naive_find(sequences[i], patterns[j], expected, error));
                ASSERT_EQ(expected, positions) << sequences[i] << " / " << patterns[j];
            }
        }
    }
}

TEST(PatternMatcherTest, AgreesWithNaiveScanOnRandomSequences)
{
    std::mt19937 rng(2013);
    std::vector<uint32_t> positions, expected;
    STError error;

    for (uint32_t i=0; i<60; ++i)
    {
        int32_t no_bases = 1 + i%4;
        std::string sequence = random_dna(rng, rng()%2000, no_bases);

        SuffixTree tree;
        ASSERT_TRUE(tree.build(sequence, error));
        PatternMatcher matcher(tree);

        for (uint32_t j=0; j<50; ++j)
        {
            std::string pattern;
            if (j%2 && sequence.size())
            {
                uint32_t pos = rng()%sequence.size();
                pattern = sequence.substr(pos, 1 + rng()%20);
            }
            else
            {
                pattern = random_dna(rng, 1 + rng()%8, no_bases);
            }

            ASSERT_TRUE(matcher.find(pattern, positions, error));
            ASSERT_TRUE(naive_find(sequence, pattern, expected, error));
            ASSERT_EQ(expected, positions) << pattern;
        }
    }
}

TEST(PatternMatcherTest, RebuildGivesSameMatches)
{
    std::mt19937 rng(5);
    std::string sequence = random_dna(rng, 1000);

    SuffixTree a, b;
    STError error;
    ASSERT_TRUE(a.build(sequence, error));
    ASSERT_TRUE(b.build(sequence, error));
    PatternMatcher ma(a), mb(b);

    std::vector<uint32_t> pa, pb;
    for (uint32_t i=0; i<100; ++i)
    {
        std::string pattern = random_dna(rng, 1 + i%6);
        ASSERT_TRUE(ma.find(pattern, pa, error));
        ASSERT_TRUE(mb.find(pattern, pb, error));
        EXPECT_EQ(pa, pb);
    }
}

TEST(PatternMatcherTest, ConcurrentReadersAgree)
{
    std::mt19937 rng(99);
    std::string sequence = random_dna(rng, 5000);
    std::vector<std::string> patterns;
    for (uint32_t i=0; i<200; ++i)
    {
        patterns.push_back(random_dna(rng, 1 + i%7));
    }

    SuffixTree tree;
    STError error;
    ASSERT_TRUE(tree.build(sequence, error));
    const PatternMatcher matcher(tree);

    std::vector<std::vector<uint32_t> > expected(patterns.size());
    for (size_t i=0; i<patterns.size(); ++i)
    {
        ASSERT_TRUE(naive_find(sequence, patterns[i], expected[i], error));
    }

    const uint32_t no_threads = 4;
    std::vector<uint32_t> no_mismatches(no_threads, 0);
    std::vector<std::thread> threads;
    for (uint32_t t=0; t<no_threads; ++t)
    {
        threads.push_back(std::thread([&, t]()
        {
            std::vector<uint32_t> positions;
            STError e;
            for (size_t i=0; i<patterns.size(); ++i)
            {
                if (!matcher.find(patterns[i], positions, e) || positions!=expected[i])
                {
                    ++no_mismatches[t];
                }
            }
        }));
    }
    for (size_t t=0; t<threads.size(); ++t)
    {
        threads[t].join();
    }

    for (uint32_t t=0; t<no_threads; ++t)
    {
        EXPECT_EQ(0u, no_mismatches[t]);
    }
}

TEST(NaiveFindTest, FollowsMatcherContract)
{
    std::vector<uint32_t> positions;
    STError error;

    ASSERT_TRUE(naive_find("AAAA", "AA", positions, error));
    const uint32_t expected[] = {0, 1, 2};
    EXPECT_EQ(make_positions(3, expected), positions);

    ASSERT_TRUE(naive_find("ACG", "", positions, error));
    const uint32_t all[] = {0, 1, 2};
    EXPECT_EQ(make_positions(3, all), positions);

    ASSERT_TRUE(naive_find("ACG", "ACGT", positions, error));
    EXPECT_TRUE(positions.empty());

    EXPECT_FALSE(naive_find("ACG", "AXG", positions, error));
    EXPECT_EQ(ST_INVALID_SYMBOL, error.code);
    EXPECT_EQ(1u, error.pos);

    EXPECT_FALSE(naive_find("ACGX", "A", positions, error));
    EXPECT_EQ(3u, error.pos);
}
