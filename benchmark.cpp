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

#include "benchmark.h"

namespace
{

class Igor : Program
{
    public:

    ///////////
    //options//
    ///////////
    uint32_t sequence_length;
    uint32_t pattern_length;
    uint32_t no_random_patterns;
    uint32_t seed;
    uint32_t max_nodes;
    bool print;

    ///////
    //i/o//
    ///////
    std::string sequence;
    std::vector<std::string> patterns;

    /////////
    //stats//
    /////////
    double generation_time;
    double build_time;
    double total_matching_time;
    double total_naive_time;
    uint64_t no_matches;

    /////////
    //tools//
    /////////
    std::mt19937 rng;
    SuffixTree tree;

    Igor(int argc, char **argv)
    {
        version = "0.1";

        //////////////////////////
        //options initialization//
        //////////////////////////
        try
        {
            std::string desc = "times suffix tree construction and pattern search on a random sequence";

            TCLAP::CmdLine cmd(desc, ' ', version);
            STOutput my; cmd.setOutput(&my);
            TCLAP::ValueArg<uint32_t> arg_sequence_length("l", "l", "sequence length [1000000]", false, 1000000, "int", cmd);
            TCLAP::ValueArg<uint32_t> arg_pattern_length("w", "w", "pattern length [10]", false, 10, "int", cmd);
            TCLAP::ValueArg<uint32_t> arg_no_random_patterns("k", "k", "number of random patterns [2]", false, 2, "int", cmd);
            TCLAP::ValueArg<uint32_t> arg_seed("x", "x", "seed of the random number generator [1]", false, 1, "int", cmd);
            TCLAP::ValueArg<uint32_t> arg_max_nodes("m", "m", "maximum number of tree nodes, 0 for no limit [0]", false, 0, "int", cmd);
            TCLAP::SwitchArg arg_quiet("q", "q", "do not print options and summary [false]", cmd, false);

            cmd.parse(argc, argv);

            sequence_length = arg_sequence_length.getValue();
            pattern_length = arg_pattern_length.getValue();
            no_random_patterns = arg_no_random_patterns.getValue();
            seed = arg_seed.getValue();
            max_nodes = arg_max_nodes.getValue();
            print = !arg_quiet.getValue();
        }
        catch (TCLAP::ArgException &e)
        {
            std::cerr << "error: " << e.error() << " for arg " << e.argId() << "\n";
            abort();
        }

        if (pattern_length==0)
        {
            fprintf(stderr, "[E:%s:%d %s] pattern length must be positive\n", __FILE__, __LINE__, __FUNCTION__);
            exit(1);
        }
    };

    void initialize()
    {
        ////////////////////////
        //stats initialization//
        ////////////////////////
        generation_time = 0;
        build_time = 0;
        total_matching_time = 0;
        total_naive_time = 0;
        no_matches = 0;

        ////////////////////////
        //tools initialization//
        ////////////////////////
        rng.seed(seed);
        tree.set_max_nodes(max_nodes);

        //////////////////////
        //i/o initialization//
        //////////////////////
        clock_t t0 = clock();
        random_sequence(sequence_length, sequence);
        generation_time = (double)(clock()-t0)/CLOCKS_PER_SEC;

        //one pattern known to occur, the rest random
        if (sequence_length>=pattern_length)
        {
            uint32_t pos = sequence_length>=1000+pattern_length ? 1000 : 0;
            patterns.push_back(sequence.substr(pos, pattern_length));
        }
        for (uint32_t i=0; i<no_random_patterns; ++i)
        {
            std::string pattern;
            random_sequence(pattern_length, pattern);
            patterns.push_back(pattern);
        }
    }

    /**
     * Generates a uniformly random sequence over ACGT.
     */
    void random_sequence(uint32_t len, std::string& seq)
    {
        std::uniform_int_distribution<int32_t> base(BASE_A, BASE_T);
        seq.resize(len);
        for (uint32_t i=0; i<len; ++i)
        {
            seq[i] = index2base(base(rng));
        }
    }

    void benchmark()
    {
        STError error;

        //progress every tenth of the sequence
        uint32_t step = sequence_length>=10 ? sequence_length/10 : 1;
        bool verbose = print;
        BuildCheckpoint progress = [step, verbose](uint32_t pos)
        {
            if (verbose && pos && pos%step==0)
            {
                std::clog << "constructed up to position " << pos << "\n";
            }
            return true;
        };

        clock_t t0 = clock();
        if (!tree.build(sequence, error, progress))
        {
            fprintf(stderr, "[E:%s:%d %s] cannot construct suffix tree: %s\n", __FILE__, __LINE__, __FUNCTION__, error.to_string().c_str());
            exit(1);
        }
        build_time = (double)(clock()-t0)/CLOCKS_PER_SEC;

        if (print)
        {
            std::clog << "\n";
            fprintf(stderr, "suffix tree construction time : %.6fs\n", build_time);
            std::clog << "\n";
        }

        PatternMatcher matcher(tree);
        std::vector<uint32_t> positions;
        std::vector<uint32_t> expected;

        for (size_t i=0; i<patterns.size(); ++i)
        {
            t0 = clock();
            if (!matcher.find(patterns[i], positions, error))
            {
                fprintf(stderr, "[E:%s:%d %s] search failed for %s: %s\n", __FILE__, __LINE__, __FUNCTION__, patterns[i].c_str(), error.to_string().c_str());
                exit(1);
            }
            double matching_time = (double)(clock()-t0)/CLOCKS_PER_SEC;
            total_matching_time += matching_time;

            t0 = clock();
            if (!naive_find(sequence, patterns[i], expected, error))
            {
                fprintf(stderr, "[E:%s:%d %s] naive search failed for %s: %s\n", __FILE__, __LINE__, __FUNCTION__, patterns[i].c_str(), error.to_string().c_str());
                exit(1);
            }
            total_naive_time += (double)(clock()-t0)/CLOCKS_PER_SEC;

            if (positions!=expected)
            {
                fprintf(stderr, "[E:%s:%d %s] suffix tree reports %zu matches for %s, naive scan reports %zu\n", __FILE__, __LINE__, __FUNCTION__, positions.size(), patterns[i].c_str(), expected.size());
                exit(1);
            }

            no_matches += positions.size();

            std::cout << patterns[i] << "\t" << positions.size() << "\n";

            if (print)
            {
                std::clog << "pattern " << patterns[i] << "\n";
                std::clog << "  matches        : " << positions.size() << "\n";
                fprintf(stderr, "  matching time  : %.6fs\n", matching_time);
                fprintf(stderr, "  matching speed : %.2f Mbp/s\n", speed(sequence_length, matching_time));
                for (size_t j=0; j<positions.size() && j<2; ++j)
                {
                    std::clog << "  context at " << positions[j] << " : " << extract_context(sequence, positions[j], patterns[i].size(), 10) << "\n";
                }
                std::clog << "\n";
            }
        }
    };

    /**
     * Million bases per second, 0 if the time is too short to measure.
     */
    double speed(uint64_t bases, double t)
    {
        return t>0 ? bases/t/1e6 : 0;
    }

    void print_options()
    {
        if (!print) return;

        std::clog << "benchmark v" << version << "\n";
        std::clog << "\n";
        std::clog << "options:     [l] sequence length          " << sequence_length << "\n";
        std::clog << "             [w] pattern length           " << pattern_length << "\n";
        std::clog << "             [k] random patterns          " << no_random_patterns << "\n";
        std::clog << "             [x] seed                     " << seed << "\n";
        print_num_op("             [m] maximum nodes            ", max_nodes);
        std::clog << "\n";
    }

    void print_stats()
    {
        if (!print) return;

        std::clog << "stats: sequence length                    " << sequence_length << "\n";
        std::clog << "       nodes                              " << tree.get_no_nodes() << "\n";
        std::clog << "       patterns                           " << patterns.size() << "\n";
        std::clog << "       total matches                      " << no_matches << "\n";
        fprintf(stderr, "       sequence generation time           %.6fs\n", generation_time);
        fprintf(stderr, "       construction time                  %.6fs\n", build_time);
        fprintf(stderr, "       total matching time                %.6fs\n", total_matching_time);
        if (patterns.size())
        {
            fprintf(stderr, "       average matching time per pattern  %.6fs\n", total_matching_time/patterns.size());
        }
        fprintf(stderr, "       average matching speed             %.2f Mbp/s\n", speed((uint64_t)sequence_length*patterns.size(), total_matching_time));
        fprintf(stderr, "       total naive scan time              %.6fs\n", total_naive_time);
        std::clog << "\n";
    };

    ~Igor() {};

    private:
};

}

bool benchmark(int argc, char ** argv)
{
    Igor igor(argc, argv);
    igor.print_options();
    igor.initialize();
    igor.benchmark();
    igor.print_stats();
    return igor.print;
};
