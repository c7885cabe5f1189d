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

#include "find.h"

namespace
{

class Igor : Program
{
    public:

    ///////////
    //options//
    ///////////
    std::string sequence_string;
    std::string ref_fasta_file;
    SequenceRegion region;
    bool uppercase;
    std::vector<std::string> patterns;
    uint32_t flank;
    uint32_t no_contexts;
    uint32_t seed;
    uint32_t max_nodes;
    bool debug;
    bool print;

    ///////
    //i/o//
    ///////
    std::string sequence;

    /////////
    //stats//
    /////////
    double build_time;
    uint32_t no_queries;
    uint32_t no_invalid_patterns;
    uint32_t no_matched_patterns;
    uint64_t no_matches;

    /////////
    //tools//
    /////////
    SuffixTree tree;

    Igor(int argc, char **argv)
    {
        version = "0.1";

        //////////////////////////
        //options initialization//
        //////////////////////////
        try
        {
            std::string desc = "finds all occurrences of DNA patterns in a sequence with a suffix tree";

            TCLAP::CmdLine cmd(desc, ' ', version);
            STOutput my; cmd.setOutput(&my);
            TCLAP::ValueArg<std::string> arg_sequence("s", "s", "sequence over ACGT []", false, "", "str", cmd);
            TCLAP::ValueArg<std::string> arg_ref_fasta_file("r", "r", "reference sequence fasta file []", false, "", "str", cmd);
            TCLAP::ValueArg<std::string> arg_region("i", "i", "region of the reference, chrom[:beg-end] []", false, "", "str", cmd);
            TCLAP::SwitchArg arg_uppercase("u", "u", "upper case soft masked bases [false]", cmd, false);
            TCLAP::ValueArg<std::string> arg_patterns("p", "p", "comma delimited patterns []", false, "", "str", cmd);
            TCLAP::ValueArg<std::string> arg_pattern_list("P", "P", "file containing list of patterns []", false, "", "file", cmd);
            TCLAP::ValueArg<uint32_t> arg_flank("c", "c", "bases of context shown around a match [10]", false, 10, "int", cmd);
            TCLAP::ValueArg<uint32_t> arg_no_contexts("n", "n", "maximum number of contexts shown per pattern, sampled at random [2]", false, 2, "int", cmd);
            TCLAP::ValueArg<uint32_t> arg_seed("x", "x", "seed for sampling contexts [1]", false, 1, "int", cmd);
            TCLAP::ValueArg<uint32_t> arg_max_nodes("m", "m", "maximum number of tree nodes, 0 for no limit [0]", false, 0, "int", cmd);
            TCLAP::SwitchArg arg_debug("d", "d", "debug [false]", cmd, false);
            TCLAP::SwitchArg arg_quiet("q", "q", "do not print options and summary [false]", cmd, false);

            cmd.parse(argc, argv);

            sequence_string = arg_sequence.getValue();
            ref_fasta_file = arg_ref_fasta_file.getValue();
            parse_region(region, arg_region.getValue());
            uppercase = arg_uppercase.getValue();
            parse_patterns(patterns, arg_patterns.getValue(), arg_pattern_list.getValue());
            flank = arg_flank.getValue();
            no_contexts = arg_no_contexts.getValue();
            seed = arg_seed.getValue();
            max_nodes = arg_max_nodes.getValue();
            debug = arg_debug.getValue();
            print = !arg_quiet.getValue();
        }
        catch (TCLAP::ArgException &e)
        {
            std::cerr << "error: " << e.error() << " for arg " << e.argId() << "\n";
            abort();
        }

        if ((sequence_string=="") == (ref_fasta_file==""))
        {
            fprintf(stderr, "[E:%s:%d %s] exactly one of a sequence (-s) or a reference fasta file (-r) is required\n", __FILE__, __LINE__, __FUNCTION__);
            exit(1);
        }

        if (ref_fasta_file!="" && region.chrom=="")
        {
            fprintf(stderr, "[E:%s:%d %s] a region (-i) is required with a reference fasta file\n", __FILE__, __LINE__, __FUNCTION__);
            exit(1);
        }
    };

    void initialize()
    {
        //////////////////////
        //i/o initialization//
        //////////////////////
        if (ref_fasta_file!="")
        {
            ReferenceSequence rs;
            if (!rs.load(ref_fasta_file))
            {
                fprintf(stderr, "[E:%s:%d %s] cannot load genome index: %s\n", __FILE__, __LINE__, __FUNCTION__, ref_fasta_file.c_str());
                exit(1);
            }

            if (!rs.fetch_seq(region, sequence, uppercase))
            {
                fprintf(stderr, "[E:%s:%d %s] cannot read %s from %s\n", __FILE__, __LINE__, __FUNCTION__, region.to_string().c_str(), ref_fasta_file.c_str());
                exit(1);
            }
        }
        else
        {
            sequence = sequence_string;
        }

        ////////////////////////
        //stats initialization//
        ////////////////////////
        build_time = 0;
        no_queries = 0;
        no_invalid_patterns = 0;
        no_matched_patterns = 0;
        no_matches = 0;

        ////////////////////////
        //tools initialization//
        ////////////////////////
        tree.set_max_nodes(max_nodes);
        tree.set_debug(debug);

        STError error;
        clock_t t0 = clock();
        if (!tree.build(sequence, error))
        {
            fprintf(stderr, "[E:%s:%d %s] cannot construct suffix tree: %s\n", __FILE__, __LINE__, __FUNCTION__, error.to_string().c_str());
            exit(1);
        }
        build_time = (double)(clock()-t0)/CLOCKS_PER_SEC;

        if (debug) tree.print();
    }

    void find()
    {
        PatternMatcher matcher(tree);
        std::vector<uint32_t> positions, sampled;
        STError error;

        for (size_t i=0; i<patterns.size(); ++i)
        {
            ++no_queries;
            if (!matcher.find(patterns[i], positions, error))
            {
                fprintf(stderr, "[W:%s:%d %s] skipping pattern %s: %s\n", __FILE__, __LINE__, __FUNCTION__, patterns[i].c_str(), error.to_string().c_str());
                ++no_invalid_patterns;
                continue;
            }

            std::cout << patterns[i] << "\t" << positions.size() << "\t"
                      << (positions.empty() ? "." : join(positions, ",")) << "\n";

            if (positions.size())
            {
                ++no_matched_patterns;
                no_matches += positions.size();
            }

            if (print && no_contexts)
            {
                sample_positions(positions, no_contexts, seed, sampled);
                for (size_t j=0; j<sampled.size(); ++j)
                {
                    std::clog << "context of " << patterns[i] << " at " << sampled[j] << " : "
                              << extract_context(sequence, sampled[j], patterns[i].size(), flank) << "\n";
                }
            }
        }
    };

    void print_options()
    {
        if (!print) return;

        std::clog << "find v" << version << "\n";
        std::clog << "\n";
        print_str_op("options:     sequence                 ", sequence_string.size()>50 ? sequence_string.substr(0, 47) + "..." : sequence_string);
        print_ref_op("             [r] reference FASTA file ", ref_fasta_file);
        print_str_op("             [i] region               ", region.chrom=="" ? "" : region.to_string());
        if (ref_fasta_file!="") print_boo_op("             [u] upper case           ", uppercase);
        print_strvec("             [p] patterns             ", patterns);
        print_num_op("             [c] context flank        ", flank);
        print_num_op("             [n] contexts per pattern ", no_contexts);
        print_num_op("             [x] seed                 ", seed);
        print_num_op("             [m] maximum nodes        ", max_nodes);
        print_boo_op("             [d] debug                ", debug);
        std::clog << "\n";
    }

    void print_stats()
    {
        if (!print) return;

        std::clog << "\n";
        std::clog << "stats: sequence length         " << tree.get_sequence().length() << "\n";
        std::clog << "       nodes                   " << tree.get_no_nodes() << "\n";
        std::clog << "       leaves                  " << tree.get_no_leaves() << "\n";
        std::clog << "       internal nodes          " << tree.get_no_internal_nodes() << "\n";
        fprintf(stderr, "       construction time       %.6fs\n", build_time);
        std::clog << "\n";
        std::clog << "       patterns                " << no_queries << "\n";
        std::clog << "       invalid patterns        " << no_invalid_patterns << "\n";
        std::clog << "       patterns with matches   " << no_matched_patterns << "\n";
        std::clog << "       total matches           " << no_matches << "\n";
        std::clog << "\n";
    };

    ~Igor() {};

    private:
};

}

bool find(int argc, char ** argv)
{
    Igor igor(argc, argv);
    igor.print_options();
    igor.initialize();
    igor.find();
    igor.print_stats();
    return igor.print;
};
