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

#ifndef PROGRAM_H
#define PROGRAM_H

#include <fstream>
#include <iostream>
#include <typeinfo>
#include "tclap/CmdLine.h"
#include "tclap/Arg.h"
#include "htslib/hts.h"
#include "htslib/kstring.h"
#include "utils.h"
#include "sequence_region.h"

class STOutput : public TCLAP::StdOutput
{
    public:

    void failure(TCLAP::CmdLineInterface& c, TCLAP::ArgException& e);

    void usage(TCLAP::CmdLineInterface& c);
};

/**
 * Provides an interface for programs in stree.
 */
class Program
{
    public:

    std::string version;

    /**
     * Process arguments.
     */
    Program(){};

    /**
     * Parse patterns from a comma delimited string and a file with one pattern per line.
     * Lines starting with # are ignored.  Duplicates are dropped, the order is kept.
     *
     * @patterns       - patterns are stored in this vector
     * @pattern_string - comma delimited patterns
     * @pattern_list   - file containing patterns
     */
    void parse_patterns(std::vector<std::string>& patterns, std::string pattern_string, std::string pattern_list);

    /**
     * Parse a region, exits on a malformed region.
     */
    void parse_region(SequenceRegion& region, std::string region_string);

    /**
     * Parse a list of strings delimited by commas.
     *
     * @strings        - list of strings
     * @string_list    - comma delimited strings
     */
    void parse_string_list(std::vector<std::string>& strings, std::string string_list);

    /**
     * Print reference FASTA file option.
     */
    void print_ref_op(const char* option_line, std::string ref_fasta_file);

    /**
     * Print string option, hide if not present.
     */
    void print_str_op(const char* option_line, std::string str_value);

    /**
     * Print number option, hide if 0.
     */
    void print_num_op(const char* option_line, uint32_t num_value);

    /**
     * Print switch option.
     */
    void print_boo_op(const char* option_line, bool value);

    /**
     * Print string vector.
     */
    void print_strvec(const char* option_line, std::vector<std::string>& vec);
};

#endif
