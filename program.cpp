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

#include "program.h"

void STOutput::failure(TCLAP::CmdLineInterface& c, TCLAP::ArgException& e)
{
    std::clog << "\n";
    std::clog << "  " << e.what() << "\n\n";
    usage(c);
    exit(1);
}

void STOutput::usage(TCLAP::CmdLineInterface& c)
{
    std::list<TCLAP::Arg*> args = c.getArgList();

    std::clog << c.getProgramName() << " v" << c.getVersion() << "\n\n";
    std::clog << "description : " << c.getMessage() << "\n\n";
    std::clog << "usage : stree "  << c.getProgramName() << " [options]\n\n";

    for (TCLAP::ArgListIterator it = args.begin(); it != args.end(); it++)
    {
        if (it==args.begin())
        {
            std::clog << "options : ";
        }
        else
        {
            std::clog << "          ";
        }

        TCLAP::Arg& arg = **it;
        if (typeid(arg)==typeid(TCLAP::ValueArg<std::string>) ||
            typeid(arg)==typeid(TCLAP::ValueArg<uint32_t>) ||
            typeid(arg)==typeid(TCLAP::ValueArg<int32_t>))
        {
            std::clog  << "-" << (arg.getFlag()=="" ? arg.getName() : arg.getFlag())
                       << "  " << arg.getDescription() << "\n";
        }
        else if (typeid(arg)==typeid(TCLAP::SwitchArg))
        {
            std::clog  << "-" << arg.getFlag()
                       << "  " << arg.getDescription() << "\n";
        }
        else
        {
            //tclap's own --help, --version and --
            std::clog  << "--" << arg.getName()
                       << "  " << arg.getDescription() << "\n";
        }
    }

    std::clog  <<  "\n";
}

/**
 * Parse patterns from a comma delimited string and a file with one pattern per line.
 *
 * @patterns       - patterns are stored in this vector
 * @pattern_string - comma delimited patterns
 * @pattern_list   - file containing patterns
 */
void Program::parse_patterns(std::vector<std::string>& patterns, std::string pattern_string, std::string pattern_list)
{
    patterns.clear();
    std::map<std::string, int32_t> m;

    std::vector<std::string> v;
    parse_string_list(v, pattern_string);

    if (pattern_list != "")
    {
        htsFile *file = hts_open(pattern_list.c_str(), "r");
        if (file==NULL)
        {
            fprintf(stderr, "[E:%s:%d %s] cannot open %s\n", __FILE__, __LINE__, __FUNCTION__, pattern_list.c_str());
            exit(1);
        }
        kstring_t s = {0,0,0};
        while (hts_getline(file, '\n', &s) >= 0)
        {
            if (s.l && s.s[0]!='#')
            {
                v.push_back(std::string(s.s));
            }
        }
        if (s.m) free(s.s);
        hts_close(file);
    }

    for (size_t i=0; i<v.size(); ++i)
    {
        if (m.find(v[i])==m.end())
        {
            m[v[i]] = 1;
            patterns.push_back(v[i]);
        }
    }
}

/**
 * Parse a region, exits on a malformed region.
 */
void Program::parse_region(SequenceRegion& region, std::string region_string)
{
    if (region_string!="" && !region.parse(region_string))
    {
        fprintf(stderr, "[E:%s:%d %s] invalid region: %s\n", __FILE__, __LINE__, __FUNCTION__, region_string.c_str());
        exit(1);
    }
}

/**
 * Parse a list of strings delimited by commas.
 *
 * @strings        - list of strings
 * @string_list    - comma delimited strings
 */
void Program::parse_string_list(std::vector<std::string>& strings, std::string string_list)
{
    strings.clear();
    if (string_list!="")
        split(strings, ",", string_list);
}

/**
 * Print reference FASTA file option.
 */
void Program::print_ref_op(const char* option_line, std::string ref_fasta_file)
{
    if (ref_fasta_file!="")
    {
        std::clog << option_line << ref_fasta_file << "\n";
    }
}

/**
 * Print string option, hide if not present.
 */
void Program::print_str_op(const char* option_line, std::string str_value)
{
    if (str_value!="")
    {
        std::clog << option_line << str_value << "\n";
    }
}

/**
 * Print number option, hide if 0.
 */
void Program::print_num_op(const char* option_line, uint32_t num_value)
{
    if (num_value)
    {
        std::clog << option_line << num_value << "\n";
    }
}

/**
 * Print switch option.
 */
void Program::print_boo_op(const char* option_line, bool value)
{
    std::clog << option_line << (value ? "true" : "false") << "\n";
}

/**
 * Print string vector.
 */
void Program::print_strvec(const char* option_line, std::vector<std::string>& vec)
{
    if (vec.size()!=0)
    {
        std::clog << option_line;
        for (size_t i=0; i<std::min((uint32_t)vec.size(),(uint32_t)4); ++i)
        {
            if (i) std::clog << ",";
            std::clog << vec[i];
        }

        if (vec.size()>4)
        {
            std::clog << " and " << (vec.size()-4) <<  " other values\n";
        }
        else
        {
            std::clog << "\n";
        }
    }
}
