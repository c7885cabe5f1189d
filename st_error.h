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

#ifndef ST_ERROR_H
#define ST_ERROR_H

#include <cstdint>
#include <string>

#define ST_OK                   0
#define ST_INVALID_SYMBOL       1
#define ST_RESOURCE_EXHAUSTED   2
#define ST_CANCELLED            3
#define ST_TREE_NOT_BUILT       4

/**
 * Status of a suffix tree operation.
 *
 * Operations return false on failure and leave the details here.
 */
class STError
{
    public:
    int32_t code;
    uint32_t pos;  // offending offset in the sequence or pattern
    char symbol;   // offending character, 0 if not applicable

    /**
     * Constructor.
     */
    STError();

    /**
     * Resets to ST_OK.
     */
    void clear();

    /**
     * Sets an error.
     */
    void set(int32_t code, uint32_t pos=0, char symbol=0);

    /**
     * Returns true if no error is recorded.
     */
    bool ok() const;

    /**
     * Returns a string representation of this error.
     */
    std::string to_string() const;
};

/**
 * Converts an error code to its name.
 */
const char* st_error2string(int32_t code);

#endif
