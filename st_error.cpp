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

#include "st_error.h"
#include <sstream>

/**
 * Constructor.
 */
STError::STError()
{
    clear();
};

/**
 * Resets to ST_OK.
 */
void STError::clear()
{
    code = ST_OK;
    pos = 0;
    symbol = 0;
};

/**
 * Sets an error.
 */
void STError::set(int32_t code, uint32_t pos, char symbol)
{
    this->code = code;
    this->pos = pos;
    this->symbol = symbol;
};

/**
 * Returns true if no error is recorded.
 */
bool STError::ok() const
{
    return code==ST_OK;
};

/**
 * Returns a string representation of this error.
 */
std::string STError::to_string() const
{
    std::stringstream ss;
    ss << st_error2string(code);
    if (code==ST_INVALID_SYMBOL)
    {
        ss << ": '";
        if (symbol>=' ' && symbol<='~')
        {
            ss << symbol;
        }
        else
        {
            ss << "\\x" << std::hex << (int32_t)(uint8_t)symbol << std::dec;
        }
        ss << "' at index " << pos;
    }
    else if (code==ST_RESOURCE_EXHAUSTED || code==ST_CANCELLED)
    {
        ss << " at position " << pos;
    }

    return ss.str();
};

/**
 * Converts an error code to its name.
 */
const char* st_error2string(int32_t code)
{
    switch (code)
    {
        case ST_OK:
            return "ok";
        case ST_INVALID_SYMBOL:
            return "invalid symbol";
        case ST_RESOURCE_EXHAUSTED:
            return "resource exhausted";
        case ST_CANCELLED:
            return "cancelled";
        case ST_TREE_NOT_BUILT:
            return "tree not built";
        default:
            return "unknown error";
    }
};
