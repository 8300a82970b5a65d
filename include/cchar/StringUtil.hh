// CellChar, Standard Cell Characterizer
// Copyright (c) 2025, Parallax Software, Inc.
// 
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
// GNU General Public License for more details.
// 
// You should have received a copy of the GNU General Public License
// along with this program. If not, see <https://www.gnu.org/licenses/>.
// 
// The origin of this software must not be misrepresented; you must not
// claim that you wrote the original software.
// 
// Altered source versions must be plainly marked as such, and must not be
// misrepresented as being the original software.
// 
// This notice may not be removed or altered from any source distribution.

#pragma once

#include <cstdarg>
#include <cstring>
#include <string>
#include <vector>

#include "Machine.hh" // __attribute__

namespace cchar {

using std::string;

typedef std::vector<string> StringSeq;
typedef std::vector<float> FloatSeq;

inline bool
stringEq(const char *str1,
         const char *str2)
{
  return strcmp(str1, str2) == 0;
}

// Case insensitive compare.
inline bool
stringEqual(const char *str1,
            const char *str2)
{
  return strcasecmp(str1, str2) == 0;
}

// Case insensitive compare the beginning of str1 to str2.
inline bool
stringBeginEqual(const char *str1,
                 const char *str2)
{
  return strncasecmp(str1, str2, strlen(str2)) == 0;
}

bool
isDigits(const char *str);

// Print to a std::string.
void
stringPrint(string &str,
            const char *fmt,
            ...) __attribute__((format (printf, 2, 3)));
string
stdstrPrint(const char *fmt,
            ...) __attribute__((format (printf, 1, 2)));
string
stdstrPrintArgs(const char *fmt,
                va_list args);
// Formated append to std::string.
void
stringAppend(string &str,
             const char *fmt,
             ...) __attribute__((format (printf, 2, 3)));

////////////////////////////////////////////////////////////////

// Trim right spaces.
void
trimRight(string &str);

// Spit text into delimiter separated tokens and skip whitepace.
void
split(const string &text,
      const string &delims,
      // Return values.
      StringSeq &tokens);

// Join the strings with sep between them.
string
join(const StringSeq &strings,
     const char *sep);

} // namespace
