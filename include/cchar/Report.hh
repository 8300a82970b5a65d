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
#include <cstdio>
#include <mutex>
#include <string>

#include "Machine.hh" // __attribute__

namespace cchar {

using std::string;

// All characterizer output goes through the report.
// Lines are printed whole so sweep tasks on worker threads can report
// without interleaving. Output can be copied to a log file and
// captured in a string.
class Report
{
public:
  Report();
  virtual ~Report();

  // Print line with return.
  void reportLine(const char *fmt, ...)
    __attribute__((format (printf, 2, 3)));
  void reportLineString(const string &line);
  // Print "prefix: " followed by the formatted line.
  void reportLineArgs(const char *prefix,
                      const char *fmt,
                      va_list args);

  // Print "Warning: " followed by the message.
  // id is unique to the call site.
  void warn(int id,
            const char *fmt, ...)
    __attribute__((format (printf, 3, 4)));
  // Throws ExceptionMsg with the formatted message.
  [[noreturn]] void error(int id,
                          const char *fmt, ...)
    __attribute__((format (printf, 3, 4)));

  // Copy output to filename until logEnd is called.
  // Throws FileNotWritable.
  void logBegin(const char *filename);
  void logEnd();
  // Capture output in a string until redirectStringEnd is called.
  void redirectStringBegin();
  const char *redirectStringEnd();

  static Report *defaultReport() { return default_; }

protected:
  // Primitive to print output on the console.
  virtual void printConsole(const string &text);
  // Caller holds print_lock_.
  void printLine(const string &line);

  FILE *log_stream_;
  bool redirect_to_string_;
  string redirect_string_;
  std::mutex print_lock_;
  static Report *default_;
};

} // namespace
