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

#include "Report.hh"

#include "StringUtil.hh"
#include "Error.hh"

namespace cchar {

Report *Report::default_ = nullptr;

Report::Report() :
  log_stream_(nullptr),
  redirect_to_string_(false)
{
  default_ = this;
}

Report::~Report()
{
  logEnd();
  if (default_ == this)
    default_ = nullptr;
}

void
Report::printConsole(const string &text)
{
  fputs(text.c_str(), stdout);
}

void
Report::printLine(const string &line)
{
  if (redirect_to_string_) {
    redirect_string_ += line;
    redirect_string_ += '\n';
  }
  else {
    printConsole(line + '\n');
    if (log_stream_)
      fprintf(log_stream_, "%s\n", line.c_str());
  }
}

void
Report::reportLine(const char *fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  string line = stdstrPrintArgs(fmt, args);
  va_end(args);
  std::lock_guard<std::mutex> lock(print_lock_);
  printLine(line);
}

void
Report::reportLineString(const string &line)
{
  std::lock_guard<std::mutex> lock(print_lock_);
  printLine(line);
}

void
Report::reportLineArgs(const char *prefix,
                       const char *fmt,
                       va_list args)
{
  string line = prefix;
  line += ": ";
  line += stdstrPrintArgs(fmt, args);
  std::lock_guard<std::mutex> lock(print_lock_);
  printLine(line);
}

void
Report::warn(int /* id */,
             const char *fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  reportLineArgs("Warning", fmt, args);
  va_end(args);
}

void
Report::error(int /* id */,
              const char *fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  // No prefix, no return.
  string msg = stdstrPrintArgs(fmt, args);
  va_end(args);
  throw ExceptionMsg(msg.c_str());
}

////////////////////////////////////////////////////////////////

void
Report::logBegin(const char *filename)
{
  logEnd();
  log_stream_ = fopen(filename, "w");
  if (log_stream_ == nullptr)
    throw FileNotWritable(filename);
}

void
Report::logEnd()
{
  if (log_stream_)
    fclose(log_stream_);
  log_stream_ = nullptr;
}

void
Report::redirectStringBegin()
{
  std::lock_guard<std::mutex> lock(print_lock_);
  redirect_to_string_ = true;
  redirect_string_.clear();
}

const char *
Report::redirectStringEnd()
{
  std::lock_guard<std::mutex> lock(print_lock_);
  redirect_to_string_ = false;
  return redirect_string_.c_str();
}

} // namespace
