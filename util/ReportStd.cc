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

#include "ReportStd.hh"

#include <cstdio>

#include "Report.hh"

namespace cchar {

// Report to stdout, flushed per line so sweep progress shows up
// when stdout is a pipe.
class ReportStd : public Report
{
public:
  ReportStd();

protected:
  void printConsole(const string &text) override;
};

Report *
makeReportStd()
{
  return new ReportStd;
}

ReportStd::ReportStd() :
  Report()
{
}

void
ReportStd::printConsole(const string &text)
{
  fwrite(text.c_str(), sizeof(char), text.size(), stdout);
  fflush(stdout);
}

} // namespace
