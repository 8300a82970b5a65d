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

#include <tcl.h>

namespace cchar {

constexpr int max_thread_count = 1024;

// Remove flag from argv if present.
bool
findCmdLineFlag(int &argc,
                char *argv[],
                const char *flag);
// Remove key and its value from argv and return the value.
char *
findCmdLineKey(int &argc,
               char *argv[],
               const char *key);
// max or a count from 1 to max_thread_count.
// Return values.
bool
parseThreadCount(const char *arg,
                 int &thread_count);
// -threads count|max
int
parseThreadsArg(int &argc,
                char *argv[]);
// Evaluate the commands in filename.
// Errors are printed on stderr.
int
sourceCmdFile(const char *filename,
              Tcl_Interp *interp);
void
showSplash();

} // namespace
