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

#include "CharMain.hh"

#include <cerrno>
#include <cstdio>
#include <cstdlib>

#include "CCharConfig.hh"  // CCHAR_VERSION
#include "Machine.hh"
#include "StringUtil.hh"

namespace cchar {

bool
parseThreadCount(const char *arg,
                 int &thread_count)
{
  if (stringEqual(arg, "max")) {
    thread_count = processorCount();
    return true;
  }
  if (!isDigits(arg))
    return false;
  errno = 0;
  long count = strtol(arg, nullptr, 10);
  if (errno == ERANGE
      || count < 1
      || count > max_thread_count)
    return false;
  thread_count = static_cast<int>(count);
  return true;
}

int
parseThreadsArg(int &argc,
                char *argv[])
{
  char *thread_arg = findCmdLineKey(argc, argv, "-threads");
  if (thread_arg) {
    int thread_count;
    if (parseThreadCount(thread_arg, thread_count))
      return thread_count;
    else
      fprintf(stderr, "Warning: -threads must be max or 1 to %d.\n",
              max_thread_count);
  }
  return 1;
}

bool
findCmdLineFlag(int &argc,
                char *argv[],
                const char *flag)
{
  for (int i = 1; i < argc; i++) {
    char *arg = argv[i];
    if (stringEq(arg, flag)) {
      // remove flag from argv.
      for (int j = i + 1; j < argc; j++, i++)
        argv[i] = argv[j];
      argc--;
      return true;
    }
  }
  return false;
}

char *
findCmdLineKey(int &argc,
               char *argv[],
               const char *key)
{
  for (int i = 1; i < argc; i++) {
    char *arg = argv[i];
    if (stringEq(arg, key) && i + 1 < argc) {
      char *value = argv[i + 1];
      // remove key and value from argv.
      for (int j = i + 2; j < argc; j++, i++)
        argv[i] = argv[j];
      argc -= 2;
      return value;
    }
  }
  return nullptr;
}

int
sourceCmdFile(const char *filename,
              Tcl_Interp *interp)
{
  int result = Tcl_EvalFile(interp, filename);
  if (result != TCL_OK) {
    const char *error_info = Tcl_GetVar(interp, "errorInfo", TCL_GLOBAL_ONLY);
    fprintf(stderr, "Error: %s\n",
            error_info ? error_info : Tcl_GetStringResult(interp));
  }
  return result;
}

void
showSplash()
{
  printf("CellChar %s\n", CCHAR_VERSION);
  printf("Copyright (c) 2025, Parallax Software, Inc.\n");
  printf("License GPLv3: GNU GPL version 3 <http://gnu.org/licenses/gpl.html>\n");
  printf("This is free software, and you are free to change and redistribute it.\n");
  printf("This program comes with ABSOLUTELY NO WARRANTY.\n");
}

} // namespace
