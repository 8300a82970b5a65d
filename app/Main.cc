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
#include "CCharConfig.hh"  // CCHAR_VERSION

#include <cstdio>
#include <cstdlib>              // exit
#include <tcl.h>

#include "StringUtil.hh"
#include "CharTcl.hh"
#include "CellChar.hh"

using cchar::stringEq;
using cchar::findCmdLineFlag;
using cchar::parseThreadsArg;
using cchar::sourceCmdFile;
using cchar::showSplash;
using cchar::defineCharCommands;
using cchar::CellChar;

static int cmd_argc;
static char **cmd_argv;

static void
showUsage(const char *prog);
static int
tclAppInit(Tcl_Interp *interp);
static int
charTclAppInit(int argc,
               char *argv[],
               Tcl_Interp *interp);
static void
initCharApp(int &argc,
            char *argv[],
            Tcl_Interp *interp);

int
main(int argc,
     char *argv[])
{
  if (argc == 2 && stringEq(argv[1], "-help")) {
    showUsage(argv[0]);
    return 0;
  }
  else if (argc == 2 && stringEq(argv[1], "-version")) {
    printf("%s\n", CCHAR_VERSION);
    return 0;
  }
  else {
    // Set argc to 1 so Tcl_Main doesn't source any files.
    // Tcl_Main never returns.
    cmd_argc = argc;
    cmd_argv = argv;
    Tcl_Main(1, argv, tclAppInit);
    return 0;
  }
}

static int
tclAppInit(Tcl_Interp *interp)
{
  return charTclAppInit(cmd_argc, cmd_argv, interp);
}

// Tcl init executed inside Tcl_Main.
static int
charTclAppInit(int argc,
               char *argv[],
               Tcl_Interp *interp)
{
  // source init.tcl
  if (Tcl_Init(interp) == TCL_ERROR)
    return TCL_ERROR;

  initCharApp(argc, argv, interp);

  if (!findCmdLineFlag(argc, argv, "-no_splash"))
    showSplash();

  bool exit_after_cmd_file = findCmdLineFlag(argc, argv, "-exit");

  if (argc > 2
      || (argc > 1 && argv[1][0] == '-')) {
    showUsage(argv[0]);
    exit(1);
  }
  else {
    if (argc == 2) {
      char *cmd_file = argv[1];
      if (cmd_file) {
        int result = sourceCmdFile(cmd_file, interp);
        if (exit_after_cmd_file) {
          int exit_code = (result == TCL_OK) ? EXIT_SUCCESS : EXIT_FAILURE;
          exit(exit_code);
        }
      }
    }
  }
  return TCL_OK;
}

static void
initCharApp(int &argc,
            char *argv[],
            Tcl_Interp *interp)
{
  CellChar *cell_char = new CellChar;
  CellChar::setCellChar(cell_char);
  cell_char->makeComponents();
  int thread_count = parseThreadsArg(argc, argv);
  cell_char->setThreadCount(thread_count);
  defineCharCommands(interp, cell_char);
}

static void
showUsage(const char *prog)
{
  printf("Usage: %s [-help] [-version] [-threads count|max] [-no_splash] [-exit] cmd_file\n", prog);
  printf("  -help              show help and exit\n");
  printf("  -version           show version and exit\n");
  printf("  -threads count|max use count threads\n");
  printf("  -no_splash         do not show the license splash at startup\n");
  printf("  -exit              exit after reading cmd_file\n");
  printf("  cmd_file           source cmd_file\n");
}
