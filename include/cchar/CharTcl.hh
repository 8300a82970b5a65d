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

#include "StringUtil.hh"

namespace cchar {

#if TCL_MAJOR_VERSION < 9
    typedef int Tcl_Size;
#endif

class CellChar;

// Define the characterization commands in interp.
// The commands operate on cell_char, which must outlive interp.
void
defineCharCommands(Tcl_Interp *interp,
                   CellChar *cell_char);

// Throws ExceptionMsg if source is not a list.
StringSeq
tclListStringSeq(Tcl_Obj *source,
                 Tcl_Interp *interp);
// Throws ExceptionMsg if source is not a list of numbers.
FloatSeq
tclListFloatSeq(Tcl_Obj *source,
                Tcl_Interp *interp);

} // namespace
