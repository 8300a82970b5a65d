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

#include "CharError.hh"

namespace cchar {

MalformedTestVectorError::MalformedTestVectorError(const StringSeq &test_vector,
                                                   const char *reason) :
  Exception(),
  test_vector_(test_vector),
  reason_(reason)
{
  stringPrint(what_, "malformed test vector [%s]: %s",
              join(test_vector, " ").c_str(),
              reason);
}

const char *
MalformedTestVectorError::what() const noexcept
{
  return what_.c_str();
}

ClassificationError::ClassificationError(const char *mode,
                                         const char *harness) :
  Exception(),
  mode_(mode)
{
  stringPrint(what_, "unable to determine timing type for mode \"%s\" of harness %s.",
              mode, harness);
}

const char *
ClassificationError::what() const noexcept
{
  return what_.c_str();
}

SimulationFailure::SimulationFailure(float slew,
                                     float load,
                                     int pass,
                                     const char *msg) :
  Exception(),
  slew_(slew),
  load_(load),
  pass_(pass),
  msg_(msg)
{
  stringPrint(what_, "simulation failed for slew %g load %g pass %d: %s",
              slew, load, pass, msg);
}

const char *
SimulationFailure::what() const noexcept
{
  return what_.c_str();
}

GridLookupError::GridLookupError(LookupFailure failure,
                                 const char *msg) :
  Exception(),
  failure_(failure),
  what_(msg)
{
}

const char *
GridLookupError::what() const noexcept
{
  return what_.c_str();
}

} // namespace
