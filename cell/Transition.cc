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

#include "Transition.hh"

#include "StringUtil.hh"

namespace cchar {

const RiseFall RiseFall::rise_("rise", "^", "rising");
const RiseFall RiseFall::fall_("fall", "v", "falling");

RiseFall::RiseFall(const char *name,
                   const char *short_name,
                   const char *edge_name) :
  name_(name),
  short_name_(short_name),
  edge_name_(edge_name)
{
}

const RiseFall *
RiseFall::opposite() const
{
  return (this == &rise_) ? &fall_ : &rise_;
}

const RiseFall *
RiseFall::find(const char *rf_str)
{
  for (const RiseFall *rf : {&rise_, &fall_}) {
    if (stringEq(rf_str, rf->name())
        || stringEq(rf_str, rf->shortName()))
      return rf;
  }
  return nullptr;
}

const char *
riseFallName(const RiseFall *rf)
{
  return rf ? rf->name() : "none";
}

} // namespace
