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

#include "PinState.hh"

#include "StringUtil.hh"
#include "Transition.hh"

namespace cchar {

const PinState PinState::zero_("0", "held-0", PinStateKind::held, nullptr, 0);
const PinState PinState::one_("1", "held-1", PinStateKind::held, nullptr, 1);
const PinState PinState::rise_("01", "rising", PinStateKind::transition,
                               RiseFall::rise(), 1);
const PinState PinState::fall_("10", "falling", PinStateKind::transition,
                               RiseFall::fall(), 0);
const PinState PinState::tri_rise_("z1", "tri-to-1", PinStateKind::transition,
                                   RiseFall::rise(), 1);
const PinState PinState::tri_fall_("z0", "tri-to-0", PinStateKind::transition,
                                   RiseFall::fall(), 0);
const PinState PinState::pulse_0101_("0101", "pulse-0101", PinStateKind::pulse,
                                     RiseFall::rise(), 1);
const PinState PinState::pulse_1010_("1010", "pulse-1010", PinStateKind::pulse,
                                     RiseFall::fall(), 0);

const std::array<const PinState*, 8> PinState::range_{
  &zero_, &one_, &rise_, &fall_, &tri_rise_, &tri_fall_,
  &pulse_0101_, &pulse_1010_};

PinState::PinState(const char *code,
                   const char *name,
                   PinStateKind kind,
                   const RiseFall *direction,
                   int final_value) :
  code_(code),
  name_(name),
  kind_(kind),
  direction_(direction),
  final_value_(final_value)
{
}

const PinState *
PinState::find(const char *code)
{
  for (const PinState *state : range_) {
    if (stringEqual(code, state->code_.c_str()))
      return state;
  }
  return nullptr;
}

} // namespace
