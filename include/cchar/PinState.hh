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

#include <array>
#include <string>

namespace cchar {

class RiseFall;

enum class PinStateKind { held, transition, pulse };

// Expected state of one pin during a trial, parsed from its test vector
// code. Codes are parsed once at the vector boundary; downstream code
// uses the kind and direction and never looks at the code text.
//
//   code  kind        direction
//   0     held        none
//   1     held        none
//   01    transition  rise
//   10    transition  fall
//   z1    transition  rise   (tristate to 1)
//   z0    transition  fall   (tristate to 0)
//   0101  pulse       rise   (clock waveform)
//   1010  pulse       fall   (clock waveform)
class PinState
{
public:
  // Singleton accessors.
  static const PinState *zero() { return &zero_; }
  static const PinState *one() { return &one_; }
  static const PinState *rise() { return &rise_; }
  static const PinState *fall() { return &fall_; }
  static const PinState *triRise() { return &tri_rise_; }
  static const PinState *triFall() { return &tri_fall_; }
  static const PinState *pulse0101() { return &pulse_0101_; }
  static const PinState *pulse1010() { return &pulse_1010_; }
  // Find the state for a test vector code (case insensitive).
  // Return nullptr for unknown codes.
  static const PinState *find(const char *code);

  const std::string &code() const { return code_; }
  const char *name() const { return name_.c_str(); }
  PinStateKind kind() const { return kind_; }
  bool isHeld() const { return kind_ == PinStateKind::held; }
  bool isTransition() const { return kind_ == PinStateKind::transition; }
  bool isPulse() const { return kind_ == PinStateKind::pulse; }
  // rise, fall or nullptr for held levels.
  const RiseFall *direction() const { return direction_; }
  // Logic level at the end of the trial.
  int finalValue() const { return final_value_; }

  static const std::array<const PinState*, 8> &range() { return range_; }

private:
  PinState(const char *code,
           const char *name,
           PinStateKind kind,
           const RiseFall *direction,
           int final_value);

  const std::string code_;
  const std::string name_;
  const PinStateKind kind_;
  const RiseFall *direction_;
  const int final_value_;

  static const PinState zero_;
  static const PinState one_;
  static const PinState rise_;
  static const PinState fall_;
  static const PinState tri_rise_;
  static const PinState tri_fall_;
  static const PinState pulse_0101_;
  static const PinState pulse_1010_;
  static const std::array<const PinState*, 8> range_;
};

} // namespace
