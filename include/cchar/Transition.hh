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

#include <string>

namespace cchar {

// Direction of a pin transition.
class RiseFall
{
public:
  // Singleton accessors.
  static const RiseFall *rise() { return &rise_; }
  static const RiseFall *fall() { return &fall_; }
  // "rise"/"fall"
  const char *name() const { return name_.c_str(); }
  // "^"/"v"
  const char *shortName() const { return short_name_.c_str(); }
  // Timing check label suffix ("rising"/"falling").
  const char *edgeName() const { return edge_name_.c_str(); }
  const RiseFall *opposite() const;
  // Find the direction named by name or short name.
  // Return nullptr if there is none.
  static const RiseFall *find(const char *rf_str);

protected:
  RiseFall(const char *name,
           const char *short_name,
           const char *edge_name);

  const std::string name_;
  const std::string short_name_;
  const std::string edge_name_;

  static const RiseFall rise_;
  static const RiseFall fall_;
};

// Name printed for a missing direction.
const char *
riseFallName(const RiseFall *rf);

} // namespace
