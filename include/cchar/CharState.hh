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

namespace cchar {

class Report;
class Debug;
class CharSettings;
class DispatchQueue;

// Characterization components share the report, debug, settings and
// worker pool. This class simplifies copying pointers to them.
class CharState
{
public:
  // Make an empty state.
  CharState();
  CharState(const CharState *state);
  // Copy the state from state. This is virtual so that a component
  // can notify sub-components.
  virtual void copyState(const CharState *state);
  virtual ~CharState() {}
  Report *report() { return report_; }
  Report *report() const { return report_; }
  Debug *debug() { return debug_; }
  Debug *debug() const { return debug_; }
  CharSettings *settings() { return settings_; }
  const CharSettings *settings() const { return settings_; }
  int threadCount() const { return thread_count_; }

protected:
  Report *report_;
  Debug *debug_;
  CharSettings *settings_;
  int thread_count_;
  DispatchQueue *dispatch_queue_;
};

} // namespace
