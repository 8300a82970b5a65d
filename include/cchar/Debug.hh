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

#include <cstdarg>
#include <map>
#include <string>

#include "Machine.hh"
#include "StringUtil.hh"

namespace cchar {

class Report;

// Debug trace levels by topic.
// Topics are "harness", "sweep" and "oracle".
class Debug
{
public:
  explicit Debug(Report *report);
  int level(const char *topic) const;
  // Level 0 turns the topic off.
  // Throws ExceptionMsg for an unknown topic.
  void setLevel(const char *topic,
                int level);
  bool check(const char *topic,
             int level) const;
  void reportLine(const char *topic,
                  const char *fmt,
                  ...) const
    __attribute__((format (printf, 3, 4)));
  static const StringSeq &topics();

protected:
  Report *report_;
  // True when any topic has a level.
  bool tracing_;
  std::map<string, int> topic_levels_;
};

// A macro so the args are not evaluated unless the topic is on.
// "##__VA_ARGS__" is a gcc extension to support zero arguments (no comma).
#define debugPrint(debug, topic, level, ...) \
  if (debug->check(topic, level)) {  \
    debug->reportLine(topic, ##__VA_ARGS__); \
  }

} // namespace
