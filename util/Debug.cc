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

#include "Debug.hh"

#include <algorithm>

#include "Error.hh"
#include "Report.hh"

namespace cchar {

Debug::Debug(Report *report) :
  report_(report),
  tracing_(false)
{
}

const StringSeq &
Debug::topics()
{
  static const StringSeq topics = {"harness", "sweep", "oracle"};
  return topics;
}

int
Debug::level(const char *topic) const
{
  auto iter = topic_levels_.find(topic);
  if (iter == topic_levels_.end())
    return 0;
  return iter->second;
}

void
Debug::setLevel(const char *topic,
                int level)
{
  const StringSeq &topics = Debug::topics();
  if (std::find(topics.begin(), topics.end(), topic) == topics.end())
    throw ExceptionMsg(stdstrPrint("unknown debug topic %s. Use one of %s.",
                                   topic, join(topics, " ").c_str()).c_str());
  if (level == 0)
    topic_levels_.erase(topic);
  else
    topic_levels_[topic] = level;
  tracing_ = !topic_levels_.empty();
}

bool
Debug::check(const char *topic,
             int level) const
{
  return tracing_
    && this->level(topic) >= level;
}

void
Debug::reportLine(const char *topic,
                  const char *fmt,
                  ...) const
{
  va_list args;
  va_start(args, fmt);
  report_->reportLineArgs(topic, fmt, args);
  va_end(args);
}

} // namespace
