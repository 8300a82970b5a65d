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

#include "ResultTable.hh"

#include "Error.hh"
#include "CharError.hh"

namespace cchar {

ResultTable::ResultTable(const FloatSeq &slews,
                         const FloatSeq &loads) :
  slews_(slews),
  loads_(loads),
  grid_(slews.size() * loads.size())
{
}

size_t
ResultTable::gridIndex(size_t slew_index,
                       size_t load_index) const
{
  if (slew_index >= slews_.size()
      || load_index >= loads_.size()) {
    string msg;
    stringPrint(msg, "grid point (%zu, %zu) is outside the %zux%zu result table.",
                slew_index, load_index, slews_.size(), loads_.size());
    throw GridLookupError(LookupFailure::none_found, msg.c_str());
  }
  return slew_index * loads_.size() + load_index;
}

size_t
ResultTable::findIndex(const FloatSeq &values,
                       float value,
                       const char *what) const
{
  size_t match_count = 0;
  size_t index = 0;
  for (size_t i = 0; i < values.size(); i++) {
    if (values[i] == value) {
      if (match_count == 0)
        index = i;
      match_count++;
    }
  }
  if (match_count == 1)
    return index;
  string msg;
  if (match_count == 0) {
    stringPrint(msg, "%s %g is not in the result table.", what, value);
    throw GridLookupError(LookupFailure::none_found, msg.c_str());
  }
  else {
    stringPrint(msg, "%s %g matches %zu result table entries.",
                what, value, match_count);
    throw GridLookupError(LookupFailure::ambiguous, msg.c_str());
  }
}

size_t
ResultTable::slewIndex(float slew) const
{
  return findIndex(slews_, slew, "slew");
}

size_t
ResultTable::loadIndex(float load) const
{
  return findIndex(loads_, load, "load");
}

string
ResultTable::slewKey(size_t slew_index) const
{
  return stdstrPrint("%g", slews_.at(slew_index));
}

string
ResultTable::loadKey(size_t load_index) const
{
  return stdstrPrint("%g", loads_.at(load_index));
}

bool
ResultTable::hasValue(size_t slew_index,
                      size_t load_index,
                      Metric metric) const
{
  const MetricValues &values = grid_[gridIndex(slew_index, load_index)];
  return values.find(metric) != values.end();
}

double
ResultTable::value(size_t slew_index,
                   size_t load_index,
                   Metric metric) const
{
  const MetricValues &values = grid_[gridIndex(slew_index, load_index)];
  auto iter = values.find(metric);
  if (iter == values.end()) {
    string msg;
    stringPrint(msg, "no %s result for slew %g load %g.",
                metricName(metric),
                slews_[slew_index],
                loads_[load_index]);
    throw GridLookupError(LookupFailure::none_found, msg.c_str());
  }
  return iter->second;
}

double
ResultTable::findValue(float slew,
                       float load,
                       Metric metric) const
{
  return value(slewIndex(slew), loadIndex(load), metric);
}

const MetricValues &
ResultTable::values(size_t slew_index,
                    size_t load_index) const
{
  return grid_[gridIndex(slew_index, load_index)];
}

void
ResultTable::setValue(size_t slew_index,
                      size_t load_index,
                      Metric metric,
                      double value)
{
  MetricValues &values = grid_[gridIndex(slew_index, load_index)];
  auto ins = values.insert(std::make_pair(metric, value));
  if (!ins.second) {
    string msg;
    stringPrint(msg, "%s result for slew %g load %g is already recorded.",
                metricName(metric),
                slews_[slew_index],
                loads_[load_index]);
    throw ExceptionMsg(msg.c_str());
  }
}

bool
ResultTable::isComplete(const MetricSeq &metrics) const
{
  for (const MetricValues &values : grid_) {
    for (Metric metric : metrics) {
      if (values.find(metric) == values.end())
        return false;
    }
  }
  return true;
}

} // namespace
