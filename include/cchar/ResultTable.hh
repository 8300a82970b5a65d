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
#include <vector>

#include "Metric.hh"
#include "StringUtil.hh"

namespace cchar {

// Characterization results of one harness over the slew x load grid.
// Every declared (slew, load) pair has an entry from construction on,
// and each metric of an entry is written at most once.
class ResultTable
{
public:
  ResultTable(const FloatSeq &slews,
              const FloatSeq &loads);
  const FloatSeq &slews() const { return slews_; }
  const FloatSeq &loads() const { return loads_; }
  size_t slewCount() const { return slews_.size(); }
  size_t loadCount() const { return loads_.size(); }
  // Number of grid points.
  size_t size() const { return grid_.size(); }
  // Index of a declared slew/load value.
  // Throws GridLookupError when the value matches zero or several entries.
  size_t slewIndex(float slew) const;
  size_t loadIndex(float load) const;
  // Table key for a slew/load value.
  string slewKey(size_t slew_index) const;
  string loadKey(size_t load_index) const;

  bool hasValue(size_t slew_index,
                size_t load_index,
                Metric metric) const;
  // Throws GridLookupError if the metric has not been recorded.
  double value(size_t slew_index,
               size_t load_index,
               Metric metric) const;
  // Lookup by declared slew/load value.
  double findValue(float slew,
                   float load,
                   Metric metric) const;
  const MetricValues &values(size_t slew_index,
                             size_t load_index) const;
  void setValue(size_t slew_index,
                size_t load_index,
                Metric metric,
                double value);
  // Every grid point has every metric in metrics.
  bool isComplete(const MetricSeq &metrics) const;

private:
  size_t gridIndex(size_t slew_index,
                   size_t load_index) const;
  size_t findIndex(const FloatSeq &values,
                   float value,
                   const char *what) const;

  FloatSeq slews_;
  FloatSeq loads_;
  // Indexed by slew_index * loadCount() + load_index.
  std::vector<MetricValues> grid_;
};

} // namespace
