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

#include <map>
#include <string>
#include <vector>

namespace cchar {

// Raw oracle measurements followed by the derived metrics.
enum class Metric {
  prop_in_out,
  trans_out,
  energy_start,
  energy_end,
  q_in_dyn,
  q_out_dyn,
  q_vdd_dyn,
  q_vss_dyn,
  i_in_leak,
  i_vdd_leak,
  i_vss_leak,
  internal_energy,
  input_energy,
  input_capacitance,
  leakage_power
};

typedef std::map<Metric, double> MetricValues;
typedef std::vector<Metric> MetricSeq;

const char *
metricName(Metric metric);
// Return values.
void
findMetric(const char *name,
           Metric &metric,
           bool &exists);

// Metric names separated by spaces.
std::string
metricNames();

// Measurements requested from the windowing pass.
const MetricSeq &
windowPassMetrics();
// Measurements requested from the measurement pass.
const MetricSeq &
measurePassMetrics();
// Every raw value recorded per grid point by a sweep.
const MetricSeq &
rawMetrics();
// Values computed from the raw measurements.
const MetricSeq &
derivedMetrics();

} // namespace
