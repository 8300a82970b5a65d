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

#include "MetricAggregator.hh"

#include <cmath>

#include "CharError.hh"
#include "Debug.hh"
#include "Harness.hh"
#include "CharSettings.hh"

namespace cchar {

using std::abs;

static double
rawValue(const MetricValues &raw,
         Metric metric)
{
  auto iter = raw.find(metric);
  if (iter == raw.end()) {
    string msg;
    stringPrint(msg, "missing %s measurement.", metricName(metric));
    throw GridLookupError(LookupFailure::none_found, msg.c_str());
  }
  return iter->second;
}

static double
averageLeakageCurrent(const MetricValues &raw)
{
  return (abs(rawValue(raw, Metric::i_vdd_leak))
          + abs(rawValue(raw, Metric::i_vss_leak))) / 2.0;
}

double
internalEnergy(const MetricValues &raw,
               float vdd_voltage,
               float threshold_scale)
{
  double q_vdd = rawValue(raw, Metric::q_vdd_dyn);
  double q_vss = rawValue(raw, Metric::q_vss_dyn);
  double q = (abs(q_vdd) < abs(q_vss)) ? q_vdd : q_vss;
  double window = rawValue(raw, Metric::energy_end)
    - rawValue(raw, Metric::energy_start);
  double internal_charge = abs(q) - window * averageLeakageCurrent(raw);
  return abs(internal_charge * vdd_voltage * threshold_scale);
}

double
inputEnergy(const MetricValues &raw,
            float vdd_voltage)
{
  return abs(rawValue(raw, Metric::q_in_dyn)) * vdd_voltage;
}

double
inputCapacitance(const MetricValues &raw,
                 float vdd_voltage)
{
  return abs(rawValue(raw, Metric::q_in_dyn)) / vdd_voltage;
}

double
leakagePower(const MetricValues &raw,
             float vdd_voltage)
{
  return averageLeakageCurrent(raw) * vdd_voltage;
}

////////////////////////////////////////////////////////////////

MetricAggregator::MetricAggregator(const CharState *state) :
  CharState(state)
{
}

void
MetricAggregator::aggregate(Harness *harness) const
{
  ResultTable &results = harness->results();
  float vdd = settings_->vddVoltage();
  float threshold_scale = settings_->energyScaleByThreshold()
    ? settings_->energyMeasHighThreshold()
    : 1.0;
  for (size_t si = 0; si < results.slewCount(); si++) {
    for (size_t li = 0; li < results.loadCount(); li++) {
      MetricValues raw = results.values(si, li);
      results.setValue(si, li, Metric::internal_energy,
                       internalEnergy(raw, vdd, threshold_scale));
      results.setValue(si, li, Metric::input_energy,
                       inputEnergy(raw, vdd));
      results.setValue(si, li, Metric::input_capacitance,
                       inputCapacitance(raw, vdd));
      results.setValue(si, li, Metric::leakage_power,
                       leakagePower(raw, vdd));
    }
  }
  debugPrint(debug_, "sweep", 1, "%s average delay %.3e max delay %.3e cin %.3e",
             harness->arcString().c_str(),
             harness->averagePropagationDelay(),
             harness->maxPropagationDelay(),
             harness->averageInputCapacitance());
}

} // namespace
