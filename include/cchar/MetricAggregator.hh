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

#include "Metric.hh"
#include "CharState.hh"

namespace cchar {

class Harness;

// Derived metrics of one grid point from its raw measurements.
// Throws GridLookupError if a raw measurement is missing.

// The smaller magnitude rail charge is the internal (short circuit)
// charge, less the leakage charge over the energy window.
double
internalEnergy(const MetricValues &raw,
               float vdd_voltage,
               float threshold_scale);
double
inputEnergy(const MetricValues &raw,
            float vdd_voltage);
double
inputCapacitance(const MetricValues &raw,
                 float vdd_voltage);
// Average of the two rail leakage currents times vdd.
double
leakagePower(const MetricValues &raw,
             float vdd_voltage);

class MetricAggregator : public CharState
{
public:
  explicit MetricAggregator(const CharState *state);
  // Add the derived metrics of every grid point to the harness results.
  // The harness must have been swept.
  void aggregate(Harness *harness) const;
};

} // namespace
