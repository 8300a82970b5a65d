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

#include <cstddef>

#include "Metric.hh"

namespace cchar {

class CellTopology;
class Harness;
class RiseFall;

// One oracle invocation for one grid point.
struct SimRequest
{
  SimRequest();
  // 1 = windowing pass, 2 = measurement pass.
  int pass;
  const CellTopology *cell;
  const Harness *harness;
  const RiseFall *in_direction;
  const RiseFall *out_direction;
  // Declared grid values and their table indices.
  float slew;
  float load;
  size_t slew_index;
  size_t load_index;
  // Stimulus ramp duration (seconds) and load (farads).
  double slew_time;
  double load_cap;
  double sim_timestep;
  float temperature;
  float vdd_voltage;
  float vss_voltage;
  float pwell_voltage;
  float nwell_voltage;
  // Energy window found by the windowing pass (seconds).
  bool has_energy_window;
  double energy_start;
  double energy_end;

  // Measurements the oracle must return for this pass.
  const MetricSeq &measurements() const;
};

// Electrical simulator collaborator.
// simulate is called concurrently from sweep tasks so implementations
// must not share mutable state between requests.
class SimOracle
{
public:
  virtual ~SimOracle() {}
  // Throws SimulationFailure if the simulation fails or a requested
  // measurement is missing.
  virtual void simulate(const SimRequest &request,
                        // Return values.
                        MetricValues &measurements) = 0;
};

} // namespace
