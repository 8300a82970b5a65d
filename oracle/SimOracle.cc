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

#include "SimOracle.hh"

namespace cchar {

SimRequest::SimRequest() :
  pass(1),
  cell(nullptr),
  harness(nullptr),
  in_direction(nullptr),
  out_direction(nullptr),
  slew(0.0),
  load(0.0),
  slew_index(0),
  load_index(0),
  slew_time(0.0),
  load_cap(0.0),
  sim_timestep(0.0),
  temperature(0.0),
  vdd_voltage(0.0),
  vss_voltage(0.0),
  pwell_voltage(0.0),
  nwell_voltage(0.0),
  has_energy_window(false),
  energy_start(0.0),
  energy_end(0.0)
{
}

const MetricSeq &
SimRequest::measurements() const
{
  if (has_energy_window)
    return measurePassMetrics();
  else
    return windowPassMetrics();
}

} // namespace
