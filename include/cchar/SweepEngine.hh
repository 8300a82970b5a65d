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

#include <vector>

#include "StringUtil.hh"
#include "Metric.hh"
#include "CharState.hh"
#include "SimOracle.hh"

namespace cchar {

class CellTopology;
class Harness;

// Result slot of one grid point. Only the task sweeping the point
// writes to it.
struct SweepPoint
{
  SweepPoint(size_t slew_index,
             size_t load_index);
  size_t slew_index;
  size_t load_index;
  MetricValues measurements;
  bool failed;
  int failed_pass;
  string error;
};

typedef std::vector<SweepPoint> SweepPointSeq;

// Two pass simulation of every slew x load grid point of a harness.
// The windowing pass finds the energy integration window and the
// measurement pass integrates charge over it.
class SweepEngine : public CharState
{
public:
  explicit SweepEngine(const CharState *state);
  // Record the raw measurements of every grid point in the harness
  // result table. Grid points run as concurrent tasks when mt_sim is on
  // and there is more than one thread.
  // Throws SimulationFailure for the first failing grid point in
  // slew, load order once every task has finished. Nothing is written
  // to the table if any grid point fails.
  void sweep(const CellTopology *cell,
             Harness *harness,
             SimOracle *oracle);
  SimRequest makeRequest(const CellTopology *cell,
                         const Harness *harness,
                         float slew_mag,
                         size_t slew_index,
                         size_t load_index) const;

protected:
  void sweepPoint(const CellTopology *cell,
                  const Harness *harness,
                  SimOracle *oracle,
                  float slew_mag,
                  SweepPoint &point) const;
  void simulatePass(SimOracle *oracle,
                    const SimRequest &request,
                    // Return values.
                    MetricValues &measurements) const;
};

} // namespace
