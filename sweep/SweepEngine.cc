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

#include "SweepEngine.hh"

#include "Error.hh"
#include "CharError.hh"
#include "Debug.hh"
#include "DispatchQueue.hh"
#include "Transition.hh"
#include "CellTopology.hh"
#include "Harness.hh"
#include "CharSettings.hh"

namespace cchar {

SweepPoint::SweepPoint(size_t slew_index,
                       size_t load_index) :
  slew_index(slew_index),
  load_index(load_index),
  failed(false),
  failed_pass(0)
{
}

SweepEngine::SweepEngine(const CharState *state) :
  CharState(state)
{
}

void
SweepEngine::sweep(const CellTopology *cell,
                   Harness *harness,
                   SimOracle *oracle)
{
  ResultTable &results = harness->results();
  float slew_mag = settings_->slewMagnitude();
  SweepPointSeq points;
  points.reserve(results.size());
  for (size_t si = 0; si < results.slewCount(); si++) {
    for (size_t li = 0; li < results.loadCount(); li++)
      points.emplace_back(si, li);
  }
  debugPrint(debug_, "sweep", 1, "sweep %s %s %zu points",
             cell->name(),
             harness->shortString().c_str(),
             points.size());

  if (settings_->mtSim() && thread_count_ > 1) {
    for (SweepPoint &point : points) {
      dispatch_queue_->dispatch([this, cell, harness, oracle, slew_mag, &point](int) {
        sweepPoint(cell, harness, oracle, slew_mag, point);
      });
    }
    dispatch_queue_->finishTasks();
  }
  else {
    for (SweepPoint &point : points)
      sweepPoint(cell, harness, oracle, slew_mag, point);
  }

  for (const SweepPoint &point : points) {
    if (point.failed)
      throw SimulationFailure(results.slews()[point.slew_index],
                              results.loads()[point.load_index],
                              point.failed_pass,
                              point.error.c_str());
  }
  for (const SweepPoint &point : points) {
    for (const auto &[metric, value] : point.measurements)
      results.setValue(point.slew_index, point.load_index, metric, value);
  }
}

SimRequest
SweepEngine::makeRequest(const CellTopology *cell,
                         const Harness *harness,
                         float slew_mag,
                         size_t slew_index,
                         size_t load_index) const
{
  const ResultTable &results = harness->results();
  SimRequest request;
  request.pass = 1;
  request.cell = cell;
  request.harness = harness;
  request.in_direction = harness->inDirection();
  request.out_direction = harness->outDirection();
  request.slew = results.slews()[slew_index];
  request.load = results.loads()[load_index];
  request.slew_index = slew_index;
  request.load_index = load_index;
  request.slew_time = request.slew * slew_mag * settings_->timeUnit();
  request.load_cap = request.load * settings_->capacitanceUnit();
  request.sim_timestep = cell->simTimestep(settings_->timeUnit());
  request.temperature = settings_->temperature();
  request.vdd_voltage = settings_->vddVoltage();
  request.vss_voltage = settings_->vssVoltage();
  request.pwell_voltage = settings_->pwellVoltage();
  request.nwell_voltage = settings_->nwellVoltage();
  return request;
}

// Keep only the requested measurements.
void
SweepEngine::simulatePass(SimOracle *oracle,
                          const SimRequest &request,
                          MetricValues &measurements) const
{
  MetricValues returned;
  oracle->simulate(request, returned);
  for (Metric metric : request.measurements()) {
    auto iter = returned.find(metric);
    if (iter == returned.end()) {
      string msg;
      stringPrint(msg, "oracle returned no %s measurement", metricName(metric));
      throw SimulationFailure(request.slew, request.load, request.pass,
                              msg.c_str());
    }
    measurements[metric] = iter->second;
  }
}

void
SweepEngine::sweepPoint(const CellTopology *cell,
                        const Harness *harness,
                        SimOracle *oracle,
                        float slew_mag,
                        SweepPoint &point) const
{
  SimRequest request = makeRequest(cell, harness, slew_mag,
                                   point.slew_index, point.load_index);
  try {
    MetricValues window;
    simulatePass(oracle, request, window);

    request.pass = 2;
    request.has_energy_window = true;
    request.energy_start = window[Metric::energy_start];
    request.energy_end = window[Metric::energy_end];
    MetricValues measurements;
    simulatePass(oracle, request, measurements);
    measurements[Metric::energy_start] = request.energy_start;
    measurements[Metric::energy_end] = request.energy_end;
    point.measurements = measurements;
    debugPrint(debug_, "sweep", 2, "%s slew %g load %g prop %.3e trans %.3e",
               harness->arcString().c_str(),
               request.slew,
               request.load,
               measurements[Metric::prop_in_out],
               measurements[Metric::trans_out]);
  }
  catch (const SimulationFailure &failure) {
    point.failed = true;
    point.failed_pass = failure.pass();
    point.error = failure.msg();
  }
  catch (const std::exception &error) {
    point.failed = true;
    point.failed_pass = request.pass;
    point.error = error.what();
  }
}

} // namespace
