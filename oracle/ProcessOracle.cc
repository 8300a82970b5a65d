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

#include "ProcessOracle.hh"

#include <cerrno>
#include <cmath>
#include <cstdarg>
#include <cstdlib>
#include <fstream>
#include <sys/stat.h>

#include "Machine.hh"
#include "Error.hh"
#include "CharError.hh"
#include "Debug.hh"
#include "Report.hh"
#include "Transition.hh"
#include "PinState.hh"
#include "CellTopology.hh"
#include "Harness.hh"
#include "CharSettings.hh"

namespace cchar {

using std::ofstream;
using std::ifstream;
using std::getline;

// fprintf for c++ streams.
static void
streamPrint(ofstream &stream,
            const char *fmt,
            ...) __attribute__((format (printf, 2, 3)));

static void
streamPrint(ofstream &stream,
            const char *fmt,
            ...)
{
  va_list args;
  va_start(args, fmt);
  stream << stdstrPrintArgs(fmt, args);
  va_end(args);
}

ProcessOracle::ProcessOracle(const CharState *state) :
  SimOracle(),
  CharState(state)
{
}

string
ProcessOracle::fileStem(const SimRequest &request) const
{
  string stem = request.cell->name();
  StringSeq bindings;
  split(request.harness->shortString(), " ", bindings);
  for (const string &binding : bindings) {
    stem += '_';
    for (char ch : binding) {
      if (ch != '=')
        stem += ch;
    }
  }
  stringAppend(stem, "_s%zu_l%zu_p%d",
               request.slew_index,
               request.load_index,
               request.pass);
  return stem;
}

static void
writeBinding(ofstream &stream,
             const char *key,
             const PinBinding &binding)
{
  if (!binding.isNull())
    streamPrint(stream, "%s = %s %s\n", key,
                binding.pin().c_str(),
                binding.state()->code().c_str());
}

void
ProcessOracle::writeRequest(const SimRequest &request,
                            const char *filename) const
{
  ofstream stream(filename);
  if (stream.is_open()) {
    const CellTopology *cell = request.cell;
    const Harness *harness = request.harness;
    streamPrint(stream, "* %s %s\n", cell->name(), harness->arcString().c_str());
    streamPrint(stream, "cell = %s\n", cell->name());
    streamPrint(stream, "logic = %s\n", cell->logic().c_str());
    streamPrint(stream, "netlist = %s\n", cell->netlist().c_str());
    streamPrint(stream, "model = %s\n", cell->model().c_str());
    streamPrint(stream, "pass = %d\n", request.pass);
    streamPrint(stream, "in_pin = %s\n", harness->targetInPort().pin().c_str());
    streamPrint(stream, "in_direction = %s\n", riseFallName(request.in_direction));
    streamPrint(stream, "out_pin = %s\n", harness->targetOutPort().pin().c_str());
    streamPrint(stream, "out_direction = %s\n", riseFallName(request.out_direction));
    for (const PinBinding &binding : harness->stableInPorts())
      writeBinding(stream, "stable_in", binding);
    for (const PinBinding &binding : harness->nontargetOutPorts())
      writeBinding(stream, "nontarget_out", binding);
    if (harness->isSequential()) {
      const SequentialHarness *seq = dynamic_cast<const SequentialHarness*>(harness);
      writeBinding(stream, "clock", seq->clock());
      if (!seq->set().isTarget())
        writeBinding(stream, "set", seq->set());
      if (!seq->reset().isTarget())
        writeBinding(stream, "reset", seq->reset());
      for (size_t i = 0; i < seq->flops().size(); i++)
        streamPrint(stream, "flop = %s %s\n",
                    seq->flops()[i].c_str(),
                    seq->flopStates()[i]->code().c_str());
    }
    streamPrint(stream, "slew = %.6e\n", request.slew_time);
    streamPrint(stream, "load = %.6e\n", request.load_cap);
    streamPrint(stream, "timestep = %.6e\n", request.sim_timestep);
    streamPrint(stream, "temperature = %g\n", request.temperature);
    streamPrint(stream, "%s = %g\n", settings_->vddName().c_str(), request.vdd_voltage);
    streamPrint(stream, "%s = %g\n", settings_->vssName().c_str(), request.vss_voltage);
    streamPrint(stream, "%s = %g\n", settings_->pwellName().c_str(), request.pwell_voltage);
    streamPrint(stream, "%s = %g\n", settings_->nwellName().c_str(), request.nwell_voltage);
    streamPrint(stream, "logic_threshold_high = %g\n",
                settings_->logicThresholdHigh());
    streamPrint(stream, "logic_threshold_low = %g\n",
                settings_->logicThresholdLow());
    streamPrint(stream, "logic_high_to_low_threshold = %g\n",
                settings_->logicHighToLowThreshold());
    streamPrint(stream, "logic_low_to_high_threshold = %g\n",
                settings_->logicLowToHighThreshold());
    streamPrint(stream, "energy_meas_low_voltage = %g\n",
                settings_->energyMeasLowThresholdVoltage());
    streamPrint(stream, "energy_meas_high_voltage = %g\n",
                settings_->energyMeasHighThresholdVoltage());
    streamPrint(stream, "energy_meas_time_extent = %g\n",
                settings_->energyMeasTimeExtent());
    if (request.has_energy_window) {
      streamPrint(stream, "energy_start = %.6e\n", request.energy_start);
      streamPrint(stream, "energy_end = %.6e\n", request.energy_end);
    }
    StringSeq names;
    for (Metric metric : request.measurements())
      names.push_back(metricName(metric));
    streamPrint(stream, "measure = %s\n", join(names, " ").c_str());
    stream.close();
  }
  else
    throw FileNotWritable(filename);
}

void
ProcessOracle::makeWorkDir() const
{
  const char *work_dir = settings_->workDir().c_str();
  if (mkdir(work_dir, 0777) != 0
      && errno != EEXIST)
    throw FileNotWritable(work_dir);
}

void
ProcessOracle::runSimulator(const SimRequest &request,
                            const string &request_filename,
                            const string &listing_filename) const
{
  string cmd;
  stringPrint(cmd, "%s %s 1> %s 2> /dev/null",
              settings_->simulator().c_str(),
              request_filename.c_str(),
              listing_filename.c_str());
  debugPrint(debug_, "oracle", 1, "%s", cmd.c_str());
  int status = runShellCommand(cmd.c_str());
  if (status != 0) {
    string msg;
    stringPrint(msg, "\"%s\" exited with status %d", cmd.c_str(), status);
    throw SimulationFailure(request.slew, request.load, request.pass,
                            msg.c_str());
  }
}

void
ProcessOracle::simulate(const SimRequest &request,
                        MetricValues &measurements)
{
  makeWorkDir();
  string stem = settings_->workDir() + "/" + fileStem(request);
  string request_filename = stem + ".req";
  string listing_filename = stem + ".lis";
  if (settings_->runSim()) {
    writeRequest(request, request_filename.c_str());
    runSimulator(request, request_filename, listing_filename);
  }
  readMeasurements(listing_filename.c_str(), request, measurements);
  if (debug_->check("oracle", 2)) {
    for (const auto &[metric, value] : measurements)
      debug_->reportLine("oracle", "%s %s = %.6e",
                         stem.c_str(), metricName(metric), value);
  }
}

////////////////////////////////////////////////////////////////

static bool
isMetricName(const string &token,
             Metric metric)
{
  return stringEqual(token.c_str(), metricName(metric));
}

void
readMeasurements(std::istream &listing,
                 const SimRequest &request,
                 MetricValues &measurements)
{
  const MetricSeq &metrics = request.measurements();
  string line;
  while (getline(listing, line)) {
    if (line.find("failed") != string::npos
        || line.find("Error") != string::npos) {
      trimRight(line);
      throw SimulationFailure(request.slew, request.load, request.pass,
                              line.c_str());
    }
    for (char &ch : line) {
      if (ch == '=')
        ch = ' ';
    }
    StringSeq tokens;
    split(line, " \t\r", tokens);
    if (tokens.size() >= 2) {
      for (Metric metric : metrics) {
        if (isMetricName(tokens[0], metric)) {
          const char *value_str = tokens[1].c_str();
          char *end;
          double value = strtod(value_str, &end);
          if (end == value_str || *end != '\0' || !std::isfinite(value)) {
            string msg;
            stringPrint(msg, "%s value %s is not a number",
                        metricName(metric), value_str);
            throw SimulationFailure(request.slew, request.load, request.pass,
                                    msg.c_str());
          }
          measurements[metric] = value;
        }
      }
    }
  }
  for (Metric metric : metrics) {
    if (measurements.find(metric) == measurements.end()) {
      string msg;
      stringPrint(msg, "no %s measurement", metricName(metric));
      throw SimulationFailure(request.slew, request.load, request.pass,
                              msg.c_str());
    }
  }
}

void
readMeasurements(const char *listing_filename,
                 const SimRequest &request,
                 MetricValues &measurements)
{
  ifstream listing(listing_filename);
  if (listing.is_open())
    readMeasurements(listing, request, measurements);
  else {
    string msg;
    stringPrint(msg, "cannot read listing %s", listing_filename);
    throw SimulationFailure(request.slew, request.load, request.pass,
                            msg.c_str());
  }
}

} // namespace
