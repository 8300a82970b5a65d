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

#include "StringUtil.hh"

namespace cchar {

class CellTopology;

typedef std::vector<CellTopology*> CellTopologySeq;

// Ports and sweep ranges of a cell under characterization.
// Harnesses read the topology when they are built and keep no
// reference to it, so a harness must be rebuilt if the cell changes.
class CellTopology
{
public:
  explicit CellTopology(const char *name);
  const char *name() const { return name_.c_str(); }

  // Ordered data input ports (excluding clock, set and reset).
  const StringSeq &inPorts() const { return in_ports_; }
  void addInPort(const char *port_name);
  const StringSeq &outPorts() const { return out_ports_; }
  void addOutPort(const char *port_name);
  bool hasPort(const char *port_name) const;

  // Sequential cells declare a clock.
  bool isSequential() const { return !clock_.empty(); }
  const string &clock() const { return clock_; }
  void setClock(const char *port_name);
  bool hasSet() const { return !set_.empty(); }
  const string &set() const { return set_; }
  void setSet(const char *port_name);
  bool hasReset() const { return !reset_.empty(); }
  const string &reset() const { return reset_; }
  void setReset(const char *port_name);
  // Internal storage nodes in declaration order.
  const StringSeq &flops() const { return flops_; }
  void addFlop(const char *flop_name);
  bool isFlop(const string &name) const;

  // Normalized input slews, multiplied by the time unit and the
  // logic threshold window to find the stimulus ramp.
  const FloatSeq &slews() const { return slews_; }
  void setSlews(const FloatSeq &slews);
  // Output loads in capacitance units.
  const FloatSeq &loads() const { return loads_; }
  void setLoads(const FloatSeq &loads);

  const string &logic() const { return logic_; }
  void setLogic(const char *logic);
  const StringSeq &functions() const { return functions_; }
  void addFunction(const char *function);
  const string &netlist() const { return netlist_; }
  void setNetlist(const char *filename);
  const string &model() const { return model_; }
  void setModel(const char *filename);

  // Simulation timestep in seconds.
  // The auto timestep is 1/10 of the smallest declared slew.
  float simTimestep(float time_unit) const;
  bool simTimestepAuto() const { return sim_timestep_auto_; }
  void setSimTimestepAuto();
  // Timestep in time units.
  void setSimTimestep(float timestep);

protected:
  void checkPortName(const char *port_name);

  string name_;
  StringSeq in_ports_;
  StringSeq out_ports_;
  string clock_;
  string set_;
  string reset_;
  StringSeq flops_;
  FloatSeq slews_;
  FloatSeq loads_;
  string logic_;
  StringSeq functions_;
  string netlist_;
  string model_;
  bool sim_timestep_auto_;
  float sim_timestep_;
};

} // namespace
