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

#include "CellTopology.hh"

#include <algorithm>

#include "Error.hh"

namespace cchar {

static void
checkSweepValues(const char *cell_name,
                 const char *what,
                 const FloatSeq &values);

CellTopology::CellTopology(const char *name) :
  name_(name),
  sim_timestep_auto_(true),
  sim_timestep_(0.0)
{
}

void
CellTopology::checkPortName(const char *port_name)
{
  if (hasPort(port_name)) {
    string msg;
    stringPrint(msg, "cell %s port %s is declared more than once.",
                name_.c_str(), port_name);
    throw ExceptionMsg(msg.c_str());
  }
}

bool
CellTopology::hasPort(const char *port_name) const
{
  return std::find(in_ports_.begin(), in_ports_.end(), port_name) != in_ports_.end()
    || std::find(out_ports_.begin(), out_ports_.end(), port_name) != out_ports_.end()
    || clock_ == port_name
    || set_ == port_name
    || reset_ == port_name;
}

void
CellTopology::addInPort(const char *port_name)
{
  checkPortName(port_name);
  in_ports_.push_back(port_name);
}

void
CellTopology::addOutPort(const char *port_name)
{
  checkPortName(port_name);
  out_ports_.push_back(port_name);
}

void
CellTopology::setClock(const char *port_name)
{
  checkPortName(port_name);
  clock_ = port_name;
}

void
CellTopology::setSet(const char *port_name)
{
  checkPortName(port_name);
  set_ = port_name;
}

void
CellTopology::setReset(const char *port_name)
{
  checkPortName(port_name);
  reset_ = port_name;
}

void
CellTopology::addFlop(const char *flop_name)
{
  flops_.push_back(flop_name);
}

bool
CellTopology::isFlop(const string &name) const
{
  return std::find(flops_.begin(), flops_.end(), name) != flops_.end();
}

void
CellTopology::setSlews(const FloatSeq &slews)
{
  checkSweepValues(name_.c_str(), "slew", slews);
  slews_ = slews;
}

void
CellTopology::setLoads(const FloatSeq &loads)
{
  checkSweepValues(name_.c_str(), "load", loads);
  loads_ = loads;
}

// Grid keys are the declared values, so they must be unique.
static void
checkSweepValues(const char *cell_name,
                 const char *what,
                 const FloatSeq &values)
{
  for (size_t i = 0; i < values.size(); i++) {
    float value = values[i];
    if (value <= 0.0) {
      string msg;
      stringPrint(msg, "cell %s %s %g must be positive.",
                  cell_name, what, value);
      throw ExceptionMsg(msg.c_str());
    }
    for (size_t j = 0; j < i; j++) {
      if (values[j] == value) {
        string msg;
        stringPrint(msg, "cell %s %s %g is declared more than once.",
                    cell_name, what, value);
        throw ExceptionMsg(msg.c_str());
      }
    }
  }
}

void
CellTopology::setLogic(const char *logic)
{
  logic_ = logic;
}

void
CellTopology::addFunction(const char *function)
{
  functions_.push_back(function);
}

void
CellTopology::setNetlist(const char *filename)
{
  netlist_ = filename;
}

void
CellTopology::setModel(const char *filename)
{
  model_ = filename;
}

float
CellTopology::simTimestep(float time_unit) const
{
  if (sim_timestep_auto_) {
    if (slews_.empty())
      return 0.0;
    float min_slew = *std::min_element(slews_.begin(), slews_.end());
    return min_slew * time_unit / 10.0;
  }
  else
    return sim_timestep_ * time_unit;
}

void
CellTopology::setSimTimestepAuto()
{
  sim_timestep_auto_ = true;
  sim_timestep_ = 0.0;
}

void
CellTopology::setSimTimestep(float timestep)
{
  sim_timestep_auto_ = false;
  sim_timestep_ = timestep;
}

} // namespace
