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

#include "CharSettings.hh"

#include <cstdlib>
#include <cmath>

#include "Error.hh"

namespace cchar {

CharSettings::CharSettings() :
  vdd_name_("VDD"),
  vss_name_("VSS"),
  pwell_name_("VPW"),
  nwell_name_("VNW"),
  vdd_voltage_(3.3),
  vss_voltage_(0.0),
  pwell_voltage_(0.0),
  nwell_voltage_(3.3),
  temperature_(25.0),
  logic_threshold_high_(0.8),
  logic_threshold_low_(0.2),
  logic_high_to_low_threshold_(0.5),
  logic_low_to_high_threshold_(0.5),
  energy_meas_low_threshold_(0.01),
  energy_meas_high_threshold_(0.99),
  energy_meas_time_extent_(10.0),
  energy_scale_by_threshold_(false),
  time_unit_(1e-9),
  capacitance_unit_(1e-12),
  work_dir_("work"),
  simulator_("ngspice"),
  run_sim_(true),
  mt_sim_(true)
{
}

static void
checkName(const char *setting,
          const char *name)
{
  if (name == nullptr || name[0] == '\0')
    throw ExceptionMsg(stdstrPrint("%s must not be empty.", setting).c_str());
}

static void
checkFraction(const char *setting,
              float threshold)
{
  if (!(threshold > 0.0 && threshold < 1.0))
    throw ExceptionMsg(stdstrPrint("%s %g must be between 0 and 1.",
                                   setting, threshold).c_str());
}

static void
checkPositive(const char *setting,
              float value)
{
  if (!(value > 0.0))
    throw ExceptionMsg(stdstrPrint("%s %g must be positive.",
                                   setting, value).c_str());
}

void
CharSettings::setVddName(const char *name)
{
  checkName("vdd_name", name);
  vdd_name_ = name;
}

void
CharSettings::setVssName(const char *name)
{
  checkName("vss_name", name);
  vss_name_ = name;
}

void
CharSettings::setPwellName(const char *name)
{
  checkName("pwell_name", name);
  pwell_name_ = name;
}

void
CharSettings::setNwellName(const char *name)
{
  checkName("nwell_name", name);
  nwell_name_ = name;
}

void
CharSettings::setVddVoltage(float voltage)
{
  checkPositive("vdd_voltage", voltage);
  vdd_voltage_ = voltage;
}

void
CharSettings::setVssVoltage(float voltage)
{
  vss_voltage_ = voltage;
}

void
CharSettings::setPwellVoltage(float voltage)
{
  pwell_voltage_ = voltage;
}

void
CharSettings::setNwellVoltage(float voltage)
{
  nwell_voltage_ = voltage;
}

void
CharSettings::setTemperature(float temperature)
{
  temperature_ = temperature;
}

void
CharSettings::setLogicThresholdHigh(float threshold)
{
  checkFraction("logic_threshold_high", threshold);
  logic_threshold_high_ = threshold;
}

void
CharSettings::setLogicThresholdLow(float threshold)
{
  checkFraction("logic_threshold_low", threshold);
  logic_threshold_low_ = threshold;
}

void
CharSettings::setLogicHighToLowThreshold(float threshold)
{
  checkFraction("logic_high_to_low_threshold", threshold);
  logic_high_to_low_threshold_ = threshold;
}

void
CharSettings::setLogicLowToHighThreshold(float threshold)
{
  checkFraction("logic_low_to_high_threshold", threshold);
  logic_low_to_high_threshold_ = threshold;
}

void
CharSettings::setEnergyMeasLowThreshold(float threshold)
{
  checkFraction("energy_meas_low_threshold", threshold);
  energy_meas_low_threshold_ = threshold;
}

void
CharSettings::setEnergyMeasHighThreshold(float threshold)
{
  checkFraction("energy_meas_high_threshold", threshold);
  energy_meas_high_threshold_ = threshold;
}

float
CharSettings::energyMeasLowThresholdVoltage() const
{
  return energy_meas_low_threshold_ * vdd_voltage_;
}

float
CharSettings::energyMeasHighThresholdVoltage() const
{
  return energy_meas_high_threshold_ * vdd_voltage_;
}

void
CharSettings::setEnergyMeasTimeExtent(float extent)
{
  checkPositive("energy_meas_time_extent", extent);
  energy_meas_time_extent_ = extent;
}

void
CharSettings::setEnergyScaleByThreshold(bool scale)
{
  energy_scale_by_threshold_ = scale;
}

float
CharSettings::slewMagnitude() const
{
  if (logic_threshold_high_ <= logic_threshold_low_)
    throw ExceptionMsg(stdstrPrint("logic_threshold_high %g must be above logic_threshold_low %g.",
                                   logic_threshold_high_,
                                   logic_threshold_low_).c_str());
  return 1.0 / (logic_threshold_high_ - logic_threshold_low_);
}

void
CharSettings::setTimeUnit(float scale)
{
  checkPositive("time_unit", scale);
  time_unit_ = scale;
}

void
CharSettings::setCapacitanceUnit(float scale)
{
  checkPositive("capacitance_unit", scale);
  capacitance_unit_ = scale;
}

void
CharSettings::setWorkDir(const char *dir)
{
  checkName("work_dir", dir);
  work_dir_ = dir;
}

void
CharSettings::setSimulator(const char *simulator)
{
  checkName("simulator", simulator);
  simulator_ = simulator;
}

void
CharSettings::setRunSim(bool run)
{
  run_sim_ = run;
}

void
CharSettings::setMtSim(bool mt)
{
  mt_sim_ = mt;
}

////////////////////////////////////////////////////////////////

const StringSeq &
CharSettings::names()
{
  static const StringSeq names = {
    "vdd_name", "vss_name", "pwell_name", "nwell_name",
    "vdd_voltage", "vss_voltage", "pwell_voltage", "nwell_voltage",
    "temperature",
    "logic_threshold_high", "logic_threshold_low",
    "logic_high_to_low_threshold", "logic_low_to_high_threshold",
    "energy_meas_low_threshold", "energy_meas_high_threshold",
    "energy_meas_time_extent", "energy_scale_by_threshold",
    "time_unit", "capacitance_unit",
    "work_dir", "simulator", "run_sim", "mt_sim"
  };
  return names;
}

bool
CharSettings::isName(const char *name)
{
  for (const string &setting : names()) {
    if (setting == name)
      return true;
  }
  return false;
}

static float
parseFloat(const char *name,
           const char *value)
{
  char *end;
  float number = strtof(value, &end);
  if (end == value || *end != '\0' || !std::isfinite(number))
    throw ExceptionMsg(stdstrPrint("%s value %s is not a number.",
                                   name, value).c_str());
  return number;
}

static bool
parseBool(const char *name,
          const char *value)
{
  if (stringEqual(value, "true")
      || stringEqual(value, "yes")
      || stringEq(value, "1"))
    return true;
  else if (stringEqual(value, "false")
           || stringEqual(value, "no")
           || stringEq(value, "0"))
    return false;
  else
    throw ExceptionMsg(stdstrPrint("%s value %s is not true or false.",
                                   name, value).c_str());
}

void
CharSettings::setValue(const char *name,
                       const char *value)
{
  if (stringEq(name, "vdd_name"))
    setVddName(value);
  else if (stringEq(name, "vss_name"))
    setVssName(value);
  else if (stringEq(name, "pwell_name"))
    setPwellName(value);
  else if (stringEq(name, "nwell_name"))
    setNwellName(value);
  else if (stringEq(name, "vdd_voltage"))
    setVddVoltage(parseFloat(name, value));
  else if (stringEq(name, "vss_voltage"))
    setVssVoltage(parseFloat(name, value));
  else if (stringEq(name, "pwell_voltage"))
    setPwellVoltage(parseFloat(name, value));
  else if (stringEq(name, "nwell_voltage"))
    setNwellVoltage(parseFloat(name, value));
  else if (stringEq(name, "temperature"))
    setTemperature(parseFloat(name, value));
  else if (stringEq(name, "logic_threshold_high"))
    setLogicThresholdHigh(parseFloat(name, value));
  else if (stringEq(name, "logic_threshold_low"))
    setLogicThresholdLow(parseFloat(name, value));
  else if (stringEq(name, "logic_high_to_low_threshold"))
    setLogicHighToLowThreshold(parseFloat(name, value));
  else if (stringEq(name, "logic_low_to_high_threshold"))
    setLogicLowToHighThreshold(parseFloat(name, value));
  else if (stringEq(name, "energy_meas_low_threshold"))
    setEnergyMeasLowThreshold(parseFloat(name, value));
  else if (stringEq(name, "energy_meas_high_threshold"))
    setEnergyMeasHighThreshold(parseFloat(name, value));
  else if (stringEq(name, "energy_meas_time_extent"))
    setEnergyMeasTimeExtent(parseFloat(name, value));
  else if (stringEq(name, "energy_scale_by_threshold"))
    setEnergyScaleByThreshold(parseBool(name, value));
  else if (stringEq(name, "time_unit"))
    setTimeUnit(parseUnitScale(value, "s"));
  else if (stringEq(name, "capacitance_unit"))
    setCapacitanceUnit(parseUnitScale(value, "F"));
  else if (stringEq(name, "work_dir"))
    setWorkDir(value);
  else if (stringEq(name, "simulator"))
    setSimulator(value);
  else if (stringEq(name, "run_sim"))
    setRunSim(parseBool(name, value));
  else if (stringEq(name, "mt_sim"))
    setMtSim(parseBool(name, value));
  else
    throw ExceptionMsg(stdstrPrint("unknown setting %s.", name).c_str());
}

static string
boolString(bool value)
{
  return value ? "true" : "false";
}

string
CharSettings::value(const char *name) const
{
  if (stringEq(name, "vdd_name"))
    return vdd_name_;
  else if (stringEq(name, "vss_name"))
    return vss_name_;
  else if (stringEq(name, "pwell_name"))
    return pwell_name_;
  else if (stringEq(name, "nwell_name"))
    return nwell_name_;
  else if (stringEq(name, "vdd_voltage"))
    return stdstrPrint("%g", vdd_voltage_);
  else if (stringEq(name, "vss_voltage"))
    return stdstrPrint("%g", vss_voltage_);
  else if (stringEq(name, "pwell_voltage"))
    return stdstrPrint("%g", pwell_voltage_);
  else if (stringEq(name, "nwell_voltage"))
    return stdstrPrint("%g", nwell_voltage_);
  else if (stringEq(name, "temperature"))
    return stdstrPrint("%g", temperature_);
  else if (stringEq(name, "logic_threshold_high"))
    return stdstrPrint("%g", logic_threshold_high_);
  else if (stringEq(name, "logic_threshold_low"))
    return stdstrPrint("%g", logic_threshold_low_);
  else if (stringEq(name, "logic_high_to_low_threshold"))
    return stdstrPrint("%g", logic_high_to_low_threshold_);
  else if (stringEq(name, "logic_low_to_high_threshold"))
    return stdstrPrint("%g", logic_low_to_high_threshold_);
  else if (stringEq(name, "energy_meas_low_threshold"))
    return stdstrPrint("%g", energy_meas_low_threshold_);
  else if (stringEq(name, "energy_meas_high_threshold"))
    return stdstrPrint("%g", energy_meas_high_threshold_);
  else if (stringEq(name, "energy_meas_time_extent"))
    return stdstrPrint("%g", energy_meas_time_extent_);
  else if (stringEq(name, "energy_scale_by_threshold"))
    return boolString(energy_scale_by_threshold_);
  else if (stringEq(name, "time_unit"))
    return stdstrPrint("%g", time_unit_);
  else if (stringEq(name, "capacitance_unit"))
    return stdstrPrint("%g", capacitance_unit_);
  else if (stringEq(name, "work_dir"))
    return work_dir_;
  else if (stringEq(name, "simulator"))
    return simulator_;
  else if (stringEq(name, "run_sim"))
    return boolString(run_sim_);
  else if (stringEq(name, "mt_sim"))
    return boolString(mt_sim_);
  else
    throw ExceptionMsg(stdstrPrint("unknown setting %s.", name).c_str());
}

////////////////////////////////////////////////////////////////

static double
siPrefixScale(char prefix,
              bool &exists)
{
  exists = true;
  switch (prefix) {
  case 'f': return 1e-15;
  case 'p': return 1e-12;
  case 'n': return 1e-9;
  case 'u': return 1e-6;
  case 'm': return 1e-3;
  case 'k': return 1e+3;
  case 'M': return 1e+6;
  case 'G': return 1e+9;
  default:
    exists = false;
    return 1.0;
  }
}

float
parseUnitScale(const char *str,
               const char *unit_suffix)
{
  char *end;
  double number = strtod(str, &end);
  if (end == str)
    number = 1.0;
  string unit(end);
  double scale = 1.0;
  size_t suffix_length = strlen(unit_suffix);
  if (!unit.empty()) {
    bool unit_ok = false;
    if (unit.size() >= suffix_length
        && stringEqual(unit.c_str() + unit.size() - suffix_length, unit_suffix)) {
      string prefix = unit.substr(0, unit.size() - suffix_length);
      if (prefix.empty())
        unit_ok = true;
      else if (prefix.size() == 1) {
        bool exists;
        scale = siPrefixScale(prefix[0], exists);
        unit_ok = exists;
      }
    }
    if (!unit_ok)
      throw ExceptionMsg(stdstrPrint("unit %s is not a scaled %s unit.",
                                     str, unit_suffix).c_str());
  }
  double unit_scale = number * scale;
  if (!(unit_scale > 0.0))
    throw ExceptionMsg(stdstrPrint("unit %s must be positive.", str).c_str());
  return unit_scale;
}

} // namespace
