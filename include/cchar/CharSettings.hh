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

#include "StringUtil.hh"

namespace cchar {

// Characterization settings.
// Every setting is also reachable by name (vdd_voltage, time_unit, ...)
// for the set_<name> commands.
class CharSettings
{
public:
  CharSettings();

  const string &vddName() const { return vdd_name_; }
  void setVddName(const char *name);
  const string &vssName() const { return vss_name_; }
  void setVssName(const char *name);
  const string &pwellName() const { return pwell_name_; }
  void setPwellName(const char *name);
  const string &nwellName() const { return nwell_name_; }
  void setNwellName(const char *name);
  // Rail voltages in volts.
  float vddVoltage() const { return vdd_voltage_; }
  void setVddVoltage(float voltage);
  float vssVoltage() const { return vss_voltage_; }
  void setVssVoltage(float voltage);
  float pwellVoltage() const { return pwell_voltage_; }
  void setPwellVoltage(float voltage);
  float nwellVoltage() const { return nwell_voltage_; }
  void setNwellVoltage(float voltage);
  // Celsius.
  float temperature() const { return temperature_; }
  void setTemperature(float temperature);

  // Thresholds are fractions of the vdd voltage.
  float logicThresholdHigh() const { return logic_threshold_high_; }
  void setLogicThresholdHigh(float threshold);
  float logicThresholdLow() const { return logic_threshold_low_; }
  void setLogicThresholdLow(float threshold);
  float logicHighToLowThreshold() const { return logic_high_to_low_threshold_; }
  void setLogicHighToLowThreshold(float threshold);
  float logicLowToHighThreshold() const { return logic_low_to_high_threshold_; }
  void setLogicLowToHighThreshold(float threshold);
  float energyMeasLowThreshold() const { return energy_meas_low_threshold_; }
  void setEnergyMeasLowThreshold(float threshold);
  float energyMeasHighThreshold() const { return energy_meas_high_threshold_; }
  void setEnergyMeasHighThreshold(float threshold);
  float energyMeasLowThresholdVoltage() const;
  float energyMeasHighThresholdVoltage() const;
  // Charge integration ends at energy_end times the extent.
  float energyMeasTimeExtent() const { return energy_meas_time_extent_; }
  void setEnergyMeasTimeExtent(float extent);
  // Scale internal energy by the energy measurement high threshold.
  bool energyScaleByThreshold() const { return energy_scale_by_threshold_; }
  void setEnergyScaleByThreshold(bool scale);
  // Ramp duration per unit of normalized slew,
  // 1 / (logic_threshold_high - logic_threshold_low).
  float slewMagnitude() const;

  // Seconds per time unit.
  float timeUnit() const { return time_unit_; }
  void setTimeUnit(float scale);
  // Farads per capacitance unit.
  float capacitanceUnit() const { return capacitance_unit_; }
  void setCapacitanceUnit(float scale);

  const string &workDir() const { return work_dir_; }
  void setWorkDir(const char *dir);
  const string &simulator() const { return simulator_; }
  void setSimulator(const char *simulator);
  // Run the simulator, or reuse listings from a previous run.
  bool runSim() const { return run_sim_; }
  void setRunSim(bool run);
  // Simulate grid points concurrently.
  bool mtSim() const { return mt_sim_; }
  void setMtSim(bool mt);

  // Setting names in command order.
  static const StringSeq &names();
  static bool isName(const char *name);
  // Set by name from command text.
  // Throws ExceptionMsg for an unknown name or an unusable value.
  void setValue(const char *name,
                const char *value);
  string value(const char *name) const;

private:
  string vdd_name_;
  string vss_name_;
  string pwell_name_;
  string nwell_name_;
  float vdd_voltage_;
  float vss_voltage_;
  float pwell_voltage_;
  float nwell_voltage_;
  float temperature_;
  float logic_threshold_high_;
  float logic_threshold_low_;
  float logic_high_to_low_threshold_;
  float logic_low_to_high_threshold_;
  float energy_meas_low_threshold_;
  float energy_meas_high_threshold_;
  float energy_meas_time_extent_;
  bool energy_scale_by_threshold_;
  float time_unit_;
  float capacitance_unit_;
  string work_dir_;
  string simulator_;
  bool run_sim_;
  bool mt_sim_;
};

// Parse a unit scale such as "ns", "10ps", "pF" or "1e-12".
// unit_suffix is the base unit symbol ("s", "F").
// Throws ExceptionMsg if str is not a positive scale.
float
parseUnitScale(const char *str,
               const char *unit_suffix);

} // namespace
