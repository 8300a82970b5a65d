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

#include <map>
#include <string>

#include "StringUtil.hh"
#include "Metric.hh"
#include "CellTopology.hh"
#include "Harness.hh"
#include "CharState.hh"

namespace cchar {

class SimOracle;
class SweepEngine;
class MetricAggregator;

typedef std::map<const CellTopology*, HarnessSeq> CellHarnessMap;

// Characterization session.
// Owns the cells under characterization, their harnesses and the
// components that sweep them.
class CellChar : public CharState
{
public:
  CellChar();
  virtual ~CellChar();
  // Singleton used by the Tcl commands.
  static CellChar *cellChar();
  static void setCellChar(CellChar *cell_char);
  // Make the report, debug, settings and engine components.
  virtual void makeComponents();
  void setThreadCount(int thread_count);
  // Replaces the oracle used by characterize and takes ownership.
  void setOracle(SimOracle *oracle);
  SimOracle *oracle() const { return oracle_; }

  CellTopology *makeCell(const char *name);
  CellTopology *findCell(const char *name) const;
  // Most recently added cell, nullptr if there are none.
  CellTopology *currentCell() const;
  const CellTopologySeq &cells() const { return cells_; }

  // Build the harness for test_vector on cell.
  Harness *addTestVector(CellTopology *cell,
                         const StringSeq &test_vector);
  const HarnessSeq &harnesses(const CellTopology *cell) const;
  // Harness by position in test vector order.
  Harness *findHarness(const CellTopology *cell,
                       size_t index) const;

  // Sweep and aggregate every harness of cell.
  // Harnesses are rebuilt from their test vectors first so they pick up
  // the current slews and loads of the cell.
  void characterize(CellTopology *cell);
  // Characterize every cell.
  void characterize();
  // Mean of the average input capacitance of the harnesses targeting pin.
  double inputCapacitance(const CellTopology *cell,
                          const char *pin) const;

  void reportHarnesses(const CellTopology *cell) const;
  void reportResults(const CellTopology *cell,
                     Metric metric) const;

protected:
  virtual void makeReport();
  virtual void makeDebug();
  virtual void makeSettings();
  virtual void makeOracle();
  virtual void makeSweepEngine();
  virtual void makeMetricAggregator();
  void setThreadCount1(int thread_count);
  void updateComponentsState();
  void rebuildHarnesses(const CellTopology *cell);
  void reportInputCapacitance(const CellTopology *cell) const;
  void deleteHarnesses(HarnessSeq &harnesses);

  CellTopologySeq cells_;
  CellHarnessMap harnesses_;
  SimOracle *oracle_;
  SweepEngine *sweep_engine_;
  MetricAggregator *metric_aggregator_;

  static CellChar *cell_char_;
};

} // namespace
