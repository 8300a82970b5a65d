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

#include "CellChar.hh"

#include <algorithm>

#include "Error.hh"
#include "CharError.hh"
#include "Report.hh"
#include "ReportStd.hh"
#include "Debug.hh"
#include "DispatchQueue.hh"
#include "CharSettings.hh"
#include "ProcessOracle.hh"
#include "SweepEngine.hh"
#include "MetricAggregator.hh"

namespace cchar {

CellChar *CellChar::cell_char_ = nullptr;

CellChar::CellChar() :
  CharState(),
  oracle_(nullptr),
  sweep_engine_(nullptr),
  metric_aggregator_(nullptr)
{
}

CellChar::~CellChar()
{
  for (auto &cell_harnesses : harnesses_)
    deleteHarnesses(cell_harnesses.second);
  for (CellTopology *cell : cells_)
    delete cell;
  delete metric_aggregator_;
  delete sweep_engine_;
  delete oracle_;
  delete settings_;
  delete debug_;
  delete report_;
  delete dispatch_queue_;
}

CellChar *
CellChar::cellChar()
{
  return cell_char_;
}

void
CellChar::setCellChar(CellChar *cell_char)
{
  cell_char_ = cell_char;
}

void
CellChar::makeComponents()
{
  makeReport();
  makeDebug();
  makeSettings();
  makeOracle();
  makeSweepEngine();
  makeMetricAggregator();
  setThreadCount1(1);
  updateComponentsState();
}

void
CellChar::makeReport()
{
  report_ = makeReportStd();
}

void
CellChar::makeDebug()
{
  debug_ = new Debug(report_);
}

void
CellChar::makeSettings()
{
  settings_ = new CharSettings;
}

void
CellChar::makeOracle()
{
  oracle_ = new ProcessOracle(this);
}

void
CellChar::makeSweepEngine()
{
  sweep_engine_ = new SweepEngine(this);
}

void
CellChar::makeMetricAggregator()
{
  metric_aggregator_ = new MetricAggregator(this);
}

void
CellChar::setThreadCount(int thread_count)
{
  setThreadCount1(thread_count);
  updateComponentsState();
}

void
CellChar::setThreadCount1(int thread_count)
{
  thread_count_ = thread_count;
  if (dispatch_queue_)
    dispatch_queue_->setThreadCount(thread_count);
  else if (thread_count > 1)
    dispatch_queue_ = new DispatchQueue(thread_count);
}

void
CellChar::updateComponentsState()
{
  CharState *oracle_state = dynamic_cast<CharState*>(oracle_);
  if (oracle_state)
    oracle_state->copyState(this);
  sweep_engine_->copyState(this);
  metric_aggregator_->copyState(this);
}

void
CellChar::setOracle(SimOracle *oracle)
{
  delete oracle_;
  oracle_ = oracle;
  updateComponentsState();
}

////////////////////////////////////////////////////////////////

CellTopology *
CellChar::makeCell(const char *name)
{
  if (findCell(name))
    report_->error(100, "cell %s is already defined.", name);
  CellTopology *cell = new CellTopology(name);
  cells_.push_back(cell);
  harnesses_[cell];
  return cell;
}

CellTopology *
CellChar::findCell(const char *name) const
{
  for (CellTopology *cell : cells_) {
    if (stringEq(cell->name(), name))
      return cell;
  }
  return nullptr;
}

CellTopology *
CellChar::currentCell() const
{
  if (cells_.empty())
    return nullptr;
  else
    return cells_.back();
}

Harness *
CellChar::addTestVector(CellTopology *cell,
                        const StringSeq &test_vector)
{
  HarnessSeq &harnesses = harnesses_[cell];
  for (const Harness *harness : harnesses) {
    if (harness->testVector() == test_vector)
      report_->error(101, "cell %s already has test vector [%s].",
                     cell->name(),
                     join(test_vector, " ").c_str());
  }
  Harness *harness = makeHarness(cell, test_vector);
  harnesses.push_back(harness);
  debugPrint(debug_, "harness", 1, "%s %s",
             cell->name(),
             harness->shortString().c_str());
  return harness;
}

const HarnessSeq &
CellChar::harnesses(const CellTopology *cell) const
{
  static const HarnessSeq empty;
  auto iter = harnesses_.find(cell);
  if (iter == harnesses_.end())
    return empty;
  else
    return iter->second;
}

Harness *
CellChar::findHarness(const CellTopology *cell,
                      size_t index) const
{
  const HarnessSeq &harnesses = this->harnesses(cell);
  if (index >= harnesses.size())
    report_->error(102, "cell %s has no harness %zu.", cell->name(), index);
  return harnesses[index];
}

void
CellChar::deleteHarnesses(HarnessSeq &harnesses)
{
  for (Harness *harness : harnesses)
    delete harness;
  harnesses.clear();
}

void
CellChar::rebuildHarnesses(const CellTopology *cell)
{
  HarnessSeq &harnesses = harnesses_[cell];
  HarnessSeq rebuilt;
  try {
    for (const Harness *harness : harnesses)
      rebuilt.push_back(makeHarness(cell, harness->testVector()));
  }
  catch (const Exception &) {
    deleteHarnesses(rebuilt);
    throw;
  }
  deleteHarnesses(harnesses);
  harnesses = rebuilt;
}

void
CellChar::characterize(CellTopology *cell)
{
  if (cell->slews().empty())
    report_->error(103, "cell %s has no slews.", cell->name());
  if (cell->loads().empty())
    report_->error(104, "cell %s has no loads.", cell->name());
  if (harnesses(cell).empty()) {
    report_->warn(105, "cell %s has no test vectors.", cell->name());
    return;
  }
  rebuildHarnesses(cell);
  const HarnessSeq &harnesses = this->harnesses(cell);
  report_->reportLine("characterize %s %zu harnesses %zux%zu grid",
                      cell->name(),
                      harnesses.size(),
                      cell->slews().size(),
                      cell->loads().size());
  for (Harness *harness : harnesses) {
    sweep_engine_->sweep(cell, harness, oracle_);
    metric_aggregator_->aggregate(harness);
    report_->reportLine("  %s delay avg %.4e max %.4e",
                        harness->arcString().c_str(),
                        harness->averagePropagationDelay(),
                        harness->maxPropagationDelay());
  }
  reportInputCapacitance(cell);
}

void
CellChar::characterize()
{
  for (CellTopology *cell : cells_)
    characterize(cell);
}

double
CellChar::inputCapacitance(const CellTopology *cell,
                           const char *pin) const
{
  double sum = 0.0;
  size_t count = 0;
  for (const Harness *harness : harnesses(cell)) {
    if (harness->targetInPort().pin() == pin) {
      sum += harness->averageInputCapacitance();
      count++;
    }
  }
  if (count == 0) {
    string msg;
    stringPrint(msg, "cell %s has no harness targeting %s.", cell->name(), pin);
    throw GridLookupError(LookupFailure::none_found, msg.c_str());
  }
  return sum / count;
}

void
CellChar::reportInputCapacitance(const CellTopology *cell) const
{
  StringSeq pins;
  for (const Harness *harness : harnesses(cell)) {
    const string &pin = harness->targetInPort().pin();
    if (std::find(pins.begin(), pins.end(), pin) == pins.end())
      pins.push_back(pin);
  }
  for (const string &pin : pins)
    report_->reportLine("  %s input capacitance %.4e",
                        pin.c_str(),
                        inputCapacitance(cell, pin.c_str()));
}

void
CellChar::reportHarnesses(const CellTopology *cell) const
{
  const HarnessSeq &harnesses = this->harnesses(cell);
  report_->reportLine("Cell %s %zu harnesses", cell->name(), harnesses.size());
  for (size_t i = 0; i < harnesses.size(); i++) {
    const Harness *harness = harnesses[i];
    report_->reportLine("%zu %s", i, harness->shortString().c_str());
    report_->reportLineString(harness->asString());
  }
}

void
CellChar::reportResults(const CellTopology *cell,
                        Metric metric) const
{
  for (const Harness *harness : harnesses(cell)) {
    const ResultTable &results = harness->results();
    report_->reportLine("%s %s", harness->arcString().c_str(), metricName(metric));
    string line = "slew\\load";
    for (size_t li = 0; li < results.loadCount(); li++)
      stringAppend(line, " %12s", results.loadKey(li).c_str());
    report_->reportLineString(line);
    for (size_t si = 0; si < results.slewCount(); si++) {
      line = stdstrPrint("%9s", results.slewKey(si).c_str());
      for (size_t li = 0; li < results.loadCount(); li++) {
        if (results.hasValue(si, li, metric))
          stringAppend(line, " %12.4e", results.value(si, li, metric));
        else
          stringAppend(line, " %12s", "-");
      }
      report_->reportLineString(line);
    }
  }
}

} // namespace
