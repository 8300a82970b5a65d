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
#include "ResultTable.hh"

namespace cchar {

class CellTopology;
class PinState;
class RiseFall;
class Harness;
class SequentialHarness;

typedef std::vector<Harness*> HarnessSeq;
typedef std::vector<const PinState*> PinStateSeq;

enum class HarnessKind { combinational, sequential };

// Timing check requested from a sequential harness.
enum class TimingCheckMode { hold, setup, recovery, removal, clock };

const char *
timingCheckModeName(TimingCheckMode mode);
// Return values.
void
findTimingCheckMode(const char *name,
                    TimingCheckMode &mode,
                    bool &exists);
// "hold setup recovery removal clock"
std::string
timingCheckModeNames();

// Expected state of one pin for a trial.
class PinBinding
{
public:
  PinBinding();
  PinBinding(const string &pin,
             const PinState *state);
  const string &pin() const { return pin_; }
  const PinState *state() const { return state_; }
  // rise/fall for transitions, nullptr for held levels.
  const RiseFall *direction() const;
  // The pin carries the transition that defines the arc.
  bool isTarget() const;
  // Unbound (optional pin the cell does not declare).
  bool isNull() const { return state_ == nullptr; }

private:
  string pin_;
  const PinState *state_;
};

typedef std::vector<PinBinding> PinBindingSeq;

// Characterization parameters for one arc through a cell.
// The target input and output are defined by the test vector passed
// to makeHarness. Pin bindings do not change after construction; the
// result table is filled in by the sweep.
class Harness
{
public:
  virtual ~Harness() {}
  virtual HarnessKind kind() const = 0;
  bool isSequential() const { return kind() == HarnessKind::sequential; }
  const char *cellName() const { return cell_name_.c_str(); }

  const PinBinding &targetInPort() const { return target_in_port_; }
  const PinBindingSeq &stableInPorts() const { return stable_in_ports_; }
  const PinBinding &targetOutPort() const { return target_out_port_; }
  const PinBindingSeq &nontargetOutPorts() const { return nontarget_out_ports_; }
  const RiseFall *inDirection() const;
  const RiseFall *outDirection() const;
  // positive_unate when the input and output move the same way.
  const char *timingSense() const;

  // A (rise) -> Y (fall)
  string arcString() const;
  // A=01 B=1 Y=10
  virtual string shortString() const;
  virtual string asString() const;
  // Test vector codes as given to makeHarness.
  const StringSeq &testVector() const { return test_vector_; }

  ResultTable &results() { return results_; }
  const ResultTable &results() const { return results_; }
  // Mean prop_in_out over the populated grid points.
  double averagePropagationDelay() const;
  // Worst case prop_in_out over the populated grid points.
  double maxPropagationDelay() const;
  // Mean input_capacitance over the grid.
  double averageInputCapacitance() const;

protected:
  Harness(const CellTopology *cell,
          const StringSeq &test_vector,
          const PinBinding &target_in_port,
          const PinBindingSeq &stable_in_ports,
          const PinBinding &target_out_port,
          const PinBindingSeq &nontarget_out_ports);
  string portsString() const;

  string cell_name_;
  StringSeq test_vector_;
  PinBinding target_in_port_;
  PinBindingSeq stable_in_ports_;
  PinBinding target_out_port_;
  PinBindingSeq nontarget_out_ports_;
  ResultTable results_;

  friend Harness *makeHarness(const CellTopology *cell,
                              const StringSeq &test_vector);
};

class CombinationalHarness : public Harness
{
public:
  HarnessKind kind() const override { return HarnessKind::combinational; }

protected:
  CombinationalHarness(const CellTopology *cell,
                       const StringSeq &test_vector,
                       const PinBinding &target_in_port,
                       const PinBindingSeq &stable_in_ports,
                       const PinBinding &target_out_port,
                       const PinBindingSeq &nontarget_out_ports);

  friend Harness *makeHarness(const CellTopology *cell,
                              const StringSeq &test_vector);
};

// Sequential test vectors are
//   [clock, reset?, set?, flop_state*, input*, output*]
// where reset and set are present only if the cell declares them.
// Exactly one of the data inputs, set or reset carries the target
// transition.
class SequentialHarness : public Harness
{
public:
  HarnessKind kind() const override { return HarnessKind::sequential; }
  const PinBinding &clock() const { return clock_; }
  // Null bindings when the cell has no set/reset.
  const PinBinding &set() const { return set_; }
  const PinBinding &reset() const { return reset_; }
  const RiseFall *setDirection() const;
  const RiseFall *resetDirection() const;
  const StringSeq &flops() const { return flops_; }
  const PinStateSeq &flopStates() const { return flop_states_; }
  // The target transition is on the set or reset pin.
  bool targetsSetReset() const;

  // Liberty timing_type for mode.
  // Throws ClassificationError when the pin roles do not support mode.
  string timingType(TimingCheckMode mode) const;
  string timingTypeHold() const;
  string timingTypeSetup() const;
  string timingTypeRecovery() const;
  string timingTypeRemoval() const;
  string timingTypeClock() const;
  // rise_constraint/fall_constraint
  string timingSenseConstraint() const;
  // Target pin name, negated for a falling target.
  string timingWhen() const;

  string shortString() const override;
  string asString() const override;

protected:
  SequentialHarness(const CellTopology *cell,
                    const StringSeq &test_vector,
                    const PinBinding &clock,
                    const PinBinding &reset,
                    const PinBinding &set,
                    const PinStateSeq &flop_states,
                    const PinBinding &target_in_port,
                    const PinBindingSeq &stable_in_ports,
                    const PinBinding &target_out_port,
                    const PinBindingSeq &nontarget_out_ports);

  PinBinding clock_;
  PinBinding set_;
  PinBinding reset_;
  StringSeq flops_;
  PinStateSeq flop_states_;

  friend Harness *makeHarness(const CellTopology *cell,
                              const StringSeq &test_vector);
};

// Parse test_vector against the ports of cell.
// Combinational cells get a CombinationalHarness, cells with a clock
// get a SequentialHarness.
// Throws MalformedTestVectorError for an arity mismatch, an unknown
// state code, or a missing or repeated target input or output.
// The caller owns the result.
Harness *
makeHarness(const CellTopology *cell,
            const StringSeq &test_vector);

// Harnesses whose target pins are in_port and out_port.
HarnessSeq
filterHarnessesByPorts(const HarnessSeq &harnesses,
                       const char *in_port,
                       const char *out_port);
// The single harness for the in_port -> out_port arc with out_direction.
// Throws GridLookupError when none or several match.
Harness *
findHarnessByArc(const HarnessSeq &harnesses,
                 const char *in_port,
                 const char *out_port,
                 const RiseFall *out_direction);
// Common timing sense of harnesses, non_unate if they disagree.
const char *
checkTimingSense(const HarnessSeq &harnesses);

} // namespace
