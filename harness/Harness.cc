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

#include "Harness.hh"

#include <algorithm>

#include "EnumNameMap.hh"
#include "Error.hh"
#include "CharError.hh"
#include "Transition.hh"
#include "PinState.hh"
#include "CellTopology.hh"

namespace cchar {

static EnumNameMap<TimingCheckMode> timing_check_mode_names =
  {{TimingCheckMode::hold, "hold"},
   {TimingCheckMode::setup, "setup"},
   {TimingCheckMode::recovery, "recovery"},
   {TimingCheckMode::removal, "removal"},
   {TimingCheckMode::clock, "clock"}
  };

const char *
timingCheckModeName(TimingCheckMode mode)
{
  return timing_check_mode_names.find(mode);
}

void
findTimingCheckMode(const char *name,
                    TimingCheckMode &mode,
                    bool &exists)
{
  timing_check_mode_names.find(name, mode, exists);
}

std::string
timingCheckModeNames()
{
  return timing_check_mode_names.names(" ");
}

////////////////////////////////////////////////////////////////

PinBinding::PinBinding() :
  state_(nullptr)
{
}

PinBinding::PinBinding(const string &pin,
                       const PinState *state) :
  pin_(pin),
  state_(state)
{
}

const RiseFall *
PinBinding::direction() const
{
  return state_ ? state_->direction() : nullptr;
}

bool
PinBinding::isTarget() const
{
  return state_ && state_->isTransition();
}

////////////////////////////////////////////////////////////////

Harness::Harness(const CellTopology *cell,
                 const StringSeq &test_vector,
                 const PinBinding &target_in_port,
                 const PinBindingSeq &stable_in_ports,
                 const PinBinding &target_out_port,
                 const PinBindingSeq &nontarget_out_ports) :
  cell_name_(cell->name()),
  test_vector_(test_vector),
  target_in_port_(target_in_port),
  stable_in_ports_(stable_in_ports),
  target_out_port_(target_out_port),
  nontarget_out_ports_(nontarget_out_ports),
  results_(cell->slews(), cell->loads())
{
}

const RiseFall *
Harness::inDirection() const
{
  return target_in_port_.direction();
}

const RiseFall *
Harness::outDirection() const
{
  return target_out_port_.direction();
}

const char *
Harness::timingSense() const
{
  if (inDirection() == outDirection())
    return "positive_unate";
  else
    return "negative_unate";
}

string
Harness::arcString() const
{
  return stdstrPrint("%s (%s) -> %s (%s)",
                     target_in_port_.pin().c_str(),
                     riseFallName(inDirection()),
                     target_out_port_.pin().c_str(),
                     riseFallName(outDirection()));
}

static void
appendBinding(string &str,
              const PinBinding &binding)
{
  if (!str.empty())
    str += ' ';
  stringAppend(str, "%s=%s",
               binding.pin().c_str(),
               binding.state()->code().c_str());
}

string
Harness::portsString() const
{
  string str;
  appendBinding(str, target_in_port_);
  for (const PinBinding &binding : stable_in_ports_)
    appendBinding(str, binding);
  appendBinding(str, target_out_port_);
  for (const PinBinding &binding : nontarget_out_ports_)
    appendBinding(str, binding);
  return str;
}

string
Harness::shortString() const
{
  return portsString();
}

string
Harness::asString() const
{
  string str = "Arc Under Test: " + arcString();
  if (!stable_in_ports_.empty()) {
    str += "\n    Stable Input Ports:";
    for (const PinBinding &binding : stable_in_ports_)
      stringAppend(str, "\n        %s: %s",
                   binding.pin().c_str(),
                   binding.state()->code().c_str());
  }
  if (!nontarget_out_ports_.empty()) {
    str += "\n    Nontarget Output Ports:";
    for (const PinBinding &binding : nontarget_out_ports_)
      stringAppend(str, "\n        %s: %s",
                   binding.pin().c_str(),
                   binding.state()->code().c_str());
  }
  return str;
}

double
Harness::averagePropagationDelay() const
{
  double sum = 0.0;
  size_t count = 0;
  for (size_t si = 0; si < results_.slewCount(); si++) {
    for (size_t li = 0; li < results_.loadCount(); li++) {
      if (results_.hasValue(si, li, Metric::prop_in_out)) {
        sum += results_.value(si, li, Metric::prop_in_out);
        count++;
      }
    }
  }
  if (count == 0)
    throw GridLookupError(LookupFailure::none_found,
                          stdstrPrint("harness %s has no propagation delay results.",
                                      shortString().c_str()).c_str());
  return sum / count;
}

double
Harness::maxPropagationDelay() const
{
  double max_delay = 0.0;
  bool found = false;
  for (size_t si = 0; si < results_.slewCount(); si++) {
    for (size_t li = 0; li < results_.loadCount(); li++) {
      if (results_.hasValue(si, li, Metric::prop_in_out)) {
        double delay = results_.value(si, li, Metric::prop_in_out);
        if (!found || delay > max_delay)
          max_delay = delay;
        found = true;
      }
    }
  }
  if (!found)
    throw GridLookupError(LookupFailure::none_found,
                          stdstrPrint("harness %s has no propagation delay results.",
                                      shortString().c_str()).c_str());
  return max_delay;
}

double
Harness::averageInputCapacitance() const
{
  if (results_.size() == 0)
    throw GridLookupError(LookupFailure::none_found,
                          stdstrPrint("harness %s has an empty result table.",
                                      shortString().c_str()).c_str());
  double sum = 0.0;
  for (size_t si = 0; si < results_.slewCount(); si++) {
    for (size_t li = 0; li < results_.loadCount(); li++)
      sum += results_.value(si, li, Metric::input_capacitance);
  }
  return sum / results_.size();
}

////////////////////////////////////////////////////////////////

CombinationalHarness::CombinationalHarness(const CellTopology *cell,
                                           const StringSeq &test_vector,
                                           const PinBinding &target_in_port,
                                           const PinBindingSeq &stable_in_ports,
                                           const PinBinding &target_out_port,
                                           const PinBindingSeq &nontarget_out_ports) :
  Harness(cell, test_vector, target_in_port, stable_in_ports,
          target_out_port, nontarget_out_ports)
{
}

////////////////////////////////////////////////////////////////

SequentialHarness::SequentialHarness(const CellTopology *cell,
                                     const StringSeq &test_vector,
                                     const PinBinding &clock,
                                     const PinBinding &reset,
                                     const PinBinding &set,
                                     const PinStateSeq &flop_states,
                                     const PinBinding &target_in_port,
                                     const PinBindingSeq &stable_in_ports,
                                     const PinBinding &target_out_port,
                                     const PinBindingSeq &nontarget_out_ports) :
  Harness(cell, test_vector, target_in_port, stable_in_ports,
          target_out_port, nontarget_out_ports),
  clock_(clock),
  set_(set),
  reset_(reset),
  flops_(cell->flops()),
  flop_states_(flop_states)
{
}

const RiseFall *
SequentialHarness::setDirection() const
{
  return set_.direction();
}

const RiseFall *
SequentialHarness::resetDirection() const
{
  return reset_.direction();
}

bool
SequentialHarness::targetsSetReset() const
{
  return setDirection() || resetDirection();
}

string
SequentialHarness::timingType(TimingCheckMode mode) const
{
  const RiseFall *in_rf = inDirection();
  if (targetsSetReset()) {
    switch (mode) {
    case TimingCheckMode::recovery:
      return stdstrPrint("recovery_%s", in_rf->edgeName());
    case TimingCheckMode::removal:
      // Removal labels the opposite edge of recovery.
      return stdstrPrint("removal_%s", in_rf->opposite()->edgeName());
    default:
      break;
    }
  }
  else if (std::find(flops_.begin(), flops_.end(), target_in_port_.pin())
           == flops_.end()) {
    switch (mode) {
    case TimingCheckMode::clock:
      if (clock_.state() == PinState::pulse0101())
        return "falling_edge";
      else
        return "rising_edge";
    case TimingCheckMode::hold:
    case TimingCheckMode::setup:
      return stdstrPrint("%s_%s", timingCheckModeName(mode), in_rf->edgeName());
    default:
      break;
    }
  }
  throw ClassificationError(timingCheckModeName(mode), shortString().c_str());
}

string
SequentialHarness::timingTypeHold() const
{
  return timingType(TimingCheckMode::hold);
}

string
SequentialHarness::timingTypeSetup() const
{
  return timingType(TimingCheckMode::setup);
}

string
SequentialHarness::timingTypeRecovery() const
{
  return timingType(TimingCheckMode::recovery);
}

string
SequentialHarness::timingTypeRemoval() const
{
  return timingType(TimingCheckMode::removal);
}

string
SequentialHarness::timingTypeClock() const
{
  return timingType(TimingCheckMode::clock);
}

string
SequentialHarness::timingSenseConstraint() const
{
  return stdstrPrint("%s_constraint", inDirection()->name());
}

string
SequentialHarness::timingWhen() const
{
  if (inDirection() == RiseFall::rise())
    return target_in_port_.pin();
  else
    return "!" + target_in_port_.pin();
}

string
SequentialHarness::shortString() const
{
  string str;
  appendBinding(str, clock_);
  str += ' ';
  str += portsString();
  // The target set/reset already leads the port list.
  if (!set_.isNull() && !set_.isTarget())
    appendBinding(str, set_);
  if (!reset_.isNull() && !reset_.isTarget())
    appendBinding(str, reset_);
  for (size_t i = 0; i < flops_.size(); i++)
    appendBinding(str, PinBinding(flops_[i], flop_states_[i]));
  return str;
}

string
SequentialHarness::asString() const
{
  string str = Harness::asString();
  stringAppend(str, "\n    Clock: %s: %s",
               clock_.pin().c_str(),
               clock_.state()->code().c_str());
  if (!set_.isNull())
    stringAppend(str, "\n    Set: %s: %s",
                 set_.pin().c_str(),
                 set_.state()->code().c_str());
  if (!reset_.isNull())
    stringAppend(str, "\n    Reset: %s: %s",
                 reset_.pin().c_str(),
                 reset_.state()->code().c_str());
  if (!flops_.empty()) {
    str += "\n    Flop States:";
    for (size_t i = 0; i < flops_.size(); i++)
      stringAppend(str, "\n        %s: %s",
                   flops_[i].c_str(),
                   flop_states_[i]->code().c_str());
  }
  return str;
}

////////////////////////////////////////////////////////////////

static const PinState *
findState(const StringSeq &test_vector,
          const string &code,
          const string &pin)
{
  const PinState *state = PinState::find(code.c_str());
  if (state == nullptr) {
    string reason;
    stringPrint(reason, "unknown state code \"%s\" for %s",
                code.c_str(), pin.c_str());
    throw MalformedTestVectorError(test_vector, reason.c_str());
  }
  return state;
}

// Clock pulse patterns are only meaningful on the clock pin.
static const PinState *
findPinState(const StringSeq &test_vector,
             const string &code,
             const string &pin)
{
  const PinState *state = findState(test_vector, code, pin);
  if (state->isPulse()) {
    string reason;
    stringPrint(reason, "clock pulse code \"%s\" on non-clock pin %s",
                code.c_str(), pin.c_str());
    throw MalformedTestVectorError(test_vector, reason.c_str());
  }
  return state;
}

static void
bindPorts(const StringSeq &test_vector,
          const StringSeq &ports,
          StringSeq::const_iterator &code_iter,
          const char *side,
          // Return values.
          PinBinding &target,
          PinBindingSeq &stable)
{
  for (const string &port : ports) {
    PinBinding binding(port, findPinState(test_vector, *code_iter++, port));
    if (binding.isTarget()) {
      if (!target.isNull()) {
        string reason;
        stringPrint(reason, "more than one target %s (%s and %s)",
                    side, target.pin().c_str(), port.c_str());
        throw MalformedTestVectorError(test_vector, reason.c_str());
      }
      target = binding;
    }
    else
      stable.push_back(binding);
  }
}

static void
checkArity(const StringSeq &test_vector,
           size_t expected)
{
  if (test_vector.size() != expected) {
    string reason;
    stringPrint(reason, "expected %zu entries, found %zu",
                expected, test_vector.size());
    throw MalformedTestVectorError(test_vector, reason.c_str());
  }
}

Harness *
makeHarness(const CellTopology *cell,
            const StringSeq &test_vector)
{
  size_t data_count = cell->inPorts().size() + cell->outPorts().size();
  StringSeq::const_iterator code_iter = test_vector.begin();
  PinBinding clock, reset, set;
  PinStateSeq flop_states;
  if (cell->isSequential()) {
    checkArity(test_vector, 1 + cell->hasReset() + cell->hasSet()
               + cell->flops().size() + data_count);
    clock = PinBinding(cell->clock(),
                       findState(test_vector, *code_iter++, cell->clock()));
    if (cell->hasReset())
      reset = PinBinding(cell->reset(),
                         findPinState(test_vector, *code_iter++, cell->reset()));
    if (cell->hasSet())
      set = PinBinding(cell->set(),
                       findPinState(test_vector, *code_iter++, cell->set()));
    for (const string &flop : cell->flops())
      flop_states.push_back(findPinState(test_vector, *code_iter++, flop));
  }
  else
    checkArity(test_vector, data_count);

  PinBinding target_in, target_out;
  PinBindingSeq stable_ins, nontarget_outs;
  bindPorts(test_vector, cell->inPorts(), code_iter, "input",
            target_in, stable_ins);
  bindPorts(test_vector, cell->outPorts(), code_iter, "output",
            target_out, nontarget_outs);
  if (target_out.isNull())
    throw MalformedTestVectorError(test_vector, "no target output transition");

  if (cell->isSequential()) {
    // A transition on set or reset replaces the data input target.
    for (const PinBinding *set_reset : {&reset, &set}) {
      if (set_reset->isTarget()) {
        if (!target_in.isNull()) {
          string reason;
          stringPrint(reason, "more than one target input (%s and %s)",
                      target_in.pin().c_str(), set_reset->pin().c_str());
          throw MalformedTestVectorError(test_vector, reason.c_str());
        }
        target_in = *set_reset;
      }
    }
    if (target_in.isNull())
      throw MalformedTestVectorError(test_vector,
                                     "no target transition on a data input, set or reset");
    return new SequentialHarness(cell, test_vector, clock, reset, set,
                                 flop_states, target_in, stable_ins,
                                 target_out, nontarget_outs);
  }
  else {
    if (target_in.isNull())
      throw MalformedTestVectorError(test_vector, "no target input transition");
    return new CombinationalHarness(cell, test_vector, target_in, stable_ins,
                                    target_out, nontarget_outs);
  }
}

} // namespace
