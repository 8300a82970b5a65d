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

#include "CharTcl.hh"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <map>

#include "Error.hh"
#include "CharError.hh"
#include "Report.hh"
#include "Debug.hh"
#include "Transition.hh"
#include "Metric.hh"
#include "CellTopology.hh"
#include "Harness.hh"
#include "CharSettings.hh"
#include "CellChar.hh"
#include "CharMain.hh"

namespace cchar {

typedef std::vector<Tcl_Obj*> TclObjSeq;
// Values following each -key.
typedef std::map<string, TclObjSeq> KeyArgMap;

// Command arguments, excluding the command name.
class CmdArgs
{
public:
  CmdArgs(Tcl_Interp *interp,
          int objc,
          Tcl_Obj *const objv[]);
  size_t size() const { return args_.size(); }
  const char *arg(size_t index) const;
  Tcl_Obj *obj(size_t index) const { return args_[index]; }
  double number(size_t index) const;
  size_t index(size_t index) const;
  // -key followed by one or more values, up to the next -key.
  // Return values.
  void keyArgs(const StringSeq &keys,
               KeyArgMap &key_args) const;

private:
  Tcl_Interp *interp_;
  std::vector<Tcl_Obj*> args_;
};

typedef void (*CharCmdFunc)(CellChar *cell_char,
                            const CmdArgs &args,
                            const char *setting,
                            Tcl_Interp *interp);

struct CharCmd
{
  const char *name;
  const char *usage;
  size_t min_args;
  size_t max_args;
  CharCmdFunc func;
};

// max_args of commands taking -key value runs.
static const size_t any_arg_count = std::numeric_limits<size_t>::max();

// ClientData of a defined command.
struct CharCmdBinding
{
  const CharCmd *cmd;
  CellChar *cell_char;
  // Setting name for set_<setting> commands.
  std::string setting;
  std::string name;
};

CmdArgs::CmdArgs(Tcl_Interp *interp,
                 int objc,
                 Tcl_Obj *const objv[]) :
  interp_(interp),
  args_(objv + 1, objv + objc)
{
}

const char *
CmdArgs::arg(size_t index) const
{
  return Tcl_GetString(args_[index]);
}

double
CmdArgs::number(size_t index) const
{
  double value;
  if (Tcl_GetDoubleFromObj(interp_, args_[index], &value) != TCL_OK)
    throw ExceptionMsg(stdstrPrint("%s is not a number.", arg(index)).c_str());
  return value;
}

size_t
CmdArgs::index(size_t index) const
{
  const char *arg = this->arg(index);
  if (isDigits(arg)) {
    errno = 0;
    unsigned long value = strtoul(arg, nullptr, 10);
    if (errno != ERANGE
        && value <= static_cast<unsigned long>(std::numeric_limits<int>::max()))
      return value;
  }
  throw ExceptionMsg(stdstrPrint("%s is not a positive integer.", arg).c_str());
}

void
CmdArgs::keyArgs(const StringSeq &keys,
                 KeyArgMap &key_args) const
{
  const char *key = nullptr;
  TclObjSeq *values = nullptr;
  for (size_t i = 0; i < args_.size(); i++) {
    const char *arg = this->arg(i);
    if (arg[0] == '-' && isalpha(static_cast<unsigned char>(arg[1]))) {
      if (std::find(keys.begin(), keys.end(), arg) == keys.end())
        throw ExceptionMsg(stdstrPrint("unknown key %s.", arg).c_str());
      if (key && values->empty())
        throw ExceptionMsg(stdstrPrint("%s is missing a value.", key).c_str());
      key = arg;
      values = &key_args[key];
      values->clear();
    }
    else if (key)
      values->push_back(args_[i]);
    else
      throw ExceptionMsg(stdstrPrint("unknown key %s.", arg).c_str());
  }
  if (key && values->empty())
    throw ExceptionMsg(stdstrPrint("%s is missing a value.", key).c_str());
}

StringSeq
tclListStringSeq(Tcl_Obj *source,
                 Tcl_Interp *interp)
{
  Tcl_Size argc;
  Tcl_Obj **argv;
  if (Tcl_ListObjGetElements(interp, source, &argc, &argv) != TCL_OK)
    throw ExceptionMsg(stdstrPrint("%s is not a list.",
                                   Tcl_GetString(source)).c_str());
  StringSeq seq;
  for (Tcl_Size i = 0; i < argc; i++)
    seq.push_back(Tcl_GetString(argv[i]));
  return seq;
}

FloatSeq
tclListFloatSeq(Tcl_Obj *source,
                Tcl_Interp *interp)
{
  Tcl_Size argc;
  Tcl_Obj **argv;
  if (Tcl_ListObjGetElements(interp, source, &argc, &argv) != TCL_OK)
    throw ExceptionMsg(stdstrPrint("%s is not a list.",
                                   Tcl_GetString(source)).c_str());
  FloatSeq seq;
  for (Tcl_Size i = 0; i < argc; i++) {
    double value;
    if (Tcl_GetDoubleFromObj(interp, argv[i], &value) != TCL_OK)
      throw ExceptionMsg(stdstrPrint("%s is not a number.",
                                     Tcl_GetString(argv[i])).c_str());
    seq.push_back(value);
  }
  return seq;
}

static void
setResult(Tcl_Interp *interp,
          const std::string &result)
{
  Tcl_SetObjResult(interp, Tcl_NewStringObj(result.c_str(), result.size()));
}

static const TclObjSeq &
requiredKey(const KeyArgMap &key_args,
            const char *key,
            const char *cmd)
{
  auto iter = key_args.find(key);
  if (iter == key_args.end())
    throw ExceptionMsg(stdstrPrint("%s requires %s.", cmd, key).c_str());
  return iter->second;
}

static const TclObjSeq *
optionalKey(const KeyArgMap &key_args,
            const char *key)
{
  auto iter = key_args.find(key);
  if (iter == key_args.end())
    return nullptr;
  else
    return &iter->second;
}

static const char *
keyValue(const TclObjSeq &values,
         const char *key)
{
  if (values.size() != 1)
    throw ExceptionMsg(stdstrPrint("%s takes one value.", key).c_str());
  return Tcl_GetString(values[0]);
}

// Each value may itself be a list.
static StringSeq
keyList(const TclObjSeq &values,
        Tcl_Interp *interp)
{
  StringSeq seq;
  for (Tcl_Obj *value : values) {
    for (const string &elt : tclListStringSeq(value, interp))
      seq.push_back(elt);
  }
  return seq;
}

static CellTopology *
currentCell(CellChar *cell_char)
{
  CellTopology *cell = cell_char->currentCell();
  if (cell == nullptr)
    throw ExceptionMsg("no cell defined. Use add_cell or add_flop first.");
  return cell;
}

static CellTopology *
findCell(CellChar *cell_char,
         const char *name)
{
  CellTopology *cell = cell_char->findCell(name);
  if (cell == nullptr)
    throw ExceptionMsg(stdstrPrint("cell %s not found.", name).c_str());
  return cell;
}

static Metric
findMetricArg(const char *name)
{
  Metric metric;
  bool exists;
  findMetric(name, metric, exists);
  if (!exists)
    throw ExceptionMsg(stdstrPrint("unknown metric %s. Use one of %s.",
                                   name, metricNames().c_str()).c_str());
  return metric;
}

////////////////////////////////////////////////////////////////

static void
setSettingCmd(CellChar *cell_char,
              const CmdArgs &args,
              const char *setting,
              Tcl_Interp *)
{
  cell_char->settings()->setValue(setting, args.arg(0));
}

static void
getSettingCmd(CellChar *cell_char,
              const CmdArgs &args,
              const char *,
              Tcl_Interp *interp)
{
  setResult(interp, cell_char->settings()->value(args.arg(0)));
}

static void
setThreadCountCmd(CellChar *cell_char,
                  const CmdArgs &args,
                  const char *,
                  Tcl_Interp *)
{
  const char *arg = args.arg(0);
  int thread_count;
  if (!parseThreadCount(arg, thread_count))
    throw ExceptionMsg(stdstrPrint("thread count must be max or 1 to %d.",
                                   max_thread_count).c_str());
  cell_char->setThreadCount(thread_count);
}

static void
setDebugCmd(CellChar *cell_char,
            const CmdArgs &args,
            const char *,
            Tcl_Interp *)
{
  cell_char->debug()->setLevel(args.arg(0),
                               static_cast<int>(args.index(1)));
}

static void
logBeginCmd(CellChar *cell_char,
            const CmdArgs &args,
            const char *,
            Tcl_Interp *)
{
  cell_char->report()->logBegin(args.arg(0));
}

static void
logEndCmd(CellChar *cell_char,
          const CmdArgs &,
          const char *,
          Tcl_Interp *)
{
  cell_char->report()->logEnd();
}

static void
addCellPorts(CellTopology *cell,
             const KeyArgMap &key_args,
             const char *cmd,
             Tcl_Interp *interp)
{
  for (const string &port : keyList(requiredKey(key_args, "-i", cmd), interp))
    cell->addInPort(port.c_str());
  for (const string &port : keyList(requiredKey(key_args, "-o", cmd), interp))
    cell->addOutPort(port.c_str());
  const TclObjSeq *logic = optionalKey(key_args, "-l");
  if (logic)
    cell->setLogic(keyValue(*logic, "-l"));
  const TclObjSeq *functions = optionalKey(key_args, "-f");
  if (functions) {
    for (const string &function : keyList(*functions, interp))
      cell->addFunction(function.c_str());
  }
}

static void
addCellCmd(CellChar *cell_char,
           const CmdArgs &args,
           const char *,
           Tcl_Interp *interp)
{
  KeyArgMap key_args;
  args.keyArgs({"-n", "-l", "-i", "-o", "-f"}, key_args);
  const char *name = keyValue(requiredKey(key_args, "-n", "add_cell"), "-n");
  // Check the arguments before the cell is made.
  requiredKey(key_args, "-i", "add_cell");
  requiredKey(key_args, "-o", "add_cell");
  const TclObjSeq *logic = optionalKey(key_args, "-l");
  if (logic)
    keyValue(*logic, "-l");
  CellTopology *cell = cell_char->makeCell(name);
  addCellPorts(cell, key_args, "add_cell", interp);
}

static void
addFlopCmd(CellChar *cell_char,
           const CmdArgs &args,
           const char *,
           Tcl_Interp *interp)
{
  KeyArgMap key_args;
  args.keyArgs({"-n", "-l", "-i", "-c", "-s", "-r", "-o", "-q", "-f"},
               key_args);
  const char *name = keyValue(requiredKey(key_args, "-n", "add_flop"), "-n");
  requiredKey(key_args, "-i", "add_flop");
  requiredKey(key_args, "-o", "add_flop");
  const char *clock = keyValue(requiredKey(key_args, "-c", "add_flop"), "-c");
  const TclObjSeq *set = optionalKey(key_args, "-s");
  const char *set_pin = set ? keyValue(*set, "-s") : nullptr;
  const TclObjSeq *reset = optionalKey(key_args, "-r");
  const char *reset_pin = reset ? keyValue(*reset, "-r") : nullptr;
  const TclObjSeq *logic = optionalKey(key_args, "-l");
  if (logic)
    keyValue(*logic, "-l");
  CellTopology *cell = cell_char->makeCell(name);
  addCellPorts(cell, key_args, "add_flop", interp);
  cell->setClock(clock);
  if (set_pin)
    cell->setSet(set_pin);
  if (reset_pin)
    cell->setReset(reset_pin);
  const TclObjSeq *flops = optionalKey(key_args, "-q");
  if (flops) {
    for (const string &flop : keyList(*flops, interp))
      cell->addFlop(flop.c_str());
  }
}

static void
addSlopeCmd(CellChar *cell_char,
            const CmdArgs &args,
            const char *,
            Tcl_Interp *interp)
{
  currentCell(cell_char)->setSlews(tclListFloatSeq(args.obj(0), interp));
}

static void
addLoadCmd(CellChar *cell_char,
           const CmdArgs &args,
           const char *,
           Tcl_Interp *interp)
{
  currentCell(cell_char)->setLoads(tclListFloatSeq(args.obj(0), interp));
}

static void
addNetlistCmd(CellChar *cell_char,
              const CmdArgs &args,
              const char *,
              Tcl_Interp *)
{
  currentCell(cell_char)->setNetlist(args.arg(0));
}

static void
addModelCmd(CellChar *cell_char,
            const CmdArgs &args,
            const char *,
            Tcl_Interp *)
{
  currentCell(cell_char)->setModel(args.arg(0));
}

static void
addSimulationTimestepCmd(CellChar *cell_char,
                         const CmdArgs &args,
                         const char *,
                         Tcl_Interp *)
{
  CellTopology *cell = currentCell(cell_char);
  if (stringEqual(args.arg(0), "auto"))
    cell->setSimTimestepAuto();
  else
    cell->setSimTimestep(args.number(0));
}

static void
addTestVectorCmd(CellChar *cell_char,
                 const CmdArgs &args,
                 const char *,
                 Tcl_Interp *interp)
{
  CellTopology *cell = currentCell(cell_char);
  cell_char->addTestVector(cell, tclListStringSeq(args.obj(0), interp));
}

static void
characterizeCmd(CellChar *cell_char,
                const CmdArgs &args,
                const char *,
                Tcl_Interp *)
{
  if (args.size() == 1)
    cell_char->characterize(findCell(cell_char, args.arg(0)));
  else
    cell_char->characterize();
}

static void
reportHarnessesCmd(CellChar *cell_char,
                   const CmdArgs &args,
                   const char *,
                   Tcl_Interp *)
{
  if (args.size() == 1)
    cell_char->reportHarnesses(findCell(cell_char, args.arg(0)));
  else {
    for (const CellTopology *cell : cell_char->cells())
      cell_char->reportHarnesses(cell);
  }
}

static void
reportResultsCmd(CellChar *cell_char,
                 const CmdArgs &args,
                 const char *,
                 Tcl_Interp *)
{
  CellTopology *cell = findCell(cell_char, args.arg(0));
  Metric metric = (args.size() == 2)
    ? findMetricArg(args.arg(1))
    : Metric::prop_in_out;
  cell_char->reportResults(cell, metric);
}

static void
findHarnessCmd(CellChar *cell_char,
               const CmdArgs &args,
               const char *,
               Tcl_Interp *interp)
{
  CellTopology *cell = findCell(cell_char, args.arg(0));
  const RiseFall *out_rf = RiseFall::find(args.arg(3));
  if (out_rf == nullptr)
    throw ExceptionMsg(stdstrPrint("direction %s is not rise or fall.",
                                   args.arg(3)).c_str());
  Harness *harness = findHarnessByArc(cell_char->harnesses(cell),
                                      args.arg(1),
                                      args.arg(2),
                                      out_rf);
  setResult(interp, harness->shortString());
}

static void
getTimingTypeCmd(CellChar *cell_char,
                 const CmdArgs &args,
                 const char *,
                 Tcl_Interp *interp)
{
  CellTopology *cell = findCell(cell_char, args.arg(0));
  size_t index = args.index(1);
  const Harness *harness = cell_char->findHarness(cell, index);
  const SequentialHarness *seq = dynamic_cast<const SequentialHarness*>(harness);
  if (seq == nullptr)
    throw ExceptionMsg(stdstrPrint("harness %zu of cell %s is not sequential.",
                                   index, cell->name()).c_str());
  TimingCheckMode mode;
  bool exists;
  findTimingCheckMode(args.arg(2), mode, exists);
  if (!exists)
    throw ExceptionMsg(stdstrPrint("unknown timing check mode %s. Use one of %s.",
                                   args.arg(2),
                                   timingCheckModeNames().c_str()).c_str());
  setResult(interp, seq->timingType(mode));
}

static void
getResultCmd(CellChar *cell_char,
             const CmdArgs &args,
             const char *,
             Tcl_Interp *interp)
{
  CellTopology *cell = findCell(cell_char, args.arg(0));
  const Harness *harness = cell_char->findHarness(cell, args.index(1));
  float slew = args.number(2);
  float load = args.number(3);
  Metric metric = findMetricArg(args.arg(4));
  double value = harness->results().findValue(slew, load, metric);
  Tcl_SetObjResult(interp, Tcl_NewDoubleObj(value));
}

static void
getInputCapacitanceCmd(CellChar *cell_char,
                       const CmdArgs &args,
                       const char *,
                       Tcl_Interp *interp)
{
  CellTopology *cell = findCell(cell_char, args.arg(0));
  double cap = cell_char->inputCapacitance(cell, args.arg(1));
  Tcl_SetObjResult(interp, Tcl_NewDoubleObj(cap));
}

////////////////////////////////////////////////////////////////

static const CharCmd set_setting_cmd =
  {"set_", "value", 1, 1, setSettingCmd};

static const CharCmd char_cmds[] = {
  {"get_setting", "name", 1, 1, getSettingCmd},
  {"set_thread_count", "count|max", 1, 1, setThreadCountCmd},
  {"set_debug", "what level", 2, 2, setDebugCmd},
  {"log_begin", "filename", 1, 1, logBeginCmd},
  {"log_end", "", 0, 0, logEndCmd},
  {"add_cell", "-n name -i inputs -o outputs [-l logic] [-f functions]",
   4, any_arg_count, addCellCmd},
  {"add_flop", "-n name -i inputs -c clock [-s set] [-r reset] -o outputs "
   "[-q flops] [-l logic] [-f functions]", 6, any_arg_count, addFlopCmd},
  {"add_slope", "slews", 1, 1, addSlopeCmd},
  {"add_load", "loads", 1, 1, addLoadCmd},
  {"add_netlist", "filename", 1, 1, addNetlistCmd},
  {"add_model", "filename", 1, 1, addModelCmd},
  {"add_simulation_timestep", "auto|timestep", 1, 1, addSimulationTimestepCmd},
  {"add_test_vector", "codes", 1, 1, addTestVectorCmd},
  {"characterize", "[cell]", 0, 1, characterizeCmd},
  {"report_harnesses", "[cell]", 0, 1, reportHarnessesCmd},
  {"report_results", "cell [metric]", 1, 2, reportResultsCmd},
  {"find_harness", "cell in_pin out_pin rise|fall", 4, 4, findHarnessCmd},
  {"get_timing_type", "cell harness_index mode", 3, 3, getTimingTypeCmd},
  {"get_result", "cell harness_index slew load metric", 5, 5, getResultCmd},
  {"get_input_capacitance", "cell pin", 2, 2, getInputCapacitanceCmd}
};

extern "C" {

static int
charCmdProc(ClientData client_data,
            Tcl_Interp *interp,
            int objc,
            Tcl_Obj *const objv[])
{
  const CharCmdBinding *binding = static_cast<CharCmdBinding*>(client_data);
  const CharCmd *cmd = binding->cmd;
  CmdArgs args(interp, objc, objv);
  if (args.size() < cmd->min_args
      || args.size() > cmd->max_args) {
    string msg;
    stringPrint(msg, "usage: %s %s", binding->name.c_str(), cmd->usage);
    setResult(interp, msg);
    return TCL_ERROR;
  }
  try {
    Tcl_ResetResult(interp);
    cmd->func(binding->cell_char, args, binding->setting.c_str(), interp);
    return TCL_OK;
  }
  catch (const Exception &error) {
    setResult(interp, error.what());
    return TCL_ERROR;
  }
}

static void
charCmdDelete(ClientData client_data)
{
  delete static_cast<CharCmdBinding*>(client_data);
}

} // extern "C"

static void
defineCharCommand(Tcl_Interp *interp,
                  const CharCmd *cmd,
                  const std::string &name,
                  const std::string &setting,
                  CellChar *cell_char)
{
  CharCmdBinding *binding = new CharCmdBinding{cmd, cell_char, setting, name};
  Tcl_CreateObjCommand(interp, name.c_str(), charCmdProc, binding, charCmdDelete);
}

void
defineCharCommands(Tcl_Interp *interp,
                   CellChar *cell_char)
{
  for (const string &setting : CharSettings::names())
    defineCharCommand(interp, &set_setting_cmd,
                      set_setting_cmd.name + setting,
                      setting, cell_char);
  for (const CharCmd &cmd : char_cmds)
    defineCharCommand(interp, &cmd, cmd.name, "", cell_char);
}

} // namespace
