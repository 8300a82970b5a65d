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

#include "Metric.hh"

#include "EnumNameMap.hh"

namespace cchar {

static EnumNameMap<Metric> metric_names =
  {{Metric::prop_in_out, "prop_in_out"},
   {Metric::trans_out, "trans_out"},
   {Metric::energy_start, "energy_start"},
   {Metric::energy_end, "energy_end"},
   {Metric::q_in_dyn, "q_in_dyn"},
   {Metric::q_out_dyn, "q_out_dyn"},
   {Metric::q_vdd_dyn, "q_vdd_dyn"},
   {Metric::q_vss_dyn, "q_vss_dyn"},
   {Metric::i_in_leak, "i_in_leak"},
   {Metric::i_vdd_leak, "i_vdd_leak"},
   {Metric::i_vss_leak, "i_vss_leak"},
   {Metric::internal_energy, "internal_energy"},
   {Metric::input_energy, "input_energy"},
   {Metric::input_capacitance, "input_capacitance"},
   {Metric::leakage_power, "leakage_power"}
  };

const char *
metricName(Metric metric)
{
  return metric_names.find(metric);
}

void
findMetric(const char *name,
           Metric &metric,
           bool &exists)
{
  metric_names.find(name, metric, exists);
}

std::string
metricNames()
{
  return metric_names.names(" ");
}

const MetricSeq &
windowPassMetrics()
{
  static const MetricSeq metrics = {Metric::prop_in_out,
                                    Metric::trans_out,
                                    Metric::energy_start,
                                    Metric::energy_end};
  return metrics;
}

const MetricSeq &
measurePassMetrics()
{
  static const MetricSeq metrics = {Metric::prop_in_out,
                                    Metric::trans_out,
                                    Metric::q_in_dyn,
                                    Metric::q_out_dyn,
                                    Metric::q_vdd_dyn,
                                    Metric::q_vss_dyn,
                                    Metric::i_in_leak,
                                    Metric::i_vdd_leak,
                                    Metric::i_vss_leak};
  return metrics;
}

const MetricSeq &
rawMetrics()
{
  static const MetricSeq metrics = {Metric::prop_in_out,
                                    Metric::trans_out,
                                    Metric::energy_start,
                                    Metric::energy_end,
                                    Metric::q_in_dyn,
                                    Metric::q_out_dyn,
                                    Metric::q_vdd_dyn,
                                    Metric::q_vss_dyn,
                                    Metric::i_in_leak,
                                    Metric::i_vdd_leak,
                                    Metric::i_vss_leak};
  return metrics;
}

const MetricSeq &
derivedMetrics()
{
  static const MetricSeq metrics = {Metric::internal_energy,
                                    Metric::input_energy,
                                    Metric::input_capacitance,
                                    Metric::leakage_power};
  return metrics;
}

} // namespace
