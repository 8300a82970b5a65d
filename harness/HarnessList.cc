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

#include "CharError.hh"
#include "Transition.hh"

namespace cchar {

HarnessSeq
filterHarnessesByPorts(const HarnessSeq &harnesses,
                       const char *in_port,
                       const char *out_port)
{
  HarnessSeq matches;
  for (Harness *harness : harnesses) {
    if (harness->targetInPort().pin() == in_port
        && harness->targetOutPort().pin() == out_port)
      matches.push_back(harness);
  }
  return matches;
}

Harness *
findHarnessByArc(const HarnessSeq &harnesses,
                 const char *in_port,
                 const char *out_port,
                 const RiseFall *out_direction)
{
  Harness *match = nullptr;
  size_t match_count = 0;
  for (Harness *harness : filterHarnessesByPorts(harnesses, in_port, out_port)) {
    if (harness->outDirection() == out_direction) {
      if (match == nullptr)
        match = harness;
      match_count++;
    }
  }
  if (match_count == 1)
    return match;
  string msg;
  if (match_count == 0) {
    stringPrint(msg, "no harness for arc %s -> %s (%s).",
                in_port, out_port, riseFallName(out_direction));
    throw GridLookupError(LookupFailure::none_found, msg.c_str());
  }
  else {
    stringPrint(msg, "%zu harnesses for arc %s -> %s (%s).",
                match_count, in_port, out_port, riseFallName(out_direction));
    throw GridLookupError(LookupFailure::ambiguous, msg.c_str());
  }
}

const char *
checkTimingSense(const HarnessSeq &harnesses)
{
  if (harnesses.empty())
    throw GridLookupError(LookupFailure::none_found,
                          "no harnesses to check timing sense.");
  const char *sense = harnesses[0]->timingSense();
  for (const Harness *harness : harnesses) {
    if (!stringEq(harness->timingSense(), sense))
      return "non_unate";
  }
  return sense;
}

} // namespace
