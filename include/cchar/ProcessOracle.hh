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

#include <istream>

#include "StringUtil.hh"
#include "CharState.hh"
#include "SimOracle.hh"

namespace cchar {

// Oracle that runs the configured simulator as an external process.
// Each invocation writes a request file of "key = value" lines to the
// work directory, runs
//   <simulator> <request> 1> <listing> 2> /dev/null
// and reads the requested measurements back from the listing.
// With run_sim off the listing of a previous run is read instead.
class ProcessOracle : public SimOracle, public CharState
{
public:
  explicit ProcessOracle(const CharState *state);
  void simulate(const SimRequest &request,
                // Return values.
                MetricValues &measurements) override;
  // Work directory file name stem for a request.
  string fileStem(const SimRequest &request) const;
  void writeRequest(const SimRequest &request,
                    const char *filename) const;

protected:
  void makeWorkDir() const;
  void runSimulator(const SimRequest &request,
                    const string &request_filename,
                    const string &listing_filename) const;
};

// Read the measurements requested by request from a simulator listing.
// A line containing "failed" or "Error" fails the simulation. '=' is a
// separator; a line whose first token names a measurement (ignoring case)
// supplies its value in the next token.
// Throws SimulationFailure for a failure line, a missing measurement or
// a value that is not a number.
void
readMeasurements(std::istream &listing,
                 const SimRequest &request,
                 // Return values.
                 MetricValues &measurements);
void
readMeasurements(const char *listing_filename,
                 const SimRequest &request,
                 // Return values.
                 MetricValues &measurements);

} // namespace
