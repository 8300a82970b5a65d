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

#include "Error.hh"
#include "StringUtil.hh"

namespace cchar {

// Test vector arity mismatch, unknown state code, or a missing or
// duplicated target pin.
class MalformedTestVectorError : public Exception
{
public:
  MalformedTestVectorError(const StringSeq &test_vector,
                           const char *reason);
  const char *what() const noexcept override;
  const StringSeq &testVector() const { return test_vector_; }
  const string &reason() const { return reason_; }

private:
  StringSeq test_vector_;
  string reason_;
  string what_;
};

// Timing check mode is inconsistent with the harness pin roles.
class ClassificationError : public Exception
{
public:
  ClassificationError(const char *mode,
                      const char *harness);
  const char *what() const noexcept override;
  const string &mode() const { return mode_; }

private:
  string mode_;
  string what_;
};

// Oracle invocation failed or returned an unusable measurement listing.
// Slew and load are the declared grid values of the failing point.
class SimulationFailure : public Exception
{
public:
  SimulationFailure(float slew,
                    float load,
                    int pass,
                    const char *msg);
  const char *what() const noexcept override;
  float slew() const { return slew_; }
  float load() const { return load_; }
  // 1 = windowing pass, 2 = measurement pass.
  int pass() const { return pass_; }
  const string &msg() const { return msg_; }

private:
  float slew_;
  float load_;
  int pass_;
  string msg_;
  string what_;
};

enum class LookupFailure { none_found, ambiguous };

// Lookup that must match exactly one result table entry or harness.
class GridLookupError : public Exception
{
public:
  GridLookupError(LookupFailure failure,
                  const char *msg);
  const char *what() const noexcept override;
  LookupFailure failure() const { return failure_; }

private:
  LookupFailure failure_;
  string what_;
};

} // namespace
