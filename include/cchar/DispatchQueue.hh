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

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace cchar {

// Worker thread pool.
// Tasks run in dispatch order on the first free worker and are passed
// the index of that worker. Tasks must not throw.
class DispatchQueue
{
public:
  typedef std::function<void(int thread_index)> Task;

  explicit DispatchQueue(size_t thread_count);
  ~DispatchQueue();
  // Waits for running tasks before the workers are replaced.
  void setThreadCount(size_t thread_count);
  size_t getThreadCount() const { return threads_.size(); }
  void dispatch(Task task);
  // Block until every dispatched task has returned.
  void finishTasks();

  DispatchQueue(const DispatchQueue &) = delete;
  DispatchQueue &operator=(const DispatchQueue &) = delete;

private:
  void startWorkers(size_t thread_count);
  void stopWorkers();
  void runWorker(int thread_index);

  std::mutex lock_;
  std::condition_variable task_ready_;
  std::condition_variable tasks_done_;
  std::vector<std::thread> threads_;
  std::queue<Task> tasks_;
  // Queued plus running tasks.
  size_t pending_count_;
  bool stopping_;
};

} // namespace
