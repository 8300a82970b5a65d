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

#include "DispatchQueue.hh"

namespace cchar {

DispatchQueue::DispatchQueue(size_t thread_count) :
  pending_count_(0),
  stopping_(false)
{
  startWorkers(thread_count);
}

DispatchQueue::~DispatchQueue()
{
  stopWorkers();
}

void
DispatchQueue::setThreadCount(size_t thread_count)
{
  finishTasks();
  stopWorkers();
  startWorkers(thread_count);
}

void
DispatchQueue::startWorkers(size_t thread_count)
{
  stopping_ = false;
  for (size_t i = 0; i < thread_count; i++)
    threads_.emplace_back(&DispatchQueue::runWorker, this, static_cast<int>(i));
}

void
DispatchQueue::stopWorkers()
{
  {
    std::lock_guard<std::mutex> lock(lock_);
    stopping_ = true;
  }
  task_ready_.notify_all();
  for (std::thread &thread : threads_) {
    if (thread.joinable())
      thread.join();
  }
  threads_.clear();
}

void
DispatchQueue::dispatch(Task task)
{
  {
    std::lock_guard<std::mutex> lock(lock_);
    tasks_.push(std::move(task));
    pending_count_++;
  }
  task_ready_.notify_one();
}

void
DispatchQueue::finishTasks()
{
  std::unique_lock<std::mutex> lock(lock_);
  tasks_done_.wait(lock, [this] { return pending_count_ == 0; });
}

void
DispatchQueue::runWorker(int thread_index)
{
  std::unique_lock<std::mutex> lock(lock_);
  while (true) {
    task_ready_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
    // Queued tasks are drained before a worker stops.
    if (tasks_.empty())
      break;
    Task task = std::move(tasks_.front());
    tasks_.pop();
    lock.unlock();
    task(thread_index);
    lock.lock();
    if (--pending_count_ == 0)
      tasks_done_.notify_all();
  }
}

} // namespace
