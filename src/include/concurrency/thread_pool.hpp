//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace photograph {
/**
 * @brief Fixed-size worker pool. Tasks run in submission order per worker and must
 * not throw; callers capture their own failures inside the task.
 */
class ThreadPool {
 public:
  explicit ThreadPool(size_t thread_count);
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  void        Submit(std::function<void()> task);

  /**
   * @brief Block until the queue is empty and no worker is running a task.
   */
  void        WaitIdle();

  auto        ThreadCount() const -> size_t { return workers_.size(); }

  /**
   * @brief One worker per logical core, at least one.
   */
  static auto DefaultThreadCount() -> size_t;

 private:
  std::queue<std::function<void()>> tasks_;
  std::mutex                        mtx_;
  std::condition_variable           condition_;
  std::condition_variable           idle_condition_;
  std::vector<std::thread>          workers_;

  size_t                            active_ = 0;
  bool                              stop_   = false;

  void                              WorkerThread();
};
};  // namespace photograph
