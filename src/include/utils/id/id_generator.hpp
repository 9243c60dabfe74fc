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

#include <atomic>
#include <concepts>
#include <cstdint>

namespace photograph {
namespace IncrID {
template <typename IDType>
concept Incrementable = std::unsigned_integral<IDType>;

/**
 * @brief Monotonic id source shared between a requesting thread and worker threads.
 * Ids are never reused or decremented.
 */
template <Incrementable T>
class IDGenerator {
 private:
  std::atomic<T> counter_;

 public:
  explicit IDGenerator(T start_id) : counter_(start_id) {}

  auto GenerateID() -> T { return counter_.fetch_add(1, std::memory_order_acq_rel) + 1; }
  auto GetCurrentID() const -> T { return counter_.load(std::memory_order_acquire); }
  auto IsCurrent(T id) const -> bool { return id == GetCurrentID(); }
};
};  // namespace IncrID
};  // namespace photograph
