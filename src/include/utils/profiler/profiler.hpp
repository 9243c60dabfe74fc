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

// easy_profiler turns EASY_BLOCK and EASY_FUNCTION into no-ops unless the build
// defines BUILD_WITH_EASY_PROFILER (PHOTOGRAPH_ENABLE_PROFILER in CMake).
#include <easy/profiler.h>

#include <cstdint>
#include <string>

namespace photograph {
namespace Profiler {
// Start collecting blocks; a no-op when profiling is compiled out
inline void Enable() { EASY_PROFILER_ENABLE; }

/**
 * @brief Write the collected blocks to a file when profiling is compiled in.
 *
 * @param path output .prof file
 * @return number of dumped blocks, 0 when profiling is disabled
 */
inline auto DumpTo(const std::string& path) -> uint32_t {
#ifdef BUILD_WITH_EASY_PROFILER
  return profiler::dumpBlocksToFile(path.c_str());
#else
  (void)path;
  return 0;
#endif
}
};  // namespace Profiler
};  // namespace photograph
