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

#include <optional>
#include <string_view>

#include "edit/state/edit_state.hpp"
#include "image/image_buffer.hpp"

namespace photograph {
enum class PipelineBackend { CPU, CUDA };

inline auto BackendName(PipelineBackend backend) -> std::string_view {
  return backend == PipelineBackend::CPU ? "cpu" : "cuda";
}

/**
 * @brief One execution backend for the edit-operation sequence. Implementations must be pure
 * with respect to their inputs: the source buffer is never modified.
 */
class PipelineExecutor {
 public:
  virtual ~PipelineExecutor() = default;

  virtual auto GetBackend() const -> PipelineBackend = 0;

  /**
   * @brief Render `input` with `state`.
   *
   * @return the rendered image, or nullopt when this backend declines the render
   */
  virtual auto TryApply(const ImageBuffer& input, const EditState& state)
      -> std::optional<ImageBuffer> = 0;
};
};  // namespace photograph
