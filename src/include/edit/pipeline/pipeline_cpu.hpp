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

#include "edit/pipeline/pipeline.hpp"
#include "edit/state/edit_state.hpp"
#include "image/image_buffer.hpp"

namespace photograph {
/**
 * @brief Reference backend. Stateless, so one instance can serve any number of threads.
 */
class CPUPipelineExecutor : public PipelineExecutor {
 public:
  auto GetBackend() const -> PipelineBackend override { return PipelineBackend::CPU; }

  auto TryApply(const ImageBuffer& input, const EditState& state)
      -> std::optional<ImageBuffer> override {
    return Apply(input, state);
  }

  /**
   * @brief Apply every operation of `state` in canonical order. Total: the only failure is an
   * allocation failure.
   */
  auto Apply(const ImageBuffer& input, const EditState& state) const -> ImageBuffer;
};
};  // namespace photograph
