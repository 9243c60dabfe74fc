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

#include <memory>
#include <optional>

#include "edit/pipeline/gpu_context.hpp"
#include "edit/pipeline/pipeline.hpp"

namespace photograph {
/**
 * @brief Whether either edge of a `width` x `height` image exceeds `max_dimension`.
 */
auto ExceedsTextureLimit(int width, int height, int max_dimension) -> bool;

/**
 * @brief CUDA backend. Declines (returns nullopt) instead of throwing whenever it cannot
 * render: no context, an image over the texture limit, or a device failure mid-render.
 */
class GPUPipelineExecutor : public PipelineExecutor {
 private:
  std::shared_ptr<GpuContext> context_;
  std::optional<int>          max_dimension_override_;

  auto                        Render(const ImageBuffer& input, const EditState& state) -> ImageBuffer;

 public:
  explicit GPUPipelineExecutor(std::shared_ptr<GpuContext> context);

  auto GetBackend() const -> PipelineBackend override { return PipelineBackend::CUDA; }

  auto TryApply(const ImageBuffer& input, const EditState& state)
      -> std::optional<ImageBuffer> override;

  /**
   * @brief Lower the accepted texture dimension below the device limit. Used to exercise the
   * refusal path on hardware with large limits.
   */
  void SetMaxDimensionOverride(std::optional<int> max_dimension) {
    max_dimension_override_ = max_dimension;
  }

  auto MaxDimension() const -> int;
  auto HasContext() const -> bool { return context_ != nullptr; }
};
};  // namespace photograph
