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

#include "edit/pipeline/pipeline.hpp"
#include "edit/pipeline/pipeline_cpu.hpp"
#include "renderer/backend_policy.hpp"

namespace photograph {
struct RenderOutput {
  ImageBuffer     image_;
  PipelineBackend backend_ = PipelineBackend::CPU;
};

/**
 * @brief Runs the try-GPU, then fallback-or-refuse sequence for one backend choice. Shared by
 * the preview scheduler and export workers; thread-safe as long as the GPU executor is.
 */
class RenderRouter {
 private:
  BackendChoice                     choice_;
  std::shared_ptr<PipelineExecutor> gpu_;
  std::shared_ptr<CPUPipelineExecutor> cpu_;

 public:
  RenderRouter(BackendChoice choice, std::shared_ptr<PipelineExecutor> gpu,
               std::shared_ptr<CPUPipelineExecutor> cpu = std::make_shared<CPUPipelineExecutor>());

  /**
   * @brief Render with the permitted backend.
   *
   * @throws PolicyViolation when the choice permits nothing, or the GPU declined and the CPU
   * fallback is not allowed
   */
  auto Render(const ImageBuffer& input, const EditState& state) const -> RenderOutput;

  auto Choice() const -> const BackendChoice& { return choice_; }
};

/**
 * @brief Fail-fast startup gate shared by every command. When `policy` permits no backend for
 * `choice`, prints the reason to stderr and terminates with kPolicyExitCode before anything is
 * rendered. Otherwise returns the router for `choice`.
 */
auto EnforceStartupPolicy(const BackendPolicy& policy, const BackendChoice& choice,
                          std::shared_ptr<PipelineExecutor> gpu)
    -> std::shared_ptr<const RenderRouter>;
};  // namespace photograph
