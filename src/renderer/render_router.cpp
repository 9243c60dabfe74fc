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

#include "renderer/render_router.hpp"

#include <cstdlib>
#include <iostream>
#include <opencv2/core/utils/logger.hpp>
#include <utility>

#include "edit/pipeline/gpu_context.hpp"
#include "type/errors.hpp"

namespace photograph {
RenderRouter::RenderRouter(BackendChoice choice, std::shared_ptr<PipelineExecutor> gpu,
                           std::shared_ptr<CPUPipelineExecutor> cpu)
    : choice_(std::move(choice)), gpu_(std::move(gpu)), cpu_(std::move(cpu)) {
  if (!cpu_) {
    cpu_ = std::make_shared<CPUPipelineExecutor>();
  }
}

auto RenderRouter::Render(const ImageBuffer& input, const EditState& state) const
    -> RenderOutput {
  if (!choice_.permitted_) {
    throw PolicyViolation("[ERROR] RenderRouter: no backend permitted: " + choice_.reason_);
  }

  if (choice_.backend_ == PipelineBackend::CUDA && gpu_) {
    if (auto rendered = gpu_->TryApply(input, state)) {
      return RenderOutput{std::move(*rendered), PipelineBackend::CUDA};
    }
    if (!choice_.cpu_fallback_allowed_) {
      throw PolicyViolation(std::string("[ERROR] RenderRouter: GPU declined a ") +
                            std::to_string(input.Width()) + "x" + std::to_string(input.Height()) +
                            " render and " + kDebugCpuFallbackEnv + " is not set");
    }
    ReportGpuFallbackOnce("GPU declined a render");
  } else if (choice_.backend_ == PipelineBackend::CUDA) {
    if (!choice_.cpu_fallback_allowed_) {
      throw PolicyViolation("[ERROR] RenderRouter: GPU backend selected but no GPU executor");
    }
    ReportGpuFallbackOnce("no GPU executor");
  } else {
    ReportGpuFallbackOnce(choice_.reason_);
  }

  return RenderOutput{cpu_->Apply(input, state), PipelineBackend::CPU};
}

auto EnforceStartupPolicy(const BackendPolicy& policy, const BackendChoice& choice,
                          std::shared_ptr<PipelineExecutor> gpu)
    -> std::shared_ptr<const RenderRouter> {
  const StartupCheck check = policy.CheckStartup(choice);
  if (!check.ok_) {
    CV_LOG_ERROR(NULL, "[RenderRouter] " << check.message_);
    std::cerr << check.message_ << std::endl;
    std::exit(check.exit_code_);
  }
  return std::make_shared<const RenderRouter>(choice, std::move(gpu));
}
};  // namespace photograph
