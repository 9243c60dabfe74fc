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

#include <opencv2/core/cuda.hpp>

#include "edit/pipeline/kernels/adjust_kernels.hpp"

namespace photograph {
namespace CUDA {
// All entry points operate in place on CV_8UC4 RGBA images

void ApplyTone(cv::cuda::GpuMat& img, const Kernels::ToneParams& params, cv::cuda::Stream& stream);

void ApplyColor(cv::cuda::GpuMat& img, const Kernels::ColorParams& params,
                cv::cuda::Stream& stream);

void ApplyGradient(cv::cuda::GpuMat& img, const Kernels::GradientParams& params,
                   cv::cuda::Stream& stream);

void UnsharpCombine(cv::cuda::GpuMat& img, const cv::cuda::GpuMat& blurred, float amount,
                    cv::cuda::Stream& stream);
}  // namespace CUDA
}  // namespace photograph
