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

#include "edit/pipeline/pipeline_gpu.hpp"

#include <algorithm>
#include <mutex>
#include <opencv2/core/utils/logger.hpp>
#include <utility>
#include <variant>

#include "edit/pipeline/adjust_params.hpp"
#include "edit/pipeline/geometry_ops.hpp"
#include "type/errors.hpp"
#include "utils/profiler/profiler.hpp"

#ifdef HAVE_CUDA
#include <opencv2/cudaarithm.hpp>
#include <opencv2/cudafilters.hpp>
#include <opencv2/cudawarping.hpp>

#include "edit/pipeline/cuda_adjust_ops.hpp"
#endif

namespace photograph {
auto ExceedsTextureLimit(int width, int height, int max_dimension) -> bool {
  return width > max_dimension || height > max_dimension;
}

GPUPipelineExecutor::GPUPipelineExecutor(std::shared_ptr<GpuContext> context)
    : context_(std::move(context)) {}

auto GPUPipelineExecutor::MaxDimension() const -> int {
  const int device_limit = context_ ? context_->MaxTextureDimension() : 0;
  if (max_dimension_override_) {
    return context_ ? std::min(*max_dimension_override_, device_limit) : *max_dimension_override_;
  }
  return device_limit;
}

auto GPUPipelineExecutor::TryApply(const ImageBuffer& input, const EditState& state)
    -> std::optional<ImageBuffer> {
  if (state.IsIdentity() || input.Empty()) {
    return input.Clone();
  }
  if (!context_) {
    return std::nullopt;
  }
  if (ExceedsTextureLimit(input.Width(), input.Height(), MaxDimension())) {
    CV_LOG_WARNING(NULL, "[GPUPipeline] " << input.Width() << "x" << input.Height()
                                          << " exceeds the texture limit " << MaxDimension());
    return std::nullopt;
  }

  std::lock_guard<std::mutex> lock(context_->GetRenderLock());
  try {
    return Render(input, state);
  } catch (const BackendRefusal& e) {
    CV_LOG_WARNING(NULL, "[GPUPipeline] Render declined: " << e.what());
  } catch (const cv::Exception& e) {
    CV_LOG_WARNING(NULL, "[GPUPipeline] Device error: " << e.what());
  } catch (const std::exception& e) {
    CV_LOG_WARNING(NULL, "[GPUPipeline] Render failed: " << e.what());
  }
  return std::nullopt;
}

#ifdef HAVE_CUDA
namespace {
constexpr int    kSharpenKernelSize = 11;
constexpr double kSharpenSigma      = 1.5;

struct GPUStageVisitor {
  cv::cuda::GpuMat& img_;
  cv::cuda::Stream& stream_;

  void              operator()(const StraightenOp& op) {
    cv::cuda::GpuMat out;
    cv::cuda::warpAffine(img_, out, Geometry::StraightenMatrix(img_.cols, img_.rows, op.degrees_),
                         img_.size(), cv::INTER_LINEAR, cv::BORDER_CONSTANT, Geometry::kFillValue,
                         stream_);
    img_ = std::move(out);
  }

  void operator()(const KeystoneOp& op) {
    const auto homography = Geometry::KeystoneHomography(img_.cols, img_.rows, op);
    if (!homography) return;
    cv::cuda::GpuMat out;
    cv::cuda::warpPerspective(img_, out, cv::Mat(*homography), img_.size(), cv::INTER_LINEAR,
                              cv::BORDER_CONSTANT, Geometry::kFillValue, stream_);
    img_ = std::move(out);
  }

  void operator()(const RotateOp& op) {
    cv::cuda::GpuMat transposed;
    cv::cuda::GpuMat out;
    switch (NormalizeRotation(op.degrees_)) {
      case 90:
        cv::cuda::transpose(img_, transposed, stream_);
        cv::cuda::flip(transposed, out, 1, stream_);
        break;
      case 180:
        cv::cuda::flip(img_, out, -1, stream_);
        break;
      case 270:
        cv::cuda::transpose(img_, transposed, stream_);
        cv::cuda::flip(transposed, out, 0, stream_);
        break;
      default:
        return;
    }
    img_ = std::move(out);
  }

  void operator()(const FlipOp& op) {
    if (op.horizontal_) {
      cv::cuda::GpuMat out;
      cv::cuda::flip(img_, out, 1, stream_);
      img_ = std::move(out);
    }
    if (op.vertical_) {
      cv::cuda::GpuMat out;
      cv::cuda::flip(img_, out, 0, stream_);
      img_ = std::move(out);
    }
  }

  void operator()(const CropOp& op) {
    const auto roi = Geometry::ComputeCropRoi(img_.cols, img_.rows, op.rect_);
    if (!roi) return;
    cv::cuda::GpuMat out;
    img_(*roi).copyTo(out, stream_);
    img_ = std::move(out);
  }

  void operator()(const ToneOp& op) { CUDA::ApplyTone(img_, MakeToneParams(op), stream_); }

  void operator()(const ColorOp& op) { CUDA::ApplyColor(img_, MakeColorParams(op), stream_); }

  void operator()(const GraduatedFilterOp& op) {
    CUDA::ApplyGradient(img_, MakeGradientParams(op, img_.rows), stream_);
  }

  void operator()(const SharpenOp& op) {
    auto filter = cv::cuda::createGaussianFilter(
        CV_8UC4, CV_8UC4, cv::Size(kSharpenKernelSize, kSharpenKernelSize), kSharpenSigma,
        kSharpenSigma, cv::BORDER_REPLICATE, cv::BORDER_REPLICATE);
    cv::cuda::GpuMat blurred;
    filter->apply(img_, blurred, stream_);
    CUDA::UnsharpCombine(img_, blurred, op.amount_, stream_);
  }
};
}  // namespace
#endif

auto GPUPipelineExecutor::Render(const ImageBuffer& input, const EditState& state)
    -> ImageBuffer {
#ifdef HAVE_CUDA
  EASY_BLOCK("GPUPipelineExecutor::Render");
  cv::cuda::setDevice(context_->DeviceId());
  cv::cuda::Stream stream;
  cv::cuda::GpuMat img;
  img.upload(input.GetCPUData(), stream);

  GPUStageVisitor visitor{img, stream};
  for (const auto& op : state.Operations()) {
    if (IsIdentity(op)) continue;
    std::visit(visitor, op);
  }

  cv::Mat out;
  img.download(out, stream);
  stream.waitForCompletion();
  return ImageBuffer{std::move(out), input.GetColorSpace()};
#else
  (void)input;
  (void)state;
  throw BackendRefusal("[ERROR] GPUPipelineExecutor: built without CUDA support");
#endif
}
};  // namespace photograph
