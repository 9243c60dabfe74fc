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

#include "edit/pipeline/pipeline_cpu.hpp"

#include <opencv2/imgproc.hpp>
#include <utility>
#include <variant>

#include "edit/pipeline/adjust_params.hpp"
#include "edit/pipeline/geometry_ops.hpp"
#include "edit/pipeline/kernels/adjust_kernels.hpp"
#include "utils/profiler/profiler.hpp"

namespace photograph {
namespace {
constexpr int    kSharpenKernelSize = 11;
constexpr double kSharpenSigma      = 1.5;

template <typename PixelFn>
void ForEachPixel(cv::Mat& img, PixelFn&& fn) {
  for (int y = 0; y < img.rows; ++y) {
    auto* row = img.ptr<cv::Vec4b>(y);
    for (int x = 0; x < img.cols; ++x) {
      cv::Vec4b& px = row[x];
      float      r  = Kernels::ToUnit(px[0]);
      float      g  = Kernels::ToUnit(px[1]);
      float      b  = Kernels::ToUnit(px[2]);
      fn(r, g, b);
      px[0] = Kernels::ToByte(r);
      px[1] = Kernels::ToByte(g);
      px[2] = Kernels::ToByte(b);
    }
  }
}

/**
 * Visits one operation at a time and replaces `img_` with the stage output. Identity
 * operations are skipped by the caller.
 */
struct CPUStageVisitor {
  cv::Mat& img_;

  void     operator()(const StraightenOp& op) {
    cv::Mat out;
    cv::warpAffine(img_, out, Geometry::StraightenMatrix(img_.cols, img_.rows, op.degrees_),
                   img_.size(), cv::INTER_LINEAR, cv::BORDER_CONSTANT, Geometry::kFillValue);
    img_ = std::move(out);
  }

  void operator()(const KeystoneOp& op) {
    const auto homography = Geometry::KeystoneHomography(img_.cols, img_.rows, op);
    if (!homography) return;
    cv::Mat out;
    cv::warpPerspective(img_, out, cv::Mat(*homography), img_.size(), cv::INTER_LINEAR,
                        cv::BORDER_CONSTANT, Geometry::kFillValue);
    img_ = std::move(out);
  }

  void operator()(const RotateOp& op) {
    cv::Mat out;
    switch (NormalizeRotation(op.degrees_)) {
      case 90:
        cv::rotate(img_, out, cv::ROTATE_90_CLOCKWISE);
        break;
      case 180:
        cv::rotate(img_, out, cv::ROTATE_180);
        break;
      case 270:
        cv::rotate(img_, out, cv::ROTATE_90_COUNTERCLOCKWISE);
        break;
      default:
        return;
    }
    img_ = std::move(out);
  }

  void operator()(const FlipOp& op) {
    if (op.horizontal_) {
      cv::Mat out;
      cv::flip(img_, out, 1);
      img_ = std::move(out);
    }
    if (op.vertical_) {
      cv::Mat out;
      cv::flip(img_, out, 0);
      img_ = std::move(out);
    }
  }

  void operator()(const CropOp& op) {
    const auto roi = Geometry::ComputeCropRoi(img_.cols, img_.rows, op.rect_);
    if (!roi) return;
    img_ = img_(*roi).clone();
  }

  void operator()(const ToneOp& op) {
    const auto params = MakeToneParams(op);
    ForEachPixel(img_, [&params](float& r, float& g, float& b) {
      Kernels::ApplyTone(r, g, b, params);
    });
  }

  void operator()(const ColorOp& op) {
    const auto params = MakeColorParams(op);
    ForEachPixel(img_, [&params](float& r, float& g, float& b) {
      Kernels::ApplyColor(r, g, b, params);
    });
  }

  void operator()(const GraduatedFilterOp& op) {
    const auto params = MakeGradientParams(op, img_.rows);
    for (int y = 0; y < img_.rows; ++y) {
      const float gain = Kernels::GradientGain(y, params);
      if (gain == 1.0f) continue;
      auto* row = img_.ptr<cv::Vec4b>(y);
      for (int x = 0; x < img_.cols; ++x) {
        for (int c = 0; c < 3; ++c) {
          row[x][c] = Kernels::ToByte(Kernels::ToUnit(row[x][c]) * gain);
        }
      }
    }
  }

  void operator()(const SharpenOp& op) {
    cv::Mat blurred;
    cv::GaussianBlur(img_, blurred, cv::Size(kSharpenKernelSize, kSharpenKernelSize),
                     kSharpenSigma, kSharpenSigma, cv::BORDER_REPLICATE);
    for (int y = 0; y < img_.rows; ++y) {
      auto*       row  = img_.ptr<cv::Vec4b>(y);
      const auto* blur = blurred.ptr<cv::Vec4b>(y);
      for (int x = 0; x < img_.cols; ++x) {
        // Alpha is preserved
        for (int c = 0; c < 3; ++c) {
          row[x][c] = Kernels::UnsharpChannel(row[x][c], blur[x][c], op.amount_);
        }
      }
    }
  }
};
}  // namespace

auto CPUPipelineExecutor::Apply(const ImageBuffer& input, const EditState& state) const
    -> ImageBuffer {
  EASY_BLOCK("CPUPipelineExecutor::Apply");
  if (input.Empty()) {
    return input.Clone();
  }
  cv::Mat         img = input.CloneCPUData();
  CPUStageVisitor visitor{img};
  for (const auto& op : state.Operations()) {
    if (IsIdentity(op)) continue;
    std::visit(visitor, op);
  }
  return ImageBuffer{std::move(img), input.GetColorSpace()};
}
};  // namespace photograph
