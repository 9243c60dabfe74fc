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

#include "edit/pipeline/geometry_ops.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

namespace photograph {
namespace Geometry {
namespace {
constexpr double kDegenerateEpsilon = 1e-12;
}  // namespace

auto StraightenMatrix(int width, int height, float degrees) -> cv::Mat {
  const cv::Point2f center(static_cast<float>(width) * 0.5f, static_cast<float>(height) * 0.5f);
  // OpenCV angles are counter-clockwise
  return cv::getRotationMatrix2D(center, -static_cast<double>(degrees), 1.0);
}

auto KeystoneHomography(int width, int height, const KeystoneOp& op) -> std::optional<cv::Matx33d> {
  const float w  = static_cast<float>(width);
  const float h  = static_cast<float>(height);
  const float v  = op.vertical_;
  const float hz = op.horizontal_;

  const cv::Point2f src[4] = {cv::Point2f(0.0f, 0.0f), cv::Point2f(w, 0.0f), cv::Point2f(w, h),
                              cv::Point2f(0.0f, h)};
  const cv::Point2f dst[4] = {
      cv::Point2f(std::max(v, 0.0f) * w, std::max(hz, 0.0f) * h),
      cv::Point2f(w - std::max(v, 0.0f) * w, std::max(-hz, 0.0f) * h),
      cv::Point2f(w - std::max(-v, 0.0f) * w, h - std::max(-hz, 0.0f) * h),
      cv::Point2f(std::max(-v, 0.0f) * w, h - std::max(hz, 0.0f) * h),
  };
  // A singular system comes back as all zeros with h33 = 1
  const cv::Matx33d homography(cv::getPerspectiveTransform(src, dst));
  if (std::abs(cv::determinant(homography)) < kDegenerateEpsilon) {
    return std::nullopt;
  }
  return homography;
}

auto ComputeCropRoi(int width, int height, const NormalizedRect& rect) -> std::optional<cv::Rect> {
  const float w  = static_cast<float>(width);
  const float h  = static_cast<float>(height);
  const int   cx = static_cast<int>(std::max(rect.x_ * w, 0.0f));
  const int   cy = static_cast<int>(std::max(rect.y_ * h, 0.0f));
  const float cw = std::min(rect.width_ * w, w - static_cast<float>(cx));
  const float ch = std::min(rect.height_ * h, h - static_cast<float>(cy));
  if (cw < 1.0f || ch < 1.0f) {
    return std::nullopt;
  }
  return cv::Rect(cx, cy, static_cast<int>(cw), static_cast<int>(ch));
}
};  // namespace Geometry
};  // namespace photograph
