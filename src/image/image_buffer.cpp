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

#include "image/image_buffer.hpp"

#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace photograph {
ImageBuffer::ImageBuffer(cv::Mat&& rgba, ColorSpace color_space) : color_space_(color_space) {
  if (rgba.empty()) {
    return;
  }
  if (rgba.type() != CV_8UC4) {
    throw std::runtime_error("Image Buffer: expected CV_8UC4 RGBA data, got type " +
                             std::to_string(rgba.type()));
  }
  data_ = rgba.isContinuous() ? std::move(rgba) : rgba.clone();
}

auto ImageBuffer::FromBGR(const cv::Mat& decoded) -> ImageBuffer {
  if (decoded.empty()) {
    return ImageBuffer{};
  }
  if (decoded.depth() != CV_8U) {
    throw std::runtime_error("Image Buffer: only 8-bit decoder output is supported");
  }
  cv::Mat rgba;
  switch (decoded.channels()) {
    case 1:
      cv::cvtColor(decoded, rgba, cv::COLOR_GRAY2RGBA);
      break;
    case 3:
      cv::cvtColor(decoded, rgba, cv::COLOR_BGR2RGBA);
      break;
    case 4:
      cv::cvtColor(decoded, rgba, cv::COLOR_BGRA2RGBA);
      break;
    default:
      throw std::runtime_error("Image Buffer: unsupported channel count " +
                               std::to_string(decoded.channels()));
  }
  return ImageBuffer{std::move(rgba)};
}

auto ImageBuffer::ToBGRA() const -> cv::Mat {
  cv::Mat bgra;
  if (!data_.empty()) {
    cv::cvtColor(data_, bgra, cv::COLOR_RGBA2BGRA);
  }
  return bgra;
}

auto ImageBuffer::Clone() const -> ImageBuffer { return ImageBuffer{CloneCPUData(), color_space_}; }
};  // namespace photograph
