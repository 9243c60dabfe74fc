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

#include <cstddef>
#include <opencv2/core.hpp>

namespace photograph {
enum class PixelFormat { RGBA8 };

enum class ColorSpace { SRGB, LINEAR_SRGB };

/**
 * @brief Immutable RGBA8 pixel storage. Dimensions, format and color space are fixed at
 * construction; pipelines always produce a new buffer instead of mutating one.
 */
class ImageBuffer {
 private:
  cv::Mat    data_;
  ColorSpace color_space_ = ColorSpace::SRGB;

 public:
  ImageBuffer() = default;
  /**
   * @brief Take ownership of RGBA pixels.
   *
   * @param rgba CV_8UC4 matrix in R, G, B, A order
   * @param color_space color-space tag carried with the pixels
   */
  explicit ImageBuffer(cv::Mat&& rgba, ColorSpace color_space = ColorSpace::SRGB);

  ImageBuffer(ImageBuffer&& other) noexcept            = default;
  ImageBuffer& operator=(ImageBuffer&& other) noexcept = default;
  ImageBuffer(const ImageBuffer&)                      = delete;
  ImageBuffer& operator=(const ImageBuffer&)           = delete;

  /**
   * @brief Build a buffer from decoder output (8-bit gray, BGR or BGRA).
   */
  static auto FromBGR(const cv::Mat& decoded) -> ImageBuffer;

  auto        Width() const -> int { return data_.cols; }
  auto        Height() const -> int { return data_.rows; }
  auto        Format() const -> PixelFormat { return PixelFormat::RGBA8; }
  auto        GetColorSpace() const -> ColorSpace { return color_space_; }
  auto        Empty() const -> bool { return data_.empty(); }
  auto        ByteSize() const -> size_t { return data_.total() * data_.elemSize(); }

  /**
   * @brief Read-only view of the pixels. The header shares storage with this buffer, and so
   * does any cv::Mat copied from it. Writers take CloneCPUData() and wrap the edited copy in a
   * new ImageBuffer.
   */
  auto        GetCPUData() const -> const cv::Mat& { return data_; }

  // Deep copy of the pixels, safe to modify
  auto        CloneCPUData() const -> cv::Mat { return data_.clone(); }

  /**
   * @brief Encoder-facing copy in BGRA order.
   */
  auto        ToBGRA() const -> cv::Mat;

  auto        Clone() const -> ImageBuffer;
};
};  // namespace photograph
