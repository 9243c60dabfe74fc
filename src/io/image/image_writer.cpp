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

#include "io/image/image_writer.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <string>
#include <vector>

#include "type/errors.hpp"
#include "utils/profiler/profiler.hpp"

namespace photograph {
auto ResizedDimensions(int width, int height, int max_long_edge) -> std::optional<cv::Size> {
  if (width <= 0 || height <= 0 || max_long_edge <= 0) {
    return std::nullopt;
  }
  const int long_edge = std::max(width, height);
  if (long_edge <= max_long_edge) {
    return std::nullopt;
  }
  const float scale = static_cast<float>(max_long_edge) / static_cast<float>(long_edge);
  const int   new_w = std::max(1, static_cast<int>(std::lround(static_cast<float>(width) * scale)));
  const int   new_h = std::max(1, static_cast<int>(std::lround(static_cast<float>(height) * scale)));
  return cv::Size(new_w, new_h);
}

namespace {
auto FormatSupportsAlpha(ImageFormatType fmt) -> bool {
  return fmt == ImageFormatType::PNG || fmt == ImageFormatType::WEBP;
}

auto ResizeForExport(const cv::Mat& bgra, const ExportFormatOptions& options) -> cv::Mat {
  if (!options.resize_enabled_) return bgra;
  const auto target = ResizedDimensions(bgra.cols, bgra.rows, options.max_length_side_);
  if (!target) return bgra;

  cv::Mat resized;
  cv::resize(bgra, resized, *target, 0.0, 0.0, cv::INTER_LANCZOS4);
  return resized;
}
}  // namespace

void ImageWriter::WriteImageToPath(const ImageBuffer& image, const image_path_t& export_path,
                                   const ExportFormatOptions& options) {
  EASY_BLOCK("ImageWriter::WriteImageToPath");
  if (image.Empty()) {
    throw EncodeError("ImageWriter: refusing to encode an empty image");
  }
  if (export_path.empty()) {
    throw EncodeError("ImageWriter: export path is empty");
  }
  if (export_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(export_path.parent_path(), ec);
    if (ec) {
      throw EncodeError("ImageWriter: cannot create " + export_path.parent_path().string() + ": " +
                        ec.message());
    }
  }

  cv::Mat encoded = ResizeForExport(image.ToBGRA(), options);
  if (!FormatSupportsAlpha(options.format_)) {
    cv::cvtColor(encoded, encoded, cv::COLOR_BGRA2BGR);
  }

  std::vector<int> params;
  switch (options.format_) {
    case ImageFormatType::JPEG:
      params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(options.quality_, 1, 100)};
      break;
    case ImageFormatType::PNG:
      params = {cv::IMWRITE_PNG_COMPRESSION, std::clamp(options.compression_level_, 0, 9)};
      break;
    case ImageFormatType::WEBP:
      // OpenCV selects lossless WebP for any quality above 100
      params = {cv::IMWRITE_WEBP_QUALITY,
                options.lossless_ ? 101 : std::clamp(options.quality_, 1, 100)};
      break;
  }

  try {
    if (!cv::imwrite(export_path.string(), encoded, params)) {
      throw EncodeError("ImageWriter: OpenCV imwrite returned false for " + export_path.string());
    }
  } catch (const cv::Exception& e) {
    throw EncodeError(std::string("ImageWriter: OpenCV: ") + e.what());
  }
}
};  // namespace photograph
