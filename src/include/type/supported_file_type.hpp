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

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace photograph {
enum class ImageFormatType { JPEG, PNG, WEBP };

enum class RenderSpeedProfile { QUALITY, BALANCED, SPEED };

struct ExportFormatOptions {
  ImageFormatType format_            = ImageFormatType::JPEG;
  // JPEG and lossy WebP quality, 1..100
  int             quality_           = 90;
  // WebP only; quality_ is ignored when set
  bool            lossless_          = false;
  // PNG zlib level, 0..9
  int             compression_level_ = 6;

  bool            resize_enabled_    = false;
  int             max_length_side_   = 3000;

  static auto     FromProfile(ImageFormatType format, RenderSpeedProfile profile)
      -> ExportFormatOptions {
    ExportFormatOptions options;
    options.format_ = format;
    switch (profile) {
      case RenderSpeedProfile::QUALITY:
        options.quality_           = 95;
        options.compression_level_ = 9;
        break;
      case RenderSpeedProfile::BALANCED:
        options.quality_           = 90;
        options.compression_level_ = 6;
        break;
      case RenderSpeedProfile::SPEED:
        options.quality_           = 80;
        options.compression_level_ = 1;
        break;
    }
    return options;
  }
};

inline auto ExtensionOf(ImageFormatType format) -> std::string {
  switch (format) {
    case ImageFormatType::JPEG:
      return "jpg";
    case ImageFormatType::PNG:
      return "png";
    case ImageFormatType::WEBP:
      return "webp";
  }
  return "jpg";
}

inline auto ParseImageFormat(std::string_view raw) -> std::optional<ImageFormatType> {
  std::string value(raw);
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (value == "jpg" || value == "jpeg") return ImageFormatType::JPEG;
  if (value == "png") return ImageFormatType::PNG;
  if (value == "webp") return ImageFormatType::WEBP;
  return std::nullopt;
}
};  // namespace photograph
