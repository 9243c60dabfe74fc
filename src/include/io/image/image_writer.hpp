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

#include <opencv2/core.hpp>
#include <optional>

#include "image/image_buffer.hpp"
#include "type/supported_file_type.hpp"
#include "type/type.hpp"

namespace photograph {
/**
 * @brief Downscale target keeping the aspect ratio so the long edge equals max_long_edge.
 *
 * @return nullopt when the image already fits or any input is non-positive
 */
auto ResizedDimensions(int width, int height, int max_long_edge) -> std::optional<cv::Size>;

class ImageWriter {
 public:
  /**
   * @brief Encode a rendered buffer to disk, resizing first when the options ask for it.
   *
   * @throws EncodeError when encoding or writing fails
   */
  static void WriteImageToPath(const ImageBuffer& image, const image_path_t& export_path,
                               const ExportFormatOptions& options);
};
};  // namespace photograph
