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

#include "image/image_buffer.hpp"
#include "type/type.hpp"

namespace photograph {
/**
 * @brief Decode collaborator. Produces an RGBA8 buffer from any format OpenCV can read.
 */
class ImageLoader {
 public:
  /**
   * @brief Decode a file from disk.
   *
   * @param path source image
   * @return decoded buffer
   * @throws DecodeError when the file is missing or cannot be decoded
   */
  static auto Load(const image_path_t& path) -> ImageBuffer;
};
};  // namespace photograph
