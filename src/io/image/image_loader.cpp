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

#include "io/image/image_loader.hpp"

#include <filesystem>
#include <opencv2/imgcodecs.hpp>
#include <string>

#include "type/errors.hpp"
#include "utils/profiler/profiler.hpp"

namespace photograph {
auto ImageLoader::Load(const image_path_t& path) -> ImageBuffer {
  EASY_BLOCK("ImageLoader::Load");
  if (!std::filesystem::is_regular_file(path)) {
    throw DecodeError("ImageLoader: no such file " + path.string());
  }
  cv::Mat decoded;
  try {
    decoded = cv::imread(path.string(), cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    throw DecodeError("ImageLoader: OpenCV failed to decode " + path.string() + ": " + e.what());
  }
  if (decoded.empty()) {
    throw DecodeError("ImageLoader: unsupported or corrupt image " + path.string());
  }
  return ImageBuffer::FromBGR(decoded);
}
};  // namespace photograph
