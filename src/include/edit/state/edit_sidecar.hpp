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

#include <optional>

#include "edit/state/edit_state.hpp"
#include "type/type.hpp"

namespace photograph {
/**
 * @brief Persists an EditState next to its source image as `<dir>/.edits/<file name>.json`.
 */
class EditSidecar {
 public:
  static auto PathFor(const image_path_t& image_path) -> image_path_t;

  /**
   * @return the stored state, or nullopt when no sidecar exists or it cannot be parsed
   */
  static auto Load(const image_path_t& image_path) -> std::optional<EditState>;

  /**
   * @throws std::runtime_error when the sidecar cannot be written
   */
  static void Save(const EditState& state, const image_path_t& image_path);
};
};  // namespace photograph
