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

#include "edit/state/edit_sidecar.hpp"

#include <filesystem>
#include <fstream>
#include <opencv2/core/utils/logger.hpp>
#include <stdexcept>
#include <string>

#include "type/errors.hpp"

namespace photograph {
auto EditSidecar::PathFor(const image_path_t& image_path) -> image_path_t {
  image_path_t file_name = image_path.filename();
  file_name += ".json";
  return image_path.parent_path() / ".edits" / file_name;
}

auto EditSidecar::Load(const image_path_t& image_path) -> std::optional<EditState> {
  const auto sidecar = PathFor(image_path);
  if (!std::filesystem::is_regular_file(sidecar)) {
    return std::nullopt;
  }
  std::ifstream in(sidecar);
  if (!in) {
    CV_LOG_WARNING(NULL, "[EditSidecar] Cannot open " << sidecar.string());
    return std::nullopt;
  }
  const auto doc = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    CV_LOG_WARNING(NULL, "[EditSidecar] Ignoring malformed sidecar " << sidecar.string());
    return std::nullopt;
  }
  try {
    return EditState::FromJson(doc);
  } catch (const OperationError& e) {
    CV_LOG_WARNING(NULL, "[EditSidecar] Ignoring invalid sidecar " << sidecar.string() << ": "
                                                                  << e.what());
    return std::nullopt;
  }
}

void EditSidecar::Save(const EditState& state, const image_path_t& image_path) {
  const auto sidecar = PathFor(image_path);
  std::filesystem::create_directories(sidecar.parent_path());
  std::ofstream out(sidecar, std::ios::trunc);
  if (!out) {
    throw std::runtime_error("[ERROR] EditSidecar: cannot write " + sidecar.string());
  }
  out << state.ToJson().dump(2);
  if (!out) {
    throw std::runtime_error("[ERROR] EditSidecar: write failed for " + sidecar.string());
  }
}
};  // namespace photograph
