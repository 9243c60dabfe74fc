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

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace photograph {
/**
 * @brief Persistent application settings. Every field is optional; an absent field means the
 * built-in default applies.
 */
struct AppConfig {
  std::optional<std::string>           preview_backend_;
  // Batch export destination when the command line names none
  std::optional<std::filesystem::path> export_dir_;

  /**
   * @brief `requested` when given, otherwise the configured export directory.
   */
  auto ExportDirectory(const std::optional<std::filesystem::path>& requested) const
      -> std::optional<std::filesystem::path> {
    return requested ? requested : export_dir_;
  }

  auto                                 ToJson() const -> nlohmann::json;
  static auto                          FromJson(const nlohmann::json& doc) -> AppConfig;

  /**
   * @brief $XDG_CONFIG_HOME/photograph/config.json, or ~/.config/photograph/config.json.
   */
  static auto                          DefaultPath() -> std::optional<std::filesystem::path>;

  /**
   * @brief Load from `path`. Never throws: a missing file yields defaults, a malformed one yields
   * defaults and a warning.
   */
  static auto                          Load(const std::filesystem::path& path) -> AppConfig;
  static auto                          Load() -> AppConfig;

  /**
   * @throws std::runtime_error when the file cannot be written
   */
  void                                 Save(const std::filesystem::path& path) const;
};
};  // namespace photograph
