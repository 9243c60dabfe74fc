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

#include "app/app_config.hpp"

#include <fstream>
#include <opencv2/core/utils/logger.hpp>
#include <stdexcept>

#include "utils/env/env.hpp"

namespace photograph {
namespace {
template <typename T>
void ReadOptional(const nlohmann::json& doc, const char* key, std::optional<T>& out) {
  if (!doc.contains(key) || doc.at(key).is_null()) return;
  try {
    out = doc.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    CV_LOG_WARNING(NULL, "[AppConfig] Ignoring field '" << key << "': " << e.what());
  }
}
}  // namespace

auto AppConfig::ToJson() const -> nlohmann::json {
  nlohmann::json doc = nlohmann::json::object();
  if (preview_backend_) doc["preview_backend"] = *preview_backend_;
  if (export_dir_) doc["export_dir"] = export_dir_->string();
  return doc;
}

auto AppConfig::FromJson(const nlohmann::json& doc) -> AppConfig {
  AppConfig config;
  if (!doc.is_object()) {
    CV_LOG_WARNING(NULL, "[AppConfig] Config root is not an object, using defaults");
    return config;
  }
  ReadOptional(doc, "preview_backend", config.preview_backend_);

  std::optional<std::string> path;
  ReadOptional(doc, "export_dir", path);
  if (path) config.export_dir_ = *path;
  return config;
}

auto AppConfig::DefaultPath() -> std::optional<std::filesystem::path> {
  if (auto xdg = Env::Get("XDG_CONFIG_HOME"); xdg && !xdg->empty()) {
    return std::filesystem::path(*xdg) / "photograph" / "config.json";
  }
  if (auto home = Env::Get("HOME"); home && !home->empty()) {
    return std::filesystem::path(*home) / ".config" / "photograph" / "config.json";
  }
  return std::nullopt;
}

auto AppConfig::Load(const std::filesystem::path& path) -> AppConfig {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return AppConfig{};
  }
  std::ifstream in(path);
  if (!in.is_open()) {
    CV_LOG_WARNING(NULL, "[AppConfig] Cannot open " << path.string() << ", using defaults");
    return AppConfig{};
  }
  try {
    return FromJson(nlohmann::json::parse(in));
  } catch (const nlohmann::json::exception& e) {
    CV_LOG_WARNING(NULL, "[AppConfig] Malformed " << path.string() << ": " << e.what());
    return AppConfig{};
  }
}

auto AppConfig::Load() -> AppConfig {
  auto path = DefaultPath();
  return path ? Load(*path) : AppConfig{};
}

void AppConfig::Save(const std::filesystem::path& path) const {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("[ERROR] AppConfig: cannot create " +
                               path.parent_path().string() + ": " + ec.message());
    }
  }
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("[ERROR] AppConfig: cannot write " + path.string());
  }
  out << ToJson().dump(2);
}
};  // namespace photograph
