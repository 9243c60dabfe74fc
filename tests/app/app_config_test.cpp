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

#include "test_fixation.hpp"

namespace photograph {
class AppConfigTests : public PhotographTests {};

TEST_F(AppConfigTests, MissingFileYieldsDefaults) {
  const auto config = AppConfig::Load(temp_dir_ / "absent.json");
  EXPECT_FALSE(config.preview_backend_.has_value());
  EXPECT_FALSE(config.export_dir_.has_value());
}

TEST_F(AppConfigTests, SaveThenLoadKeepsFields) {
  AppConfig config;
  config.preview_backend_ = "gpu";
  config.export_dir_      = "/srv/exports";

  const auto path = temp_dir_ / "nested" / "config.json";
  config.Save(path);

  const auto loaded = AppConfig::Load(path);
  EXPECT_EQ(loaded.preview_backend_.value_or(""), "gpu");
  EXPECT_EQ(loaded.export_dir_.value_or(""), std::filesystem::path("/srv/exports"));
}

TEST_F(AppConfigTests, MalformedFileYieldsDefaults) {
  const auto path = temp_dir_ / "config.json";
  std::ofstream(path) << "{ \"preview_backend\": ";
  EXPECT_NO_THROW({
    const auto config = AppConfig::Load(path);
    EXPECT_FALSE(config.preview_backend_.has_value());
  });
}

TEST_F(AppConfigTests, BadFieldIsIgnoredIndividually) {
  const auto config = AppConfig::FromJson(
      nlohmann::json{{"preview_backend", "cpu"}, {"export_dir", 17}, {"window_width", 1600}});
  EXPECT_EQ(config.preview_backend_.value_or(""), "cpu");
  EXPECT_FALSE(config.export_dir_.has_value());

  EXPECT_FALSE(AppConfig::FromJson(nlohmann::json::array()).preview_backend_.has_value());
}

TEST_F(AppConfigTests, AbsentFieldsAreNotWritten) {
  AppConfig config;
  config.export_dir_ = "/srv/exports";
  const auto doc     = config.ToJson();
  EXPECT_TRUE(doc.contains("export_dir"));
  EXPECT_FALSE(doc.contains("preview_backend"));
  EXPECT_EQ(doc.size(), 1u);
}

TEST_F(AppConfigTests, CommandLineExportDirectoryWinsOverConfig) {
  AppConfig config;
  EXPECT_FALSE(config.ExportDirectory(std::nullopt).has_value());

  config.export_dir_ = "/srv/exports";
  EXPECT_EQ(config.ExportDirectory(std::nullopt), std::filesystem::path("/srv/exports"));
  EXPECT_EQ(config.ExportDirectory(std::filesystem::path("out")), std::filesystem::path("out"));
}
};  // namespace photograph
