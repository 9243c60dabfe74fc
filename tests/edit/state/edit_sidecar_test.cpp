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

#include <fstream>

#include "test_fixation.hpp"

namespace photograph {
class EditSidecarTests : public PhotographTests {};

TEST_F(EditSidecarTests, PathLivesInHiddenEditsDirectory) {
  const auto path = EditSidecar::PathFor(temp_dir_ / "IMG_0001.CR3");
  EXPECT_EQ(path, temp_dir_ / ".edits" / "IMG_0001.CR3.json");
}

TEST_F(EditSidecarTests, SaveThenLoadRestoresState) {
  const auto image = temp_dir_ / "photo.jpg";
  EditState  state = EditState{}.With(RotateOp{90}).With(ToneOp{.exposure_ = 0.7f});
  EditSidecar::Save(state, image);

  ASSERT_TRUE(std::filesystem::exists(EditSidecar::PathFor(image)));
  const auto loaded = EditSidecar::Load(image);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->Get<RotateOp>()->degrees_, 90);
  EXPECT_FLOAT_EQ(loaded->Get<ToneOp>()->exposure_, 0.7f);
}

TEST_F(EditSidecarTests, MissingSidecarIsNullopt) {
  EXPECT_FALSE(EditSidecar::Load(temp_dir_ / "nothing.png").has_value());
}

TEST_F(EditSidecarTests, MalformedSidecarIsIgnored) {
  const auto image = temp_dir_ / "broken.png";
  std::filesystem::create_directories(EditSidecar::PathFor(image).parent_path());
  {
    std::ofstream out(EditSidecar::PathFor(image));
    out << "{ not json";
  }
  EXPECT_FALSE(EditSidecar::Load(image).has_value());

  {
    std::ofstream out(EditSidecar::PathFor(image), std::ios::trunc);
    out << R"({"crop": {"x": 2.0, "y": 0.0, "width": 0.5, "height": 0.5}})";
  }
  EXPECT_FALSE(EditSidecar::Load(image).has_value());
}
};  // namespace photograph
