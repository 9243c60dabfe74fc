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

#include "parity/parity_harness.hpp"

#include <set>

#include "edit/pipeline/gpu_context.hpp"
#include "test_fixation.hpp"

namespace photograph {
class ParityHarnessTests : public PhotographTests {};

TEST_F(ParityHarnessTests, IdenticalImagesPass) {
  const ImageBuffer pattern = Parity::MakeTestPattern(16, 12);
  const auto        report  = Parity::CompareRgba(pattern, pattern.Clone(), 0, false);
  EXPECT_TRUE(report.passed_);
  EXPECT_EQ(report.max_difference_, 0);
  EXPECT_EQ(report.compared_pixels_, 16u * 12u);
}

TEST_F(ParityHarnessTests, ToleranceIsInclusive) {
  const ImageBuffer reference = MakeSolid(4, 4, cv::Scalar(100, 100, 100, 255));
  cv::Mat           pixels    = reference.CloneCPUData();
  pixels.at<cv::Vec4b>(1, 2)[1] = 102;
  const ImageBuffer candidate{std::move(pixels)};

  auto report = Parity::CompareRgba(reference, candidate, 2, false);
  EXPECT_TRUE(report.passed_);
  EXPECT_EQ(report.max_difference_, 2);

  report = Parity::CompareRgba(reference, candidate, 1, false);
  EXPECT_FALSE(report.passed_);
  EXPECT_EQ(report.failing_pixels_, 1u);
}

TEST_F(ParityHarnessTests, AlphaDifferencesCount) {
  const ImageBuffer reference = MakeSolid(2, 2, cv::Scalar(10, 20, 30, 255));
  const ImageBuffer candidate = MakeSolid(2, 2, cv::Scalar(10, 20, 30, 200));
  EXPECT_FALSE(Parity::CompareRgba(reference, candidate, 4, false).passed_);
}

TEST_F(ParityHarnessTests, SizeMismatchFails) {
  const auto report = Parity::CompareRgba(MakeSolid(4, 4, cv::Scalar::all(255)),
                                          MakeSolid(4, 5, cv::Scalar::all(255)), 16, false);
  EXPECT_FALSE(report.passed_);
  EXPECT_TRUE(report.size_mismatch_);
  EXPECT_NE(report.message_.find("size mismatch"), std::string::npos);
}

TEST_F(ParityHarnessTests, FillPixelsAreSkippedBelowTheRatio) {
  // 5 of 8 pixels are black fill on the reference
  cv::Mat ref(2, 4, CV_8UC4, cv::Scalar(0, 0, 0, 255));
  cv::Mat cand = ref.clone();
  for (int x = 0; x < 3; ++x) {
    ref.at<cv::Vec4b>(1, x)  = cv::Vec4b(120, 120, 120, 255);
    cand.at<cv::Vec4b>(1, x) = cv::Vec4b(121, 120, 120, 255);
  }
  // A fill pixel on either side is excluded even if the other side differs
  cand.at<cv::Vec4b>(0, 0) = cv::Vec4b(200, 200, 200, 255);
  const ImageBuffer reference{std::move(ref)};
  const ImageBuffer candidate{std::move(cand)};

  const auto report = Parity::CompareRgba(reference, candidate, 1, true);
  EXPECT_TRUE(report.passed_) << report.message_;
  EXPECT_EQ(report.skipped_pixels_, 5u);
  EXPECT_EQ(report.compared_pixels_, 3u);
  EXPECT_DOUBLE_EQ(report.skipped_ratio_, 0.625);

  EXPECT_FALSE(Parity::CompareRgba(reference, candidate, 1, false).passed_);
}

TEST_F(ParityHarnessTests, MostlyBlackOutputFails) {
  // Exactly three quarters skipped is already too many
  cv::Mat ref(1, 4, CV_8UC4, cv::Scalar(0, 0, 0, 255));
  ref.at<cv::Vec4b>(0, 3) = cv::Vec4b(50, 60, 70, 255);
  const ImageBuffer reference{std::move(ref)};

  const auto report = Parity::CompareRgba(reference, reference.Clone(), 16, true);
  EXPECT_FALSE(report.passed_);
  EXPECT_EQ(report.failing_pixels_, 0u);
  EXPECT_DOUBLE_EQ(report.skipped_ratio_, Parity::kMaxSkippedFillRatio);

  const auto all_black = MakeSolid(8, 8, cv::Scalar(0, 0, 0, 255));
  EXPECT_FALSE(Parity::CompareRgba(all_black, all_black.Clone(), 16, true).passed_);
}

TEST_F(ParityHarnessTests, StandardCasesAreWellFormed) {
  const auto            cases = Parity::StandardParityCases();
  std::set<std::string> names;
  for (const auto& parity_case : cases) {
    EXPECT_TRUE(names.insert(parity_case.name_).second) << parity_case.name_;
    EXPECT_FALSE(parity_case.state_.IsIdentity()) << parity_case.name_;
    EXPECT_FALSE(parity_case.make_input_().Empty());
  }
  EXPECT_EQ(cases.size(), 14u);
  EXPECT_EQ(names.count("rotate_90"), 1u);
  EXPECT_EQ(names.count("keystone"), 1u);

  for (const auto& parity_case : cases) {
    if (parity_case.name_ == "rotate_90" || parity_case.name_ == "crop") {
      EXPECT_EQ(parity_case.tolerance_, Parity::Tolerance::kExactGeometry);
      EXPECT_FALSE(parity_case.skip_fill_);
    }
    if (parity_case.name_ == "straighten" || parity_case.name_ == "keystone") {
      EXPECT_TRUE(parity_case.skip_fill_);
    }
  }
}

TEST_F(ParityHarnessTests, SuitePassesAgainstMatchingBackend) {
  FakeGpuExecutor     gpu;
  CPUPipelineExecutor cpu;
  const auto          results =
      Parity::RunParitySuite(gpu, cpu, Parity::StandardParityCases());
  ASSERT_EQ(results.size(), 14u);
  for (const auto& result : results) {
    EXPECT_TRUE(result.rendered_) << result.name_;
    EXPECT_TRUE(result.report_.passed_) << result.name_ << ": " << result.report_.message_;
    EXPECT_EQ(result.report_.max_difference_, 0) << result.name_;
  }
}

TEST_F(ParityHarnessTests, DeclinedRenderFailsTheCase) {
  FakeGpuExecutor     gpu(16384, false);
  CPUPipelineExecutor cpu;
  const auto          results =
      Parity::RunParitySuite(gpu, cpu, Parity::StandardParityCases());
  for (const auto& result : results) {
    EXPECT_FALSE(result.rendered_);
    EXPECT_FALSE(result.report_.passed_);
  }
}

TEST_F(ParityHarnessTests, CudaMatchesCpuReference) {
  auto context = GpuRuntime::Instance().Context();
  if (!context) {
    GTEST_SKIP() << StatusSummary(GpuRuntime::Instance().Status());
  }
  GPUPipelineExecutor gpu(context);
  CPUPipelineExecutor cpu;
  for (const auto& result : Parity::RunParitySuite(gpu, cpu, Parity::StandardParityCases())) {
    EXPECT_TRUE(result.rendered_) << result.name_;
    EXPECT_TRUE(result.report_.passed_) << result.name_ << ": " << result.report_.message_;
  }
}
};  // namespace photograph
