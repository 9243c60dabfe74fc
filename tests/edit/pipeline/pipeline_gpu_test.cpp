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

#include "edit/pipeline/pipeline_gpu.hpp"

#include "edit/pipeline/gpu_context.hpp"
#include "parity/parity_harness.hpp"
#include "test_fixation.hpp"

namespace photograph {
class GPUPipelineTests : public PhotographTests {
 protected:
  ImageBuffer pattern_ = Parity::MakeTestPattern(32, 24);

  void        SetUp() override {
    PhotographTests::SetUp();
    GpuRuntime::Instance();
  }

  auto RequireGpu() -> std::shared_ptr<GpuContext> { return GpuRuntime::Instance().Context(); }
};

TEST_F(GPUPipelineTests, TextureLimitIsInclusive) {
  EXPECT_FALSE(ExceedsTextureLimit(4096, 4096, 4096));
  EXPECT_TRUE(ExceedsTextureLimit(4097, 4096, 4096));
  EXPECT_TRUE(ExceedsTextureLimit(10, 4097, 4096));
}

TEST_F(GPUPipelineTests, IdentityStateNeverTouchesTheDevice) {
  GPUPipelineExecutor gpu{nullptr};
  auto                out = gpu.TryApply(pattern_, EditState{}.With(ToneOp{}));
  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(SameBytes(*out, pattern_));
  EXPECT_EQ(gpu.GetBackend(), PipelineBackend::CUDA);
}

TEST_F(GPUPipelineTests, MissingContextDeclines) {
  GPUPipelineExecutor gpu{nullptr};
  EXPECT_FALSE(gpu.HasContext());
  EXPECT_FALSE(gpu.TryApply(pattern_, EditState{}.With(RotateOp{90})).has_value());
}

TEST_F(GPUPipelineTests, RuntimeStatusIsConsistent) {
  const auto& runtime = GpuRuntime::Instance();
  const auto& status  = runtime.Status();
  EXPECT_EQ(status.available_, runtime.IsAvailable());
  if (status.available_) {
    EXPECT_EQ(status.adapter_backend_, "CUDA");
    EXPECT_EQ(status.vendor_id_, GpuContext::kNvidiaVendorId);
    EXPECT_GT(status.max_texture_dimension_, 0);
    EXPECT_FALSE(status.error_.has_value());
  } else {
    ASSERT_TRUE(status.error_.has_value());
    EXPECT_NE(StatusSummary(status).find("unavailable"), std::string::npos);
  }
  // Initialization runs once, every caller sees the same context
  EXPECT_EQ(GpuRuntime::Instance().Context(), runtime.Context());
}

TEST_F(GPUPipelineTests, ImageAtTheLimitRendersOnePixelMoreDeclines) {
  auto context = RequireGpu();
  if (!context) GTEST_SKIP() << "no discrete CUDA device";

  GPUPipelineExecutor gpu{context};
  gpu.SetMaxDimensionOverride(64);
  EXPECT_EQ(gpu.MaxDimension(), 64);

  const EditState state = EditState{}.With(ToneOp{.exposure_ = 0.5f});
  EXPECT_TRUE(gpu.TryApply(Parity::MakeTestPattern(64, 64), state).has_value());
  EXPECT_FALSE(gpu.TryApply(Parity::MakeTestPattern(65, 64), state).has_value());
  EXPECT_FALSE(gpu.TryApply(Parity::MakeTestPattern(64, 65), state).has_value());
}

TEST_F(GPUPipelineTests, OrthogonalGeometryMatchesCpuExactly) {
  auto context = RequireGpu();
  if (!context) GTEST_SKIP() << "no discrete CUDA device";

  GPUPipelineExecutor gpu{context};
  CPUPipelineExecutor cpu;
  for (int degrees : {90, 180, 270}) {
    const EditState state = EditState{}.With(RotateOp{degrees}).With(FlipOp{.horizontal_ = true});
    auto            out   = gpu.TryApply(pattern_, state);
    ASSERT_TRUE(out.has_value()) << degrees;
    EXPECT_TRUE(SameBytes(*out, cpu.Apply(pattern_, state))) << degrees;
  }
}

TEST_F(GPUPipelineTests, AlphaIsPreservedThroughColorStages) {
  auto context = RequireGpu();
  if (!context) GTEST_SKIP() << "no discrete CUDA device";

  GPUPipelineExecutor gpu{context};
  ImageBuffer         translucent = MakeSolid(16, 16, cv::Scalar(90, 120, 150, 77));
  auto                out         = gpu.TryApply(
      translucent,
      EditState{}.With(ColorOp{.saturation_ = 0.4f}).With(SharpenOp{.amount_ = 1.0f}));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->GetCPUData().at<cv::Vec4b>(8, 8)[3], 77);
}
};  // namespace photograph
