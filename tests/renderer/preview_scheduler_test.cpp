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

#include "renderer/preview_scheduler.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "parity/parity_harness.hpp"
#include "renderer/backend_policy.hpp"
#include "test_fixation.hpp"

namespace photograph {
class PreviewSchedulerTests : public PhotographTests {
 protected:
  ImageBuffer source_ = Parity::MakeTestPattern(48, 32);

  static auto MakeRouter(std::shared_ptr<PipelineExecutor> gpu, bool gpu_available, bool debug)
      -> std::shared_ptr<const RenderRouter> {
    return std::make_shared<const RenderRouter>(
        BackendPolicy(gpu_available, debug).Resolve(BackendMode::AUTO), std::move(gpu));
  }

  static auto ExposureState(float exposure) -> EditState {
    return EditState{}.With(ToneOp{.exposure_ = exposure});
  }
};

TEST_F(PreviewSchedulerTests, OnlyTheNewestGenerationIsApplied) {
  auto             gpu = std::make_shared<FakeGpuExecutor>();
  PreviewScheduler scheduler(MakeRouter(gpu, true, false), source_);

  gpu->CloseGate();
  std::vector<generation_t> tokens;
  for (int i = 1; i <= 5; ++i) {
    tokens.push_back(scheduler.RequestRender(ExposureState(0.1f * i)));
  }
  for (size_t i = 1; i < tokens.size(); ++i) {
    EXPECT_GT(tokens[i], tokens[i - 1]);
  }
  EXPECT_EQ(scheduler.CurrentGeneration(), tokens.back());
  EXPECT_EQ(scheduler.State(), PreviewState::RENDERING);

  gpu->OpenGate();
  scheduler.WaitIdle();
  EXPECT_EQ(scheduler.State(), PreviewState::IDLE);
  EXPECT_EQ(scheduler.AppliedCount(), 1u);
  EXPECT_EQ(scheduler.DiscardedCount(), 4u);

  auto frame = scheduler.TakeLatestFrame();
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->generation_, tokens.back());
  EXPECT_EQ(frame->backend_, PipelineBackend::CUDA);
  EXPECT_TRUE(SameBytes(frame->image_, CPUPipelineExecutor{}.Apply(source_, ExposureState(0.1f * 5))));

  // The mailbox is emptied by a take
  EXPECT_FALSE(scheduler.TakeLatestFrame().has_value());
}

TEST_F(PreviewSchedulerTests, StaleFrameIsNotHandedOut) {
  auto             gpu = std::make_shared<FakeGpuExecutor>();
  PreviewScheduler scheduler(MakeRouter(gpu, true, false), source_);

  scheduler.RequestRender(ExposureState(0.2f));
  scheduler.WaitIdle();

  gpu->CloseGate();
  const auto newer = scheduler.RequestRender(ExposureState(0.4f));
  EXPECT_FALSE(scheduler.TakeLatestFrame().has_value());

  gpu->OpenGate();
  scheduler.WaitIdle();
  auto frame = scheduler.TakeLatestFrame();
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->generation_, newer);
}

TEST_F(PreviewSchedulerTests, FrameCallbackReceivesAppliedToken) {
  auto             gpu = std::make_shared<FakeGpuExecutor>();
  PreviewScheduler scheduler(MakeRouter(gpu, true, false), source_);

  std::atomic<generation_t> notified{0};
  std::atomic<int>          notifications{0};
  scheduler.SetFrameCallback([&](generation_t token) {
    notified = token;
    ++notifications;
  });

  const auto token = scheduler.RequestRender(ExposureState(0.3f));
  scheduler.WaitIdle();
  EXPECT_EQ(notifications.load(), 1);
  EXPECT_EQ(notified.load(), token);
}

TEST_F(PreviewSchedulerTests, PolicyViolationReachesTheHandler) {
  // The device declines every render and the debug flag is off
  auto             gpu = std::make_shared<FakeGpuExecutor>(16384, false);
  PreviewScheduler scheduler(MakeRouter(gpu, true, false), source_);

  std::atomic<int> violations{0};
  scheduler.SetViolationHandler([&](const PolicyViolation&) { ++violations; });

  scheduler.RequestRender(ExposureState(0.3f));
  scheduler.WaitIdle();
  EXPECT_EQ(violations.load(), 1);
  EXPECT_EQ(scheduler.AppliedCount(), 0u);
  EXPECT_FALSE(scheduler.TakeLatestFrame().has_value());
}

TEST_F(PreviewSchedulerTests, DebugFlagFallsBackToCpu) {
  auto             gpu = std::make_shared<FakeGpuExecutor>(16384, false);
  PreviewScheduler scheduler(MakeRouter(gpu, true, true), source_);

  std::atomic<int> violations{0};
  scheduler.SetViolationHandler([&](const PolicyViolation&) { ++violations; });

  scheduler.RequestRender(ExposureState(0.3f));
  scheduler.WaitIdle();
  EXPECT_EQ(violations.load(), 0);
  auto frame = scheduler.TakeLatestFrame();
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->backend_, PipelineBackend::CPU);
}

TEST_F(PreviewSchedulerTests, SourceIsDownscaledForInteractiveUse) {
  auto             gpu = std::make_shared<FakeGpuExecutor>();
  ImageBuffer      large = MakeSolid(2000, 1000, cv::Scalar(90, 120, 150, 255));
  PreviewScheduler scheduler(MakeRouter(gpu, true, false), large);
  EXPECT_EQ(scheduler.SourceImage().Width(), 960);
  EXPECT_EQ(scheduler.SourceImage().Height(), 480);

  PreviewScheduler full(MakeRouter(gpu, true, false), large,
                        PreviewOptions{.max_dimension_ = std::nullopt});
  EXPECT_EQ(full.SourceImage().Width(), 2000);

  ImageBuffer small = DownscaleForPreview(source_, 960);
  EXPECT_TRUE(SameBytes(small, source_));
}

TEST_F(PreviewSchedulerTests, DestructionWaitsForOutstandingWork) {
  auto gpu = std::make_shared<FakeGpuExecutor>();
  {
    PreviewScheduler scheduler(MakeRouter(gpu, true, false), source_,
                               PreviewOptions{.worker_count_ = 2});
    for (int i = 0; i < 8; ++i) {
      scheduler.RequestRender(ExposureState(0.05f * i));
    }
  }
  EXPECT_EQ(gpu->calls_.load(), 8);
}
TEST_F(PreviewSchedulerTests, RevisitedStateIsServedFromTheCache) {
  auto             gpu = std::make_shared<FakeGpuExecutor>();
  PreviewScheduler scheduler(MakeRouter(gpu, true, false), source_);

  scheduler.RequestRender(ExposureState(0.3f));
  scheduler.RequestRender(ExposureState(-0.6f));
  const auto revisit = scheduler.RequestRender(ExposureState(0.3f));
  scheduler.WaitIdle();

  EXPECT_EQ(gpu->calls_.load(), 2);
  EXPECT_EQ(scheduler.CacheHitCount(), 1u);
  EXPECT_EQ(scheduler.CachedFrameCount(), 2u);
  auto frame = scheduler.TakeLatestFrame();
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->generation_, revisit);
  EXPECT_EQ(frame->backend_, PipelineBackend::CUDA);
  EXPECT_TRUE(SameBytes(frame->image_, CPUPipelineExecutor{}.Apply(source_, ExposureState(0.3f))));
}

TEST_F(PreviewSchedulerTests, StaleCacheHitDoesNotOverwriteNewerFrame) {
  auto             gpu = std::make_shared<FakeGpuExecutor>();
  PreviewScheduler scheduler(MakeRouter(gpu, true, false), source_,
                             PreviewOptions{.worker_count_ = 1});
  scheduler.RequestRender(ExposureState(0.3f));
  scheduler.WaitIdle();
  ASSERT_TRUE(scheduler.TakeLatestFrame().has_value());

  // One worker runs the queue in order: a miss, then a hit that is already stale, then a miss
  gpu->CloseGate();
  scheduler.RequestRender(ExposureState(0.9f));
  scheduler.RequestRender(ExposureState(0.3f));
  const auto newest = scheduler.RequestRender(ExposureState(-0.4f));
  gpu->OpenGate();
  scheduler.WaitIdle();

  EXPECT_EQ(scheduler.CacheHitCount(), 1u);
  EXPECT_EQ(scheduler.AppliedCount(), 2u);
  EXPECT_EQ(scheduler.DiscardedCount(), 2u);
  EXPECT_EQ(gpu->calls_.load(), 3);
  auto frame = scheduler.TakeLatestFrame();
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->generation_, newest);
  EXPECT_TRUE(
      SameBytes(frame->image_, CPUPipelineExecutor{}.Apply(source_, ExposureState(-0.4f))));
}

TEST_F(PreviewSchedulerTests, OlderRenderDoesNotOverwriteNewerCacheHit) {
  auto             gpu = std::make_shared<FakeGpuExecutor>();
  PreviewScheduler scheduler(MakeRouter(gpu, true, false), source_,
                             PreviewOptions{.worker_count_ = 2});
  scheduler.RequestRender(ExposureState(0.3f));
  scheduler.WaitIdle();

  gpu->CloseGate();
  scheduler.RequestRender(ExposureState(0.9f));
  const auto hit = scheduler.RequestRender(ExposureState(0.3f));

  // The hit is delivered while the older render is still held
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (scheduler.AppliedCount() < 2 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  EXPECT_EQ(scheduler.AppliedCount(), 2u);

  gpu->OpenGate();
  scheduler.WaitIdle();
  EXPECT_EQ(scheduler.DiscardedCount(), 1u);
  auto frame = scheduler.TakeLatestFrame();
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->generation_, hit);
  EXPECT_TRUE(SameBytes(frame->image_, CPUPipelineExecutor{}.Apply(source_, ExposureState(0.3f))));
}

TEST_F(PreviewSchedulerTests, FinalQualityRendersFullResolution) {
  auto             gpu   = std::make_shared<FakeGpuExecutor>();
  ImageBuffer      large = MakeSolid(2000, 1000, cv::Scalar(90, 120, 150, 255));
  PreviewScheduler scheduler(MakeRouter(gpu, true, false), large);
  EXPECT_EQ(scheduler.SourceImage(PreviewQuality::FINAL).Width(), 2000);

  scheduler.RequestRender(ExposureState(0.3f));
  scheduler.WaitIdle();
  auto interactive = scheduler.TakeLatestFrame();
  ASSERT_TRUE(interactive.has_value());
  EXPECT_EQ(interactive->image_.Width(), 960);
  EXPECT_EQ(interactive->image_.Height(), 480);

  // Same edit state, other quality: a separate cache entry
  scheduler.RequestRender(ExposureState(0.3f), PreviewQuality::FINAL);
  scheduler.WaitIdle();
  auto final_frame = scheduler.TakeLatestFrame();
  ASSERT_TRUE(final_frame.has_value());
  EXPECT_EQ(final_frame->image_.Width(), 2000);
  EXPECT_EQ(final_frame->image_.Height(), 1000);
  EXPECT_EQ(scheduler.CacheHitCount(), 0u);
  EXPECT_EQ(gpu->calls_.load(), 2);

  scheduler.RequestRender(ExposureState(0.3f), PreviewQuality::FINAL);
  scheduler.WaitIdle();
  EXPECT_EQ(scheduler.CacheHitCount(), 1u);
  EXPECT_EQ(scheduler.TakeLatestFrame()->image_.Width(), 2000);
}

TEST_F(PreviewSchedulerTests, CacheCapacityBoundsStoredFrames) {
  auto             gpu = std::make_shared<FakeGpuExecutor>();
  PreviewScheduler scheduler(MakeRouter(gpu, true, false), source_,
                             PreviewOptions{.cache_capacity_ = 1});
  scheduler.RequestRender(ExposureState(0.3f));
  scheduler.RequestRender(ExposureState(-0.6f));
  scheduler.RequestRender(ExposureState(0.3f));
  scheduler.WaitIdle();
  EXPECT_EQ(scheduler.CachedFrameCount(), 1u);
  EXPECT_EQ(scheduler.CacheHitCount(), 0u);
  EXPECT_EQ(gpu->calls_.load(), 3);

  auto             uncached_gpu = std::make_shared<FakeGpuExecutor>();
  PreviewScheduler uncached(MakeRouter(uncached_gpu, true, false), source_,
                            PreviewOptions{.cache_capacity_ = 0});
  uncached.RequestRender(ExposureState(0.3f));
  uncached.RequestRender(ExposureState(0.3f));
  uncached.WaitIdle();
  EXPECT_EQ(uncached.CachedFrameCount(), 0u);
  EXPECT_EQ(uncached_gpu->calls_.load(), 2);
}

TEST_F(PreviewSchedulerTests, SignaturesFollowContent) {
  EXPECT_EQ(EditSignature(ExposureState(0.3f)), EditSignature(ExposureState(0.3f)));
  EXPECT_NE(EditSignature(ExposureState(0.3f)), EditSignature(ExposureState(0.4f)));
  // Two edits that reach the same values through different histories match
  EXPECT_EQ(EditSignature(ExposureState(0.1f).With(ToneOp{.exposure_ = 0.3f})),
            EditSignature(ExposureState(0.3f)));

  EXPECT_EQ(SourceSignature(source_), SourceSignature(source_.Clone()));
  EXPECT_NE(SourceSignature(MakeSolid(4, 4, cv::Scalar(1, 2, 3, 255))),
            SourceSignature(MakeSolid(4, 4, cv::Scalar(1, 2, 4, 255))));
  EXPECT_NE(SourceSignature(MakeSolid(4, 8, cv::Scalar(0, 0, 0, 255))),
            SourceSignature(MakeSolid(8, 4, cv::Scalar(0, 0, 0, 255))));
}

TEST_F(PreviewSchedulerTests, DefaultViolationHandlerExitsWithPolicyCode) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  EXPECT_EXIT(PreviewScheduler::DefaultViolationHandler(PolicyViolation("gpu refused")),
              ::testing::ExitedWithCode(kPolicyExitCode), "gpu refused");
}

TEST_F(PreviewSchedulerTests, UnhandledViolationInAWorkerExitsWithPolicyCode) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  EXPECT_EXIT(
      {
        auto             gpu = std::make_shared<FakeGpuExecutor>(16384, false);
        PreviewScheduler scheduler(MakeRouter(gpu, true, false), source_);
        scheduler.RequestRender(ExposureState(0.3f));
        scheduler.WaitIdle();
      },
      ::testing::ExitedWithCode(kPolicyExitCode), "");
}
};  // namespace photograph
