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

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <opencv2/core/utils/logger.hpp>
#include <optional>
#include <string>

#include "edit/pipeline/pipeline.hpp"
#include "edit/pipeline/pipeline_cpu.hpp"
#include "edit/pipeline/pipeline_gpu.hpp"
#include "image/image_buffer.hpp"

namespace photograph {
class PhotographTests : public ::testing::Test {
 protected:
  std::filesystem::path temp_dir_;

  // Run before each test
  void                  SetUp() override {
    cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_SILENT);
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    temp_dir_        = std::filesystem::temp_directory_path() / "photograph_tests" /
                (std::string(info->test_suite_name()) + "." + info->name());
    // Make sure nothing is left over from a previous run
    std::filesystem::remove_all(temp_dir_);
    std::filesystem::create_directories(temp_dir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(temp_dir_, ec);
  }
};

inline auto MakeSolid(int width, int height, const cv::Scalar& rgba) -> ImageBuffer {
  return ImageBuffer{cv::Mat(height, width, CV_8UC4, rgba)};
}

inline auto SameBytes(const ImageBuffer& a, const ImageBuffer& b) -> bool {
  if (a.Width() != b.Width() || a.Height() != b.Height()) return false;
  if (a.Empty() && b.Empty()) return true;
  return cv::norm(a.GetCPUData(), b.GetCPUData(), cv::NORM_INF) == 0.0;
}

/**
 * @brief Stand-in for the CUDA executor. Renders with the CPU reference path, declines images
 * beyond its texture limit, and can hold renders until the test releases them.
 */
class FakeGpuExecutor : public PipelineExecutor {
 private:
  CPUPipelineExecutor     cpu_;
  int                     max_dimension_;
  bool                    available_;

  std::mutex              gate_mtx_;
  std::condition_variable gate_cv_;
  bool                    gate_open_ = true;

 public:
  std::atomic<int>        calls_{0};

  explicit FakeGpuExecutor(int max_dimension = 16384, bool available = true)
      : max_dimension_(max_dimension), available_(available) {}

  auto GetBackend() const -> PipelineBackend override { return PipelineBackend::CUDA; }

  auto TryApply(const ImageBuffer& input, const EditState& state)
      -> std::optional<ImageBuffer> override {
    ++calls_;
    {
      std::unique_lock<std::mutex> lock(gate_mtx_);
      gate_cv_.wait(lock, [this] { return gate_open_; });
    }
    if (!available_) return std::nullopt;
    if (ExceedsTextureLimit(input.Width(), input.Height(), max_dimension_)) return std::nullopt;
    return cpu_.Apply(input, state);
  }

  void CloseGate() {
    std::lock_guard<std::mutex> lock(gate_mtx_);
    gate_open_ = false;
  }

  void OpenGate() {
    {
      std::lock_guard<std::mutex> lock(gate_mtx_);
      gate_open_ = true;
    }
    gate_cv_.notify_all();
  }
};
};  // namespace photograph
