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

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace photograph {
/**
 * @brief Snapshot of GPU discovery, reported by `photograph status` and logged at startup.
 */
struct RuntimeStatus {
  bool                  available_             = false;
  std::string           adapter_name_;
  std::string           adapter_backend_;
  std::string           adapter_driver_;
  uint32_t              vendor_id_             = 0;
  int                   max_texture_dimension_ = 0;
  std::optional<std::string> error_;
};

auto StatusSummary(const RuntimeStatus& status) -> std::string;

/**
 * @brief A selected CUDA device. Only a discrete device that OpenCV was built for is accepted;
 * software or integrated adapters never pass.
 */
class GpuContext {
 private:
  int         device_id_             = -1;
  std::string adapter_name_;
  std::string adapter_driver_;
  int         max_texture_dimension_ = 0;
  std::mutex  render_lock_;

  GpuContext() = default;

  friend class GpuRuntime;

 public:
  static constexpr uint32_t kNvidiaVendorId = 0x10DE;

  /**
   * @brief Select and bind the first acceptable device.
   *
   * @throws InitError when no device passes, or when built without CUDA support
   */
  static auto Initialize() -> std::shared_ptr<GpuContext>;

  auto        DeviceId() const -> int { return device_id_; }
  auto        AdapterName() const -> const std::string& { return adapter_name_; }
  auto        AdapterDriver() const -> const std::string& { return adapter_driver_; }
  auto        MaxTextureDimension() const -> int { return max_texture_dimension_; }

  // Renders on one context are serialized
  auto        GetRenderLock() -> std::mutex& { return render_lock_; }
};

/**
 * @brief Process-wide GPU discovery. Initialization runs once on first use; every caller then
 * shares the same context (or the same failure).
 */
class GpuRuntime {
 private:
  std::shared_ptr<GpuContext> context_;
  RuntimeStatus               status_;

  GpuRuntime();

 public:
  GpuRuntime(const GpuRuntime&)            = delete;
  GpuRuntime& operator=(const GpuRuntime&) = delete;

  static auto Instance() -> GpuRuntime&;

  auto        Context() const -> std::shared_ptr<GpuContext> { return context_; }
  auto        Status() const -> const RuntimeStatus& { return status_; }
  auto        IsAvailable() const -> bool { return context_ != nullptr; }
};

/**
 * @brief Log the "GPU unavailable, rendering on CPU" warning, at most once per process.
 */
void        ReportGpuFallbackOnce(const std::string& reason);
};  // namespace photograph
