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

#include "edit/pipeline/gpu_context.hpp"

#include <algorithm>
#include <atomic>
#include <opencv2/core/cuda.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <sstream>

#include "renderer/backend_policy.hpp"
#include "type/errors.hpp"

namespace photograph {
auto StatusSummary(const RuntimeStatus& status) -> std::string {
  std::ostringstream oss;
  if (status.available_) {
    oss << "gpu available: " << status.adapter_name_ << " (" << status.adapter_backend_
        << ", driver " << status.adapter_driver_ << ", vendor 0x" << std::hex
        << status.vendor_id_ << std::dec << ", max texture " << status.max_texture_dimension_
        << ")";
  } else {
    oss << "gpu unavailable: " << status.error_.value_or("unknown error");
  }
  return oss.str();
}

auto GpuContext::Initialize() -> std::shared_ptr<GpuContext> {
#ifdef HAVE_CUDA
  int device_count = 0;
  try {
    device_count = cv::cuda::getCudaEnabledDeviceCount();
  } catch (const cv::Exception& e) {
    throw InitError(std::string("[ERROR] GpuContext: CUDA query failed: ") + e.what());
  }
  if (device_count <= 0) {
    throw InitError("[ERROR] GpuContext: no CUDA device found");
  }

  std::string rejected;
  for (int id = 0; id < device_count; ++id) {
    cv::cuda::DeviceInfo info(id);
    if (!info.isCompatible()) {
      rejected += std::string(info.name()) + " (incompatible with this build) ";
      continue;
    }
    if (info.integrated()) {
      rejected += std::string(info.name()) + " (integrated) ";
      continue;
    }
    try {
      cv::cuda::setDevice(id);
    } catch (const cv::Exception& e) {
      rejected += std::string(info.name()) + " (" + e.what() + ") ";
      continue;
    }

    std::shared_ptr<GpuContext> ctx(new GpuContext());
    ctx->device_id_    = id;
    ctx->adapter_name_ = info.name();
    ctx->adapter_driver_ =
        "sm_" + std::to_string(info.majorVersion()) + std::to_string(info.minorVersion());
    const cv::Vec2i tex   = info.maxTexture2D();
    ctx->max_texture_dimension_ = std::min(tex[0], tex[1]);
    return ctx;
  }
  throw InitError("[ERROR] GpuContext: no acceptable device: " + rejected);
#else
  throw InitError("[ERROR] GpuContext: built without CUDA support");
#endif
}

GpuRuntime::GpuRuntime() {
  try {
    context_                       = GpuContext::Initialize();
    status_.available_             = true;
    status_.adapter_name_          = context_->AdapterName();
    status_.adapter_backend_       = "CUDA";
    status_.adapter_driver_        = context_->AdapterDriver();
    status_.vendor_id_             = GpuContext::kNvidiaVendorId;
    status_.max_texture_dimension_ = context_->MaxTextureDimension();
  } catch (const InitError& e) {
    context_           = nullptr;
    status_.available_ = false;
    status_.error_     = e.what();
  }
}

auto GpuRuntime::Instance() -> GpuRuntime& {
  static GpuRuntime runtime;
  return runtime;
}

void ReportGpuFallbackOnce(const std::string& reason) {
  static std::atomic<bool> reported{false};
  if (reported.exchange(true)) return;
  CV_LOG_WARNING(NULL, "[GPU] GPU unavailable, rendering on CPU because "
                           << kDebugCpuFallbackEnv << " is set: " << reason);
}
};  // namespace photograph
