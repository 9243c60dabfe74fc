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

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <new>
#include <opencv2/core/utils/logger.hpp>
#include <opencv2/imgproc.hpp>
#include <string>
#include <utility>
#include <xxhash.h>

#include "io/image/image_writer.hpp"
#include "renderer/backend_policy.hpp"
#include "utils/profiler/profiler.hpp"

namespace photograph {
auto DownscaleForPreview(const ImageBuffer& source, int max_dimension) -> ImageBuffer {
  const auto target = ResizedDimensions(source.Width(), source.Height(), max_dimension);
  if (!target || source.Empty()) {
    return source.Clone();
  }
  cv::Mat resized;
  cv::resize(source.GetCPUData(), resized, *target, 0.0, 0.0, cv::INTER_AREA);
  return ImageBuffer{std::move(resized), source.GetColorSpace()};
}

auto SourceSignature(const ImageBuffer& source) -> p_hash_t {
  XXH3_state_t* state = XXH3_createState();
  if (state == nullptr) {
    throw std::bad_alloc();
  }
  XXH3_64bits_reset(state);
  const int header[] = {source.Width(), source.Height(),
                        static_cast<int>(source.GetColorSpace())};
  XXH3_64bits_update(state, header, sizeof(header));
  const cv::Mat& pixels    = source.GetCPUData();
  const size_t   row_bytes = static_cast<size_t>(pixels.cols) * pixels.elemSize();
  for (int y = 0; y < pixels.rows; ++y) {
    XXH3_64bits_update(state, pixels.ptr(y), row_bytes);
  }
  const p_hash_t digest = XXH3_64bits_digest(state);
  XXH3_freeState(state);
  return digest;
}

auto EditSignature(const EditState& state) -> p_hash_t {
  const std::string bytes = state.ToJson().dump();
  return XXH3_64bits(bytes.data(), bytes.size());
}

PreviewScheduler::PreviewScheduler(std::shared_ptr<const RenderRouter> router,
                                   const ImageBuffer& source, PreviewOptions options)
    : router_(std::move(router)),
      full_source_(std::make_shared<const ImageBuffer>(source.Clone())),
      interactive_source_(options.max_dimension_
                              ? std::make_shared<const ImageBuffer>(
                                    DownscaleForPreview(source, *options.max_dimension_))
                              : full_source_),
      source_signature_(SourceSignature(source)),
      cache_(options.cache_capacity_),
      violation_handler_(&PreviewScheduler::DefaultViolationHandler),
      pool_(options.worker_count_) {}

PreviewScheduler::~PreviewScheduler() { pool_.WaitIdle(); }

auto PreviewScheduler::RequestRender(EditState state, PreviewQuality quality) -> generation_t {
  generation_t token;
  {
    std::lock_guard<std::mutex> lock(delivery_lock_);
    token = generation_.GenerateID();
    ++in_flight_;
  }
  pool_.Submit([this, token, quality, state = std::move(state)]() {
    RunRender(token, state, quality);
  });
  return token;
}

void PreviewScheduler::RunRender(generation_t token, const EditState& state,
                                 PreviewQuality quality) {
  EASY_BLOCK("PreviewScheduler::RunRender");
  const ImageBuffer&    input = SourceImage(quality);
  const PreviewCacheKey key{.source_signature_ = source_signature_,
                            .edit_signature_   = EditSignature(state),
                            .input_width_      = input.Width(),
                            .input_height_     = input.Height(),
                            .quality_          = quality};

  std::optional<CachedFrame> cached;
  {
    std::lock_guard<std::mutex> lock(delivery_lock_);
    cached = cache_.AccessElement(key);
    if (cached) ++cache_hits_;
  }

  if (!cached) {
    try {
      RenderOutput output = router_->Render(input, state);
      cached = CachedFrame{std::make_shared<const ImageBuffer>(std::move(output.image_)),
                           output.backend_};
    } catch (const PolicyViolation& violation) {
      ViolationHandler handler;
      {
        std::lock_guard<std::mutex> lock(delivery_lock_);
        handler = violation_handler_;
      }
      handler(violation);
      FinishRender();
      return;
    } catch (const std::exception& e) {
      CV_LOG_ERROR(NULL, "[PreviewScheduler] Render of generation " << token
                                                                    << " failed: " << e.what());
    } catch (...) {
      CV_LOG_ERROR(NULL, "[PreviewScheduler] Render of generation " << token
                                                                    << " failed: unknown error");
    }
    if (cached) {
      // Stale renders are cached too; the user may step back to that state
      std::lock_guard<std::mutex> lock(delivery_lock_);
      cache_.RecordAccess(key, *cached);
    }
  }

  FrameCallback callback;
  bool          delivered = false;
  {
    std::lock_guard<std::mutex> lock(delivery_lock_);
    if (cached && generation_.IsCurrent(token)) {
      latest_frame_ = PreviewFrame{token, cached->image_->Clone(), cached->backend_};
      ++applied_;
      delivered = true;
      callback  = frame_callback_;
    } else if (cached) {
      ++discarded_;
    }
  }
  if (delivered && callback) {
    try {
      callback(token);
    } catch (const std::exception& e) {
      CV_LOG_WARNING(NULL, "[PreviewScheduler] Frame callback threw: " << e.what());
    } catch (...) {
      CV_LOG_WARNING(NULL, "[PreviewScheduler] Frame callback threw a non-standard exception");
    }
  }
  FinishRender();
}

void PreviewScheduler::FinishRender() {
  std::lock_guard<std::mutex> lock(delivery_lock_);
  --in_flight_;
  if (in_flight_ == 0) {
    idle_condition_.notify_all();
  }
}

auto PreviewScheduler::State() const -> PreviewState {
  std::lock_guard<std::mutex> lock(delivery_lock_);
  return in_flight_ == 0 ? PreviewState::IDLE : PreviewState::RENDERING;
}

auto PreviewScheduler::TakeLatestFrame() -> std::optional<PreviewFrame> {
  std::lock_guard<std::mutex> lock(delivery_lock_);
  if (!latest_frame_) return std::nullopt;
  std::optional<PreviewFrame> frame = std::move(latest_frame_);
  latest_frame_.reset();
  if (!generation_.IsCurrent(frame->generation_)) {
    return std::nullopt;
  }
  return frame;
}

void PreviewScheduler::SetFrameCallback(FrameCallback callback) {
  std::lock_guard<std::mutex> lock(delivery_lock_);
  frame_callback_ = std::move(callback);
}

void PreviewScheduler::SetViolationHandler(ViolationHandler handler) {
  std::lock_guard<std::mutex> lock(delivery_lock_);
  violation_handler_ = handler ? std::move(handler) : &PreviewScheduler::DefaultViolationHandler;
}

void PreviewScheduler::WaitIdle() {
  std::unique_lock<std::mutex> lock(delivery_lock_);
  idle_condition_.wait(lock, [this] { return in_flight_ == 0; });
}

auto PreviewScheduler::AppliedCount() const -> size_t {
  std::lock_guard<std::mutex> lock(delivery_lock_);
  return applied_;
}

auto PreviewScheduler::DiscardedCount() const -> size_t {
  std::lock_guard<std::mutex> lock(delivery_lock_);
  return discarded_;
}

auto PreviewScheduler::CacheHitCount() const -> size_t {
  std::lock_guard<std::mutex> lock(delivery_lock_);
  return cache_hits_;
}

auto PreviewScheduler::CachedFrameCount() const -> size_t {
  std::lock_guard<std::mutex> lock(delivery_lock_);
  return cache_.Size();
}

void PreviewScheduler::DefaultViolationHandler(const PolicyViolation& violation) {
  CV_LOG_ERROR(NULL, "[PreviewScheduler] Backend policy violated: " << violation.what());
  std::cerr << "photograph: " << violation.what() << std::endl;
  // Workers cannot be joined from inside one of them, so skip static destructors
  std::quick_exit(kPolicyExitCode);
}
};  // namespace photograph
