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

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "concurrency/thread_pool.hpp"
#include "edit/state/edit_state.hpp"
#include "image/image_buffer.hpp"
#include "renderer/render_router.hpp"
#include "type/errors.hpp"
#include "type/type.hpp"
#include "utils/cache/lru_cache.hpp"
#include "utils/id/id_generator.hpp"

namespace photograph {
enum class PreviewState { IDLE, RENDERING };

// INTERACTIVE renders the downscaled source while the user drags; FINAL renders full resolution
enum class PreviewQuality { INTERACTIVE, FINAL };

inline constexpr size_t kPreviewCacheCapacity = 24;

struct PreviewCacheKey {
  p_hash_t       source_signature_ = 0;
  p_hash_t       edit_signature_   = 0;
  int            input_width_      = 0;
  int            input_height_     = 0;
  PreviewQuality quality_          = PreviewQuality::INTERACTIVE;

  auto           operator==(const PreviewCacheKey&) const -> bool = default;
};
};  // namespace photograph

template <>
struct std::hash<photograph::PreviewCacheKey> {
  auto operator()(const photograph::PreviewCacheKey& key) const noexcept -> size_t {
    size_t seed = std::hash<uint64_t>{}(key.source_signature_);
    auto   mix  = [&seed](size_t v) {
      seed ^= v + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    };
    mix(std::hash<uint64_t>{}(key.edit_signature_));
    mix(std::hash<int>{}(key.input_width_));
    mix(std::hash<int>{}(key.input_height_));
    mix(static_cast<size_t>(key.quality_));
    return seed;
  }
};

namespace photograph {
struct PreviewFrame {
  generation_t    generation_ = 0;
  ImageBuffer     image_;
  PipelineBackend backend_    = PipelineBackend::CPU;
};

struct PreviewOptions {
  // Long edge of the interactive source; nullopt keeps full resolution
  std::optional<int> max_dimension_  = 960;
  size_t             worker_count_   = 1;
  // Rendered frames kept for revisited edit states; 0 disables the cache
  size_t             cache_capacity_ = kPreviewCacheCapacity;
};

/**
 * @brief Downscale so the long edge is at most `max_dimension` (area interpolation). Smaller
 * images are copied unchanged.
 */
auto DownscaleForPreview(const ImageBuffer& source, int max_dimension) -> ImageBuffer;

// XXH3 over dimensions, colour space and pixel rows
auto SourceSignature(const ImageBuffer& source) -> p_hash_t;

// XXH3 over the sidecar serialization of the edit state; the version counter is not part of it
auto EditSignature(const EditState& state) -> p_hash_t;

/**
 * @brief Live-preview controller for one open image. Every edit-state change gets a new
 * generation token and a background render; a finished render is kept only if its token is
 * still the current one when it completes. In-flight work is never interrupted.
 *
 * Rendered frames are cached by (source, edit state, input size, quality). A cache hit skips the
 * render but is delivered under the same token rule as a fresh render.
 */
class PreviewScheduler {
 public:
  // Invoked on a worker thread with the token of a freshly stored frame
  using FrameCallback    = std::function<void(generation_t)>;
  using ViolationHandler = std::function<void(const PolicyViolation&)>;

  PreviewScheduler(std::shared_ptr<const RenderRouter> router, const ImageBuffer& source,
                   PreviewOptions options = {});
  ~PreviewScheduler();

  PreviewScheduler(const PreviewScheduler&)            = delete;
  PreviewScheduler& operator=(const PreviewScheduler&) = delete;

  /**
   * @brief Issue a new generation token and schedule a render of `state`. Never blocks on the
   * render itself.
   *
   * @param quality INTERACTIVE renders the downscaled source, FINAL the full-resolution one
   * @return the token assigned to this request
   */
  auto RequestRender(EditState state, PreviewQuality quality = PreviewQuality::INTERACTIVE)
      -> generation_t;

  auto CurrentGeneration() const -> generation_t { return generation_.GetCurrentID(); }
  auto State() const -> PreviewState;

  /**
   * @brief Mailbox handoff for the UI thread. Returns the stored frame only if it still belongs
   * to the current generation.
   */
  auto TakeLatestFrame() -> std::optional<PreviewFrame>;

  void SetFrameCallback(FrameCallback callback);

  /**
   * @brief Replace the policy-violation handler. The default logs and terminates the process
   * with kPolicyExitCode.
   */
  void SetViolationHandler(ViolationHandler handler);

  void WaitIdle();

  auto SourceImage(PreviewQuality quality = PreviewQuality::INTERACTIVE) const
      -> const ImageBuffer& {
    return quality == PreviewQuality::FINAL ? *full_source_ : *interactive_source_;
  }
  auto AppliedCount() const -> size_t;
  auto DiscardedCount() const -> size_t;
  auto CacheHitCount() const -> size_t;
  auto CachedFrameCount() const -> size_t;

  static void DefaultViolationHandler(const PolicyViolation& violation);

 private:
  struct CachedFrame {
    std::shared_ptr<const ImageBuffer> image_;
    PipelineBackend                    backend_ = PipelineBackend::CPU;
  };

  std::shared_ptr<const RenderRouter> router_;
  std::shared_ptr<const ImageBuffer>  full_source_;
  std::shared_ptr<const ImageBuffer>  interactive_source_;
  p_hash_t                            source_signature_ = 0;
  IncrID::IDGenerator<generation_t>   generation_{0};

  mutable std::mutex                  delivery_lock_;
  std::condition_variable             idle_condition_;
  std::optional<PreviewFrame>         latest_frame_;
  size_t                              in_flight_  = 0;
  size_t                              applied_    = 0;
  size_t                              discarded_  = 0;
  size_t                              cache_hits_ = 0;
  LRUCache<PreviewCacheKey, CachedFrame> cache_;
  FrameCallback                       frame_callback_;
  ViolationHandler                    violation_handler_;

  // Declared last so workers are joined before the members they touch are destroyed
  ThreadPool                          pool_;

  void                                RunRender(generation_t token, const EditState& state,
                                                PreviewQuality quality);
  void                                FinishRender();
};
};  // namespace photograph
