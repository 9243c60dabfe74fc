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

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "edit/pipeline/pipeline.hpp"
#include "edit/pipeline/pipeline_cpu.hpp"
#include "edit/state/edit_state.hpp"
#include "image/image_buffer.hpp"

namespace photograph {
namespace Parity {
// Skipped fill pixels must stay strictly below this fraction of the image
inline constexpr double kMaxSkippedFillRatio = 0.75;

// Maximum per-channel absolute difference accepted between backends
namespace Tolerance {
inline constexpr int kExactGeometry = 0;
inline constexpr int kColor         = 2;
inline constexpr int kTone          = 2;
inline constexpr int kGraduated     = 2;
inline constexpr int kSharpen       = 3;
inline constexpr int kColorSharpen  = 4;
inline constexpr int kStraighten    = 12;
inline constexpr int kKeystone      = 16;
inline constexpr int kFullPipeline  = 16;
};  // namespace Tolerance

struct ParityReport {
  bool        passed_          = false;
  bool        size_mismatch_   = false;
  int         max_difference_  = 0;
  size_t      compared_pixels_ = 0;
  size_t      skipped_pixels_  = 0;
  size_t      failing_pixels_  = 0;
  double      skipped_ratio_   = 0.0;
  std::string message_;
};

/**
 * @brief Compare two RGBA8 images channel by channel.
 *
 * With `skip_fill`, a pixel whose RGB is exactly black on either side is excluded from the
 * comparison; the comparison then fails if the excluded fraction reaches kMaxSkippedFillRatio.
 */
auto CompareRgba(const ImageBuffer& reference, const ImageBuffer& candidate, int tolerance,
                 bool skip_fill) -> ParityReport;

/**
 * @brief Deterministic RGBA pattern: ((7x+3y), (11x+5y), (13x+17y)) mod 256, opaque.
 */
auto MakeTestPattern(int width, int height) -> ImageBuffer;

/**
 * @brief Left half dark gray, right half light gray. Used for sharpening.
 */
auto MakeEdgePattern(int width, int height) -> ImageBuffer;

struct ParityCase {
  std::string                  name_;
  EditState                    state_;
  int                          tolerance_ = 0;
  bool                         skip_fill_ = false;
  std::function<ImageBuffer()> make_input_;
};

auto StandardParityCases() -> std::vector<ParityCase>;

struct ParityCaseResult {
  std::string  name_;
  // False when the GPU backend declined the render
  bool         rendered_ = false;
  ParityReport report_;
};

/**
 * @brief Render every case on both backends and compare. A declined GPU render counts as a
 * failure of that case.
 */
auto RunParitySuite(PipelineExecutor& gpu, const CPUPipelineExecutor& cpu,
                    const std::vector<ParityCase>& cases) -> std::vector<ParityCaseResult>;
};  // namespace Parity
};  // namespace photograph
