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

#include <array>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include "type/type.hpp"

namespace photograph {
enum class PipelineStageName : int {
  Geometry_Adjustment = 0,
  Basic_Adjustment    = 1,
  Color_Adjustment    = 2,
  Detail_Adjustment   = 3,
  Stage_Count         = 4
};

// Normalized rectangle in image coordinates, origin at the top-left corner
struct NormalizedRect {
  float x_      = 0.0f;
  float y_      = 0.0f;
  float width_  = 1.0f;
  float height_ = 1.0f;
};

struct HslAdjust {
  // Degrees
  float hue_        = 0.0f;
  float saturation_ = 0.0f;
  float lightness_  = 0.0f;
};

enum class SelectiveBand : int { RED, ORANGE, YELLOW, GREEN, CYAN, BLUE, PURPLE, PINK };
inline constexpr size_t kSelectiveBandCount = 8;

struct StraightenOp {
  float degrees_ = 0.0f;
};

/**
 * @brief Perspective correction. Positive vertical pulls the top corners inward, negative the
 * bottom corners; positive horizontal pulls the left corners inward, negative the right ones.
 * Both lie in [-0.5, 0.5] and scale with the image dimensions.
 */
struct KeystoneOp {
  float vertical_   = 0.0f;
  float horizontal_ = 0.0f;
};

// Clockwise orthogonal rotation; only multiples of 90 have an effect
struct RotateOp {
  int degrees_ = 0;
};

struct FlipOp {
  bool horizontal_ = false;
  bool vertical_   = false;
};

struct CropOp {
  NormalizedRect rect_;
};

struct ToneOp {
  float exposure_   = 0.0f;
  float contrast_   = 0.0f;
  float highlights_ = 0.0f;
  float shadows_    = 0.0f;
};

struct ColorOp {
  float                                       temperature_ = 0.0f;
  float                                       saturation_  = 0.0f;
  float                                       hue_shift_   = 0.0f;
  std::array<HslAdjust, kSelectiveBandCount> selective_   = {};

  auto Band(SelectiveBand band) -> HslAdjust& { return selective_[static_cast<size_t>(band)]; }
};

// Exposure ramp from the top edge (full strength) down to `bottom` (no effect)
struct GraduatedFilterOp {
  float top_      = 0.0f;
  float bottom_   = 1.0f;
  float exposure_ = 0.0f;
};

struct SharpenOp {
  float amount_ = 0.0f;
};

/**
 * The variant order is the canonical pipeline order. Both backends visit the same closed set,
 * so a missing stage is a compile error rather than a silently skipped operation.
 */
using EditOperation = std::variant<StraightenOp, KeystoneOp, RotateOp, FlipOp, CropOp, ToneOp,
                                   ColorOp, GraduatedFilterOp, SharpenOp>;

enum class OperationKind : int {
  STRAIGHTEN       = 0,
  KEYSTONE         = 1,
  ROTATE           = 2,
  FLIP             = 3,
  CROP             = 4,
  TONE             = 5,
  COLOR            = 6,
  GRADUATED_FILTER = 7,
  SHARPEN          = 8
};
inline constexpr size_t kOperationKindCount = std::variant_size_v<EditOperation>;

auto KindOf(const EditOperation& op) -> OperationKind;
auto StageOf(OperationKind kind) -> PipelineStageName;
auto KindName(OperationKind kind) -> std::string_view;

/**
 * @brief Whether an operation leaves every pixel unchanged. Thresholds match the ones the
 * pipelines use to skip a stage.
 */
auto IsIdentity(const EditOperation& op) -> bool;

/**
 * @brief Reject malformed parameters.
 *
 * @throws OperationError on non-finite values, an empty or out-of-range crop rectangle, or a
 * keystone outside [-0.5, 0.5]
 */
void Validate(const EditOperation& op);

auto NormalizeRotation(int degrees) -> int;

/**
 * @brief Immutable snapshot of the edits applied to one image. Each kind appears at most once
 * and operations are always held in canonical stage order. Mutators return a new snapshot with
 * the version incremented.
 */
class EditState {
 private:
  std::vector<EditOperation> operations_;
  state_version_t            version_ = 0;

 public:
  EditState()                                     = default;

  auto       With(EditOperation op) const -> EditState;
  auto       Without(OperationKind kind) const -> EditState;

  template <typename Op>
  auto Get() const -> std::optional<Op> {
    for (const auto& op : operations_) {
      if (const auto* typed = std::get_if<Op>(&op)) {
        return *typed;
      }
    }
    return std::nullopt;
  }

  auto       Operations() const -> const std::vector<EditOperation>& { return operations_; }
  /**
   * @brief Operations that change pixels, in canonical order.
   */
  auto       ActiveOperations() const -> std::vector<EditOperation>;
  auto       Version() const -> state_version_t { return version_; }
  auto       IsIdentity() const -> bool;
  auto       HasGeometry() const -> bool;

  /**
   * @brief Flat sidecar document: rotate, flip_h, flip_v, crop, straighten, keystone, exposure,
   * contrast, highlights, shadows, temperature, saturation, hue_shift, selective_color,
   * graduated_filter, sharpness.
   */
  auto       ToJson() const -> nlohmann::json;
  /**
   * @brief Parse the flat sidecar document. Missing fields take their defaults.
   *
   * @throws OperationError when a field holds a malformed value
   */
  static auto FromJson(const nlohmann::json& doc) -> EditState;
};
};  // namespace photograph
