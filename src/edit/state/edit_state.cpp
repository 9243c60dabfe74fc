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

#include "edit/state/edit_state.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <type_traits>
#include <utility>

#include "type/errors.hpp"

namespace photograph {
namespace {
constexpr float kStraightenEpsilon = 0.01f;
constexpr float kParamEpsilon      = 0.001f;
constexpr float kGradientEpsilon   = 0.0001f;
constexpr float kKeystoneLimit     = 0.5f;

void RequireFinite(float value, std::string_view field) {
  if (!std::isfinite(value)) {
    throw OperationError("[ERROR] EditState: " + std::string(field) + " must be finite");
  }
}

auto IsNeutral(const HslAdjust& adjust) -> bool {
  return std::abs(adjust.hue_) < kParamEpsilon && std::abs(adjust.saturation_) < kParamEpsilon &&
         std::abs(adjust.lightness_) < kParamEpsilon;
}

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
}  // namespace

auto KindOf(const EditOperation& op) -> OperationKind { return static_cast<OperationKind>(op.index()); }

auto StageOf(OperationKind kind) -> PipelineStageName {
  switch (kind) {
    case OperationKind::STRAIGHTEN:
    case OperationKind::KEYSTONE:
    case OperationKind::ROTATE:
    case OperationKind::FLIP:
    case OperationKind::CROP:
      return PipelineStageName::Geometry_Adjustment;
    case OperationKind::TONE:
      return PipelineStageName::Basic_Adjustment;
    case OperationKind::COLOR:
    case OperationKind::GRADUATED_FILTER:
      return PipelineStageName::Color_Adjustment;
    case OperationKind::SHARPEN:
      return PipelineStageName::Detail_Adjustment;
  }
  throw OperationError("[ERROR] EditState: unknown operation kind");
}

auto KindName(OperationKind kind) -> std::string_view {
  switch (kind) {
    case OperationKind::STRAIGHTEN:
      return "straighten";
    case OperationKind::KEYSTONE:
      return "keystone";
    case OperationKind::ROTATE:
      return "rotate";
    case OperationKind::FLIP:
      return "flip";
    case OperationKind::CROP:
      return "crop";
    case OperationKind::TONE:
      return "tone";
    case OperationKind::COLOR:
      return "color";
    case OperationKind::GRADUATED_FILTER:
      return "graduated_filter";
    case OperationKind::SHARPEN:
      return "sharpen";
  }
  return "unknown";
}

auto NormalizeRotation(int degrees) -> int {
  const int r = degrees % 360;
  return r < 0 ? r + 360 : r;
}

auto IsIdentity(const EditOperation& op) -> bool {
  return std::visit(
      Overloaded{
          [](const StraightenOp& o) { return std::abs(o.degrees_) <= kStraightenEpsilon; },
          [](const KeystoneOp& o) {
            return std::abs(o.vertical_) <= kParamEpsilon && std::abs(o.horizontal_) <= kParamEpsilon;
          },
          [](const RotateOp& o) {
            const int r = NormalizeRotation(o.degrees_);
            return r != 90 && r != 180 && r != 270;
          },
          [](const FlipOp& o) { return !o.horizontal_ && !o.vertical_; },
          [](const CropOp& o) {
            return o.rect_.x_ <= 0.0f && o.rect_.y_ <= 0.0f && o.rect_.width_ >= 1.0f &&
                   o.rect_.height_ >= 1.0f;
          },
          [](const ToneOp& o) {
            return std::abs(o.exposure_) < kParamEpsilon && std::abs(o.contrast_) < kParamEpsilon &&
                   std::abs(o.highlights_) < kParamEpsilon && std::abs(o.shadows_) < kParamEpsilon;
          },
          [](const ColorOp& o) {
            return std::abs(o.temperature_) < kParamEpsilon &&
                   std::abs(o.saturation_) < kParamEpsilon &&
                   std::abs(o.hue_shift_) < kParamEpsilon &&
                   std::all_of(o.selective_.begin(), o.selective_.end(), IsNeutral);
          },
          [](const GraduatedFilterOp& o) {
            const float top    = std::clamp(o.top_, 0.0f, 1.0f);
            const float bottom = std::clamp(o.bottom_, 0.0f, 1.0f);
            return std::abs(o.exposure_) < kParamEpsilon || bottom <= top + kGradientEpsilon;
          },
          [](const SharpenOp& o) { return o.amount_ < kParamEpsilon; }},
      op);
}

void Validate(const EditOperation& op) {
  std::visit(Overloaded{[](const StraightenOp& o) { RequireFinite(o.degrees_, "straighten"); },
                        [](const KeystoneOp& o) {
                          RequireFinite(o.vertical_, "keystone.vertical");
                          RequireFinite(o.horizontal_, "keystone.horizontal");
                          if (std::abs(o.vertical_) > kKeystoneLimit ||
                              std::abs(o.horizontal_) > kKeystoneLimit) {
                            throw OperationError(
                                "[ERROR] EditState: keystone components must lie in [-0.5, 0.5]");
                          }
                        },
                        [](const RotateOp&) {},
                        [](const FlipOp&) {},
                        [](const CropOp& o) {
                          const auto& r = o.rect_;
                          RequireFinite(r.x_, "crop.x");
                          RequireFinite(r.y_, "crop.y");
                          RequireFinite(r.width_, "crop.width");
                          RequireFinite(r.height_, "crop.height");
                          if (r.x_ < 0.0f || r.y_ < 0.0f || r.x_ >= 1.0f || r.y_ >= 1.0f ||
                              r.width_ <= 0.0f || r.height_ <= 0.0f || r.width_ > 1.0f ||
                              r.height_ > 1.0f) {
                            throw OperationError(
                                "[ERROR] EditState: crop rectangle must lie inside the unit square "
                                "with a positive size");
                          }
                        },
                        [](const ToneOp& o) {
                          RequireFinite(o.exposure_, "exposure");
                          RequireFinite(o.contrast_, "contrast");
                          RequireFinite(o.highlights_, "highlights");
                          RequireFinite(o.shadows_, "shadows");
                        },
                        [](const ColorOp& o) {
                          RequireFinite(o.temperature_, "temperature");
                          RequireFinite(o.saturation_, "saturation");
                          RequireFinite(o.hue_shift_, "hue_shift");
                          for (const auto& band : o.selective_) {
                            RequireFinite(band.hue_, "selective_color.hue");
                            RequireFinite(band.saturation_, "selective_color.saturation");
                            RequireFinite(band.lightness_, "selective_color.lightness");
                          }
                        },
                        [](const GraduatedFilterOp& o) {
                          RequireFinite(o.top_, "graduated_filter.top");
                          RequireFinite(o.bottom_, "graduated_filter.bottom");
                          RequireFinite(o.exposure_, "graduated_filter.exposure");
                        },
                        [](const SharpenOp& o) { RequireFinite(o.amount_, "sharpness"); }},
             op);
}

auto EditState::With(EditOperation op) const -> EditState {
  Validate(op);
  EditState next;
  next.version_ = version_ + 1;
  next.operations_.reserve(operations_.size() + 1);
  bool inserted = false;
  for (const auto& existing : operations_) {
    if (!inserted && existing.index() >= op.index()) {
      next.operations_.push_back(op);
      inserted = true;
      if (existing.index() == op.index()) {
        continue;
      }
    }
    next.operations_.push_back(existing);
  }
  if (!inserted) {
    next.operations_.push_back(std::move(op));
  }
  return next;
}

auto EditState::Without(OperationKind kind) const -> EditState {
  EditState next;
  next.version_ = version_ + 1;
  for (const auto& existing : operations_) {
    if (KindOf(existing) != kind) {
      next.operations_.push_back(existing);
    }
  }
  return next;
}

auto EditState::ActiveOperations() const -> std::vector<EditOperation> {
  std::vector<EditOperation> active;
  for (const auto& op : operations_) {
    if (!photograph::IsIdentity(op)) {
      active.push_back(op);
    }
  }
  return active;
}

auto EditState::IsIdentity() const -> bool {
  return std::all_of(operations_.begin(), operations_.end(),
                     [](const EditOperation& op) { return photograph::IsIdentity(op); });
}

auto EditState::HasGeometry() const -> bool {
  return std::any_of(operations_.begin(), operations_.end(), [](const EditOperation& op) {
    return StageOf(KindOf(op)) == PipelineStageName::Geometry_Adjustment &&
           !photograph::IsIdentity(op);
  });
}

auto EditState::ToJson() const -> nlohmann::json {
  const auto rotate     = Get<RotateOp>().value_or(RotateOp{});
  const auto flip       = Get<FlipOp>().value_or(FlipOp{});
  const auto straighten = Get<StraightenOp>().value_or(StraightenOp{});
  const auto keystone   = Get<KeystoneOp>().value_or(KeystoneOp{});
  const auto tone       = Get<ToneOp>().value_or(ToneOp{});
  const auto color      = Get<ColorOp>().value_or(ColorOp{});
  const auto sharpen    = Get<SharpenOp>().value_or(SharpenOp{});

  nlohmann::json doc;
  doc["rotate"]     = rotate.degrees_;
  doc["flip_h"]     = flip.horizontal_;
  doc["flip_v"]     = flip.vertical_;
  if (const auto crop = Get<CropOp>()) {
    doc["crop"] = {{"x", crop->rect_.x_},
                   {"y", crop->rect_.y_},
                   {"width", crop->rect_.width_},
                   {"height", crop->rect_.height_}};
  } else {
    doc["crop"] = nullptr;
  }
  doc["straighten"] = straighten.degrees_;
  doc["keystone"]   = {{"vertical", keystone.vertical_}, {"horizontal", keystone.horizontal_}};
  doc["exposure"]   = tone.exposure_;
  doc["contrast"]   = tone.contrast_;
  doc["highlights"] = tone.highlights_;
  doc["shadows"]    = tone.shadows_;
  doc["temperature"] = color.temperature_;
  doc["saturation"]  = color.saturation_;
  doc["hue_shift"]   = color.hue_shift_;
  nlohmann::json bands = nlohmann::json::array();
  for (const auto& band : color.selective_) {
    bands.push_back(
        {{"hue", band.hue_}, {"saturation", band.saturation_}, {"lightness", band.lightness_}});
  }
  doc["selective_color"] = std::move(bands);
  if (const auto grad = Get<GraduatedFilterOp>()) {
    doc["graduated_filter"] = {
        {"top", grad->top_}, {"bottom", grad->bottom_}, {"exposure", grad->exposure_}};
  } else {
    doc["graduated_filter"] = nullptr;
  }
  doc["sharpness"] = sharpen.amount_;
  return doc;
}

auto EditState::FromJson(const nlohmann::json& doc) -> EditState {
  if (!doc.is_object()) {
    throw OperationError("[ERROR] EditState: sidecar document must be a JSON object");
  }
  EditState state;
  try {
    const int rotate = doc.value("rotate", 0);
    if (rotate != 0) state = state.With(RotateOp{rotate});

    FlipOp flip{doc.value("flip_h", false), doc.value("flip_v", false)};
    if (flip.horizontal_ || flip.vertical_) state = state.With(flip);

    if (doc.contains("crop") && doc["crop"].is_object()) {
      const auto& c = doc["crop"];
      state         = state.With(CropOp{NormalizedRect{c.value("x", 0.0f), c.value("y", 0.0f),
                                                       c.value("width", 1.0f),
                                                       c.value("height", 1.0f)}});
    }

    const float straighten = doc.value("straighten", 0.0f);
    if (straighten != 0.0f) state = state.With(StraightenOp{straighten});

    if (doc.contains("keystone") && doc["keystone"].is_object()) {
      const auto& k = doc["keystone"];
      KeystoneOp  keystone{k.value("vertical", 0.0f), k.value("horizontal", 0.0f)};
      if (keystone.vertical_ != 0.0f || keystone.horizontal_ != 0.0f) state = state.With(keystone);
    }

    ToneOp tone{doc.value("exposure", 0.0f), doc.value("contrast", 0.0f),
                doc.value("highlights", 0.0f), doc.value("shadows", 0.0f)};
    if (!photograph::IsIdentity(tone)) state = state.With(tone);

    ColorOp color;
    color.temperature_ = doc.value("temperature", 0.0f);
    color.saturation_  = doc.value("saturation", 0.0f);
    color.hue_shift_   = doc.value("hue_shift", 0.0f);
    if (doc.contains("selective_color") && doc["selective_color"].is_array()) {
      const auto& bands = doc["selective_color"];
      for (size_t i = 0; i < std::min(bands.size(), kSelectiveBandCount); ++i) {
        color.selective_[i] = HslAdjust{bands[i].value("hue", 0.0f),
                                        bands[i].value("saturation", 0.0f),
                                        bands[i].value("lightness", 0.0f)};
      }
    }
    if (!photograph::IsIdentity(color)) state = state.With(color);

    if (doc.contains("graduated_filter") && doc["graduated_filter"].is_object()) {
      const auto& g = doc["graduated_filter"];
      state = state.With(GraduatedFilterOp{g.value("top", 0.0f), g.value("bottom", 1.0f),
                                           g.value("exposure", 0.0f)});
    }

    const float sharpness = doc.value("sharpness", 0.0f);
    if (sharpness != 0.0f) state = state.With(SharpenOp{sharpness});
  } catch (const nlohmann::json::exception& e) {
    throw OperationError(std::string("[ERROR] EditState: malformed sidecar field: ") + e.what());
  }
  return state;
}
};  // namespace photograph
