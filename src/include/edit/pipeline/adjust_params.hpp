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

#include <algorithm>
#include <cmath>

#include "edit/pipeline/kernels/adjust_kernels.hpp"
#include "edit/state/edit_state.hpp"

namespace photograph {
inline auto MakeToneParams(const ToneOp& op) -> Kernels::ToneParams {
  return Kernels::ToneParams{
      .exposure_gain = std::pow(2.0f, std::clamp(op.exposure_, -5.0f, 5.0f)),
      .contrast_gain = 1.0f + std::clamp(op.contrast_, -1.0f, 1.0f),
      .highlights    = std::clamp(op.highlights_, -1.0f, 1.0f),
      .shadows       = std::clamp(op.shadows_, -1.0f, 1.0f),
  };
}

inline auto MakeColorParams(const ColorOp& op) -> Kernels::ColorParams {
  Kernels::ColorParams params{};
  params.temperature    = std::clamp(op.temperature_, -1.0f, 1.0f);
  params.saturation     = std::clamp(op.saturation_, -1.0f, 1.0f);
  params.hue_shift_unit = std::fmod(op.hue_shift_, 360.0f) / 360.0f;
  for (int i = 0; i < Kernels::kSelectiveBands; ++i) {
    const auto& band                = op.selective_[static_cast<size_t>(i)];
    params.selective_active[i]      = std::abs(band.hue_) >= Kernels::kStageEpsilon ||
                                 std::abs(band.saturation_) >= Kernels::kStageEpsilon ||
                                 std::abs(band.lightness_) >= Kernels::kStageEpsilon;
    params.selective_hue[i]         = band.hue_;
    params.selective_saturation[i]  = band.saturation_;
    params.selective_lightness[i]   = band.lightness_;
  }
  return params;
}

inline auto MakeGradientParams(const GraduatedFilterOp& op, int height) -> Kernels::GradientParams {
  return Kernels::GradientParams{
      .top      = std::clamp(op.top_, 0.0f, 1.0f),
      .bottom   = std::clamp(op.bottom_, 0.0f, 1.0f),
      .exposure = std::clamp(op.exposure_, -5.0f, 5.0f),
      .height   = std::max(height, 1),
  };
}
};  // namespace photograph
