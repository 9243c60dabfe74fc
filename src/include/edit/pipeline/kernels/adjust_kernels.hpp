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

// Per-pixel adjustment math shared by the CPU reference loops and the CUDA kernels.
// Values are in [0, 1]; every stage rounds to 8 bits at its output.

#include <math.h>
#include <stdint.h>

#ifdef __CUDACC__
#define PHOTOGRAPH_HD __host__ __device__
#else
#define PHOTOGRAPH_HD
#endif

namespace photograph {
namespace Kernels {
constexpr float kStageEpsilon       = 0.001f;
constexpr float kFloatEpsilon       = 1.1920929e-7f;
constexpr int   kSelectiveBands     = 8;
constexpr float kSelectiveHalfWidth = 30.0f;

struct ToneParams {
  float exposure_gain;
  float contrast_gain;
  float highlights;
  float shadows;
};

struct ColorParams {
  float temperature;
  float saturation;
  float hue_shift_unit;
  int   selective_active[kSelectiveBands];
  float selective_hue[kSelectiveBands];
  float selective_saturation[kSelectiveBands];
  float selective_lightness[kSelectiveBands];
};

struct GradientParams {
  float top;
  float bottom;
  float exposure;
  int   height;
};

PHOTOGRAPH_HD inline float Clamp(float v, float lo, float hi) { return fminf(fmaxf(v, lo), hi); }

PHOTOGRAPH_HD inline float Clamp01(float v) { return Clamp(v, 0.0f, 1.0f); }

PHOTOGRAPH_HD inline uint8_t ToByte(float unit) {
  return static_cast<uint8_t>(roundf(Clamp01(unit) * 255.0f));
}

PHOTOGRAPH_HD inline float ToUnit(uint8_t v) { return static_cast<float>(v) / 255.0f; }

PHOTOGRAPH_HD inline float Smoothstep(float edge0, float edge1, float x) {
  const float t = Clamp01((x - edge0) / (edge1 - edge0));
  return t * t * (3.0f - 2.0f * t);
}

// Wrap into [0, 1). Huge magnitudes collapse to a multiple of one and wrap to 0.
PHOTOGRAPH_HD inline float WrapUnit(float v) {
  v -= floorf(v);
  return v >= 1.0f ? 0.0f : v;
}

PHOTOGRAPH_HD inline float HueDistanceDeg(float a, float b) {
  const float diff = fabsf(a - b);
  return fminf(diff, 360.0f - diff);
}

PHOTOGRAPH_HD inline float SelectiveCenterDeg(int band) {
  // red, orange, yellow, green, cyan, blue, purple, pink
  switch (band) {
    case 0:
      return 0.0f;
    case 1:
      return 30.0f;
    case 2:
      return 60.0f;
    case 3:
      return 120.0f;
    case 4:
      return 180.0f;
    case 5:
      return 240.0f;
    case 6:
      return 285.0f;
    default:
      return 330.0f;
  }
}

PHOTOGRAPH_HD inline float SelectiveWeight(float hue_unit, float center_deg) {
  const float hue_deg = WrapUnit(hue_unit) * 360.0f;
  const float dist    = HueDistanceDeg(hue_deg, center_deg);
  if (dist >= kSelectiveHalfWidth) return 0.0f;
  return 1.0f - dist / kSelectiveHalfWidth;
}

PHOTOGRAPH_HD inline void RgbToHsl(float r, float g, float b, float& h, float& s, float& l) {
  const float max_c = fmaxf(r, fmaxf(g, b));
  const float min_c = fminf(r, fminf(g, b));
  l                 = (max_c + min_c) * 0.5f;
  const float d     = max_c - min_c;
  if (d <= 1e-6f) {
    h = 0.0f;
    s = 0.0f;
    return;
  }
  s = d / (1.0f - fabsf(2.0f * l - 1.0f));
  if (fabsf(max_c - r) < kFloatEpsilon) {
    h = fmodf((g - b) / d, 6.0f);
  } else if (fabsf(max_c - g) < kFloatEpsilon) {
    h = (b - r) / d + 2.0f;
  } else {
    h = (r - g) / d + 4.0f;
  }
  h = WrapUnit(h / 6.0f);
  s = Clamp01(s);
  l = Clamp01(l);
}

PHOTOGRAPH_HD inline float HueToRgb(float p, float q, float t) {
  t = WrapUnit(t);
  if (t < 1.0f / 6.0f) return p + (q - p) * 6.0f * t;
  if (t < 0.5f) return q;
  if (t < 2.0f / 3.0f) return p + (q - p) * (2.0f / 3.0f - t) * 6.0f;
  return p;
}

PHOTOGRAPH_HD inline void HslToRgb(float h, float s, float l, float& r, float& g, float& b) {
  if (s <= 1e-6f) {
    r = g = b = l;
    return;
  }
  const float q = l < 0.5f ? l * (1.0f + s) : l + s - l * s;
  const float p = 2.0f * l - q;
  r             = Clamp01(HueToRgb(p, q, h + 1.0f / 3.0f));
  g             = Clamp01(HueToRgb(p, q, h));
  b             = Clamp01(HueToRgb(p, q, h - 1.0f / 3.0f));
}

/**
 * @brief Exposure and contrast around mid-grey, then luma-preserving shadow and highlight
 * recovery.
 */
PHOTOGRAPH_HD inline void ApplyTone(float& r, float& g, float& b, const ToneParams& p) {
  r = Clamp01((r * p.exposure_gain - 0.5f) * p.contrast_gain + 0.5f);
  g = Clamp01((g * p.exposure_gain - 0.5f) * p.contrast_gain + 0.5f);
  b = Clamp01((b * p.exposure_gain - 0.5f) * p.contrast_gain + 0.5f);

  const float luma   = 0.2126f * r + 0.7152f * g + 0.0722f * b;
  float       target = luma;

  if (fabsf(p.shadows) > kStageEpsilon) {
    const float w = 1.0f - Smoothstep(0.0f, 0.5f, target);
    if (p.shadows >= 0.0f) {
      target += (1.0f - target) * p.shadows * w;
    } else {
      target *= 1.0f + p.shadows * w;
    }
  }
  if (fabsf(p.highlights) > kStageEpsilon) {
    const float w = Smoothstep(0.5f, 1.0f, target);
    if (p.highlights >= 0.0f) {
      target += (1.0f - target) * p.highlights * w;
    } else {
      target *= 1.0f + p.highlights * w;
    }
  }

  const float scale = luma > 1e-5f ? target / luma : 1.0f;
  r                 = Clamp01(r * scale);
  g                 = Clamp01(g * scale);
  b                 = Clamp01(b * scale);
}

/**
 * @brief White balance, global hue/saturation, then selective color by hue band.
 */
PHOTOGRAPH_HD inline void ApplyColor(float& r, float& g, float& b, const ColorParams& p) {
  if (p.temperature > 0.0f) {
    r += (1.0f - r) * p.temperature * 0.25f;
    b *= 1.0f - p.temperature * 0.25f;
  } else if (p.temperature < 0.0f) {
    const float cool = -p.temperature;
    b += (1.0f - b) * cool * 0.25f;
    r *= 1.0f - cool * 0.25f;
  }
  r = Clamp01(r);
  g = Clamp01(g);
  b = Clamp01(b);

  float h, s, l;
  RgbToHsl(r, g, b, h, s, l);
  h = WrapUnit(h + p.hue_shift_unit);
  s = Clamp01(s * (1.0f + p.saturation));

  for (int i = 0; i < kSelectiveBands; ++i) {
    if (!p.selective_active[i]) continue;
    const float weight = SelectiveWeight(h, SelectiveCenterDeg(i));
    if (weight <= 0.0f) continue;
    h = WrapUnit(h + (p.selective_hue[i] / 360.0f) * weight);
    s = Clamp01(s * (1.0f + p.selective_saturation[i] * weight));
    l = Clamp01(l + p.selective_lightness[i] * weight);
  }

  HslToRgb(h, s, l, r, g, b);
}

/**
 * @brief Exposure gain of one row of a graduated filter; 1 means the row is untouched.
 */
PHOTOGRAPH_HD inline float GradientGain(int y, const GradientParams& p) {
  const float denom  = static_cast<float>(p.height - 1 > 1 ? p.height - 1 : 1);
  const float y_norm = static_cast<float>(y) / denom;
  float       weight;
  if (y_norm <= p.top) {
    weight = 1.0f;
  } else if (y_norm >= p.bottom) {
    weight = 0.0f;
  } else {
    weight = (p.bottom - y_norm) / (p.bottom - p.top);
  }
  if (weight <= 0.0f) return 1.0f;
  return powf(2.0f, p.exposure * weight);
}

PHOTOGRAPH_HD inline uint8_t UnsharpChannel(uint8_t orig, uint8_t blurred, float amount) {
  const float o     = static_cast<float>(orig);
  const float sharp = o + amount * (o - static_cast<float>(blurred));
  return static_cast<uint8_t>(Clamp(roundf(sharp), 0.0f, 255.0f));
}
};  // namespace Kernels
};  // namespace photograph
