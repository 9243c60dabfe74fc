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

#include "parity/parity_harness.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace photograph {
namespace Parity {
namespace {
constexpr int kPatternWidth  = 32;
constexpr int kPatternHeight = 24;

auto          IsFill(const cv::Vec4b& px) -> bool { return px[0] == 0 && px[1] == 0 && px[2] == 0; }

auto          MakeCase(std::string name, EditState state, int tolerance, bool skip_fill,
                       std::function<ImageBuffer()> make_input = {}) -> ParityCase {
  if (!make_input) {
    make_input = [] { return MakeTestPattern(kPatternWidth, kPatternHeight); };
  }
  return ParityCase{std::move(name), std::move(state), tolerance, skip_fill,
                    std::move(make_input)};
}
}  // namespace

auto CompareRgba(const ImageBuffer& reference, const ImageBuffer& candidate, int tolerance,
                 bool skip_fill) -> ParityReport {
  ParityReport report;
  if (reference.Width() != candidate.Width() || reference.Height() != candidate.Height()) {
    std::ostringstream oss;
    oss << "size mismatch: " << reference.Width() << "x" << reference.Height() << " vs "
        << candidate.Width() << "x" << candidate.Height();
    report.size_mismatch_ = true;
    report.message_       = oss.str();
    return report;
  }

  const cv::Mat& ref   = reference.GetCPUData();
  const cv::Mat& cand  = candidate.GetCPUData();
  const size_t   total = static_cast<size_t>(reference.Width()) * reference.Height();
  for (int y = 0; y < ref.rows; ++y) {
    const auto* ref_row  = ref.ptr<cv::Vec4b>(y);
    const auto* cand_row = cand.ptr<cv::Vec4b>(y);
    for (int x = 0; x < ref.cols; ++x) {
      if (skip_fill && (IsFill(ref_row[x]) || IsFill(cand_row[x]))) {
        ++report.skipped_pixels_;
        continue;
      }
      ++report.compared_pixels_;
      int pixel_max = 0;
      for (int c = 0; c < 4; ++c) {
        pixel_max = std::max(pixel_max, std::abs(static_cast<int>(ref_row[x][c]) -
                                                 static_cast<int>(cand_row[x][c])));
      }
      report.max_difference_ = std::max(report.max_difference_, pixel_max);
      if (pixel_max > tolerance) ++report.failing_pixels_;
    }
  }

  report.skipped_ratio_ = static_cast<double>(report.skipped_pixels_) /
                          static_cast<double>(std::max<size_t>(total, 1));
  const bool ratio_ok   = !skip_fill || report.skipped_ratio_ < kMaxSkippedFillRatio;
  report.passed_        = report.failing_pixels_ == 0 && ratio_ok;

  std::ostringstream oss;
  oss << "max diff " << report.max_difference_ << " (tolerance " << tolerance << "), "
      << report.failing_pixels_ << " failing";
  if (skip_fill) {
    oss << ", skipped " << report.skipped_ratio_ * 100.0 << "% fill";
    if (!ratio_ok) oss << " (too many skipped fill pixels, possible black-output regression)";
  }
  report.message_ = oss.str();
  return report;
}

auto MakeTestPattern(int width, int height) -> ImageBuffer {
  cv::Mat img(height, width, CV_8UC4);
  for (int y = 0; y < height; ++y) {
    auto* row = img.ptr<cv::Vec4b>(y);
    for (int x = 0; x < width; ++x) {
      row[x] = cv::Vec4b(static_cast<uchar>((x * 7 + y * 3) % 256),
                         static_cast<uchar>((x * 11 + y * 5) % 256),
                         static_cast<uchar>((x * 13 + y * 17) % 256), 255);
    }
  }
  return ImageBuffer{std::move(img)};
}

auto MakeEdgePattern(int width, int height) -> ImageBuffer {
  cv::Mat img(height, width, CV_8UC4, cv::Scalar(40, 40, 40, 255));
  img(cv::Rect(width / 2, 0, width - width / 2, height)).setTo(cv::Scalar(200, 200, 200, 255));
  return ImageBuffer{std::move(img)};
}

auto StandardParityCases() -> std::vector<ParityCase> {
  std::vector<ParityCase> cases;

  ColorOp                 selective;
  selective.Band(SelectiveBand::RED).saturation_ = -0.5f;
  selective.Band(SelectiveBand::YELLOW).hue_     = 15.0f;
  selective.Band(SelectiveBand::BLUE).lightness_ = 0.1f;
  cases.push_back(
      MakeCase("selective_color", EditState{}.With(selective), Tolerance::kColor, false));

  cases.push_back(MakeCase("tone_and_color",
                           EditState{}
                               .With(ToneOp{.exposure_   = 0.35f,
                                            .contrast_   = 0.2f,
                                            .highlights_ = -0.2f,
                                            .shadows_    = 0.2f})
                               .With(ColorOp{.temperature_ = 0.1f,
                                             .saturation_  = 0.15f,
                                             .hue_shift_   = 8.0f}),
                           Tolerance::kColor, false));

  cases.push_back(MakeCase(
      "graduated_filter",
      EditState{}
          .With(ToneOp{.exposure_ = 0.25f})
          .With(ColorOp{.saturation_ = 0.12f})
          .With(GraduatedFilterOp{.top_ = 0.1f, .bottom_ = 0.9f, .exposure_ = -0.8f}),
      Tolerance::kGraduated, false));

  cases.push_back(MakeCase("sharpen", EditState{}.With(SharpenOp{.amount_ = 1.0f}),
                           Tolerance::kSharpen, false,
                           [] { return MakeEdgePattern(kPatternWidth, kPatternHeight); }));

  // Color quantization between stages adds one LSB of rounding
  cases.push_back(MakeCase("color_and_sharpen",
                           EditState{}
                               .With(ToneOp{.exposure_ = 0.3f})
                               .With(ColorOp{.saturation_ = 0.1f})
                               .With(SharpenOp{.amount_ = 0.5f}),
                           Tolerance::kColorSharpen, false));

  cases.push_back(MakeCase("rotate_90", EditState{}.With(RotateOp{.degrees_ = 90}),
                           Tolerance::kExactGeometry, false));
  cases.push_back(MakeCase("rotate_180", EditState{}.With(RotateOp{.degrees_ = 180}),
                           Tolerance::kExactGeometry, false));
  cases.push_back(MakeCase("flip_horizontal", EditState{}.With(FlipOp{.horizontal_ = true}),
                           Tolerance::kExactGeometry, false));
  cases.push_back(MakeCase("flip_vertical", EditState{}.With(FlipOp{.vertical_ = true}),
                           Tolerance::kExactGeometry, false));
  cases.push_back(MakeCase("crop",
                           EditState{}.With(CropOp{.rect_ = {.x_      = 0.25f,
                                                             .y_      = 0.25f,
                                                             .width_  = 0.5f,
                                                             .height_ = 0.5f}}),
                           Tolerance::kExactGeometry, false));

  cases.push_back(MakeCase("straighten", EditState{}.With(StraightenOp{.degrees_ = 5.0f}),
                           Tolerance::kStraighten, true));
  cases.push_back(MakeCase("keystone", EditState{}.With(KeystoneOp{.vertical_ = 0.1f}),
                           Tolerance::kKeystone, true));

  cases.push_back(MakeCase(
      "full_pipeline",
      EditState{}
          .With(RotateOp{.degrees_ = 90})
          .With(FlipOp{.horizontal_ = true})
          .With(CropOp{.rect_ = {.x_ = 0.1f, .y_ = 0.1f, .width_ = 0.8f, .height_ = 0.8f}})
          .With(ToneOp{.exposure_ = 0.2f})
          .With(ColorOp{.saturation_ = 0.1f})
          .With(SharpenOp{.amount_ = 0.5f}),
      Tolerance::kFullPipeline, true));

  cases.push_back(MakeCase("export_tone_color",
                           EditState{}
                               .With(ToneOp{.exposure_ = 0.3f, .contrast_ = 0.1f})
                               .With(ColorOp{.temperature_ = 0.2f}),
                           Tolerance::kColorSharpen, false));
  return cases;
}

auto RunParitySuite(PipelineExecutor& gpu, const CPUPipelineExecutor& cpu,
                    const std::vector<ParityCase>& cases) -> std::vector<ParityCaseResult> {
  std::vector<ParityCaseResult> results;
  results.reserve(cases.size());
  for (const auto& parity_case : cases) {
    ParityCaseResult result;
    result.name_               = parity_case.name_;
    const ImageBuffer input    = parity_case.make_input_();
    const ImageBuffer expected = cpu.Apply(input, parity_case.state_);
    auto              actual   = gpu.TryApply(input, parity_case.state_);
    if (!actual) {
      result.report_.message_ = "gpu declined the render";
      results.push_back(std::move(result));
      continue;
    }
    result.rendered_ = true;
    result.report_ =
        CompareRgba(expected, *actual, parity_case.tolerance_, parity_case.skip_fill_);
    results.push_back(std::move(result));
  }
  return results;
}
};  // namespace Parity
};  // namespace photograph
