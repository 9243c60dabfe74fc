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

#include <opencv2/core.hpp>
#include <optional>

#include "edit/state/edit_state.hpp"

namespace photograph {
namespace Geometry {
// Opaque black written where a warp samples outside the source
inline const cv::Scalar kFillValue(0.0, 0.0, 0.0, 255.0);

/**
 * @brief 2x3 forward matrix rotating clockwise by `degrees` about (w/2, h/2), same output size.
 */
auto StraightenMatrix(int width, int height, float degrees) -> cv::Mat;

/**
 * @brief Forward homography from the image rectangle onto the keystone-shifted quadrilateral.
 *
 * @return nullopt when the quadrilateral collapses and no invertible map exists
 */
auto KeystoneHomography(int width, int height, const KeystoneOp& op) -> std::optional<cv::Matx33d>;

/**
 * @brief Pixel rectangle of a normalized crop, or nullopt when it would be empty.
 */
auto ComputeCropRoi(int width, int height, const NormalizedRect& rect) -> std::optional<cv::Rect>;
};  // namespace Geometry
};  // namespace photograph
