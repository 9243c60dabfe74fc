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

#include <filesystem>
#include <fstream>
#include <opencv2/imgcodecs.hpp>

#include "io/image/image_loader.hpp"
#include "io/image/image_writer.hpp"
#include "test_fixation.hpp"
#include "type/errors.hpp"

namespace photograph {
class ImageIOTests : public PhotographTests {};

TEST_F(ImageIOTests, PngRoundTripIsLossless) {
  cv::Mat rgba(8, 12, CV_8UC4);
  for (int y = 0; y < rgba.rows; ++y) {
    for (int x = 0; x < rgba.cols; ++x) {
      rgba.at<cv::Vec4b>(y, x) = cv::Vec4b(x * 20, y * 30, (x + y) * 5, 255);
    }
  }
  ImageBuffer         img{std::move(rgba)};
  ExportFormatOptions options;
  options.format_ = ImageFormatType::PNG;
  const auto path = temp_dir_ / "nested" / "out.png";

  ImageWriter::WriteImageToPath(img, path, options);
  ImageBuffer loaded = ImageLoader::Load(path);
  EXPECT_TRUE(SameBytes(img, loaded));
}

TEST_F(ImageIOTests, JpegIsResizedToTheLongEdge) {
  ImageBuffer         img = MakeSolid(400, 200, cv::Scalar(120, 60, 30, 255));
  ExportFormatOptions options;
  options.format_          = ImageFormatType::JPEG;
  options.resize_enabled_  = true;
  options.max_length_side_ = 100;
  const auto path          = temp_dir_ / "small.jpg";

  ImageWriter::WriteImageToPath(img, path, options);
  const cv::Mat decoded = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
  ASSERT_FALSE(decoded.empty());
  EXPECT_EQ(decoded.cols, 100);
  EXPECT_EQ(decoded.rows, 50);
  EXPECT_EQ(decoded.channels(), 3);
}

TEST_F(ImageIOTests, WebpHonorsQualityUnlessLossless) {
  cv::Mat rgba(64, 64, CV_8UC4);
  cv::RNG rng(7);
  rng.fill(rgba, cv::RNG::UNIFORM, 0, 256);
  rgba.forEach<cv::Vec4b>([](cv::Vec4b& px, const int*) { px[3] = 255; });
  ImageBuffer         img{std::move(rgba)};

  ExportFormatOptions options;
  options.format_   = ImageFormatType::WEBP;
  options.lossless_ = true;
  const auto exact  = temp_dir_ / "exact.webp";
  ImageWriter::WriteImageToPath(img, exact, options);
  EXPECT_TRUE(SameBytes(ImageLoader::Load(exact), img));

  options.lossless_   = false;
  options.quality_    = 40;
  const auto lossy    = temp_dir_ / "lossy.webp";
  ImageWriter::WriteImageToPath(img, lossy, options);
  ImageBuffer decoded = ImageLoader::Load(lossy);
  EXPECT_EQ(decoded.Width(), 64);
  EXPECT_EQ(decoded.Height(), 64);
  EXPECT_FALSE(SameBytes(decoded, img));
  EXPECT_LT(std::filesystem::file_size(lossy), std::filesystem::file_size(exact));
}

TEST_F(ImageIOTests, ResizedDimensionsOnlyShrinks) {
  EXPECT_FALSE(ResizedDimensions(800, 600, 1000).has_value());
  EXPECT_FALSE(ResizedDimensions(1000, 600, 1000).has_value());
  EXPECT_FALSE(ResizedDimensions(0, 600, 1000).has_value());

  const auto portrait = ResizedDimensions(3000, 6000, 3000);
  ASSERT_TRUE(portrait.has_value());
  EXPECT_EQ(portrait->width, 1500);
  EXPECT_EQ(portrait->height, 3000);
}

TEST_F(ImageIOTests, MissingOrCorruptSourceIsDecodeError) {
  EXPECT_THROW(ImageLoader::Load(temp_dir_ / "missing.jpg"), DecodeError);

  const auto bogus = temp_dir_ / "bogus.jpg";
  {
    std::ofstream out(bogus);
    out << "definitely not a jpeg";
  }
  EXPECT_THROW(ImageLoader::Load(bogus), DecodeError);
}

TEST_F(ImageIOTests, EmptyImageIsEncodeError) {
  ExportFormatOptions options;
  EXPECT_THROW(ImageWriter::WriteImageToPath(ImageBuffer{}, temp_dir_ / "empty.jpg", options),
               EncodeError);
}

TEST_F(ImageIOTests, ProfilesSupplyEncoderDefaults) {
  const auto quality = ExportFormatOptions::FromProfile(ImageFormatType::JPEG,
                                                        RenderSpeedProfile::QUALITY);
  EXPECT_EQ(quality.quality_, 95);
  EXPECT_EQ(quality.compression_level_, 9);
  const auto speed =
      ExportFormatOptions::FromProfile(ImageFormatType::PNG, RenderSpeedProfile::SPEED);
  EXPECT_EQ(speed.quality_, 80);
  EXPECT_EQ(speed.compression_level_, 1);
  EXPECT_EQ(ParseImageFormat("JPEG"), ImageFormatType::JPEG);
  EXPECT_FALSE(ParseImageFormat("gif").has_value());
  EXPECT_EQ(ExtensionOf(ImageFormatType::WEBP), "webp");
}
};  // namespace photograph
