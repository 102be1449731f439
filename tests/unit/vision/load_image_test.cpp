#include <pillsight/vision/load_image.hpp>
#include "support/synthetic.hpp"
#include <gtest/gtest.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

namespace pc = pillsight::core;
namespace pv = pillsight::vision;
namespace pt = pillsight::testing;

TEST(DecodeFrame, EmptyBufferFails) {
  auto r = pv::decode_frame({});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), pc::PipelineError::DecodeFailed);
}

TEST(DecodeFrame, GarbageFails) {
  const std::vector<std::uint8_t> junk = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'g'};
  auto r = pv::decode_frame(junk);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), pc::PipelineError::DecodeFailed);
}

TEST(DecodeFrame, TruncatedPngFails) {
  pc::Frame f = pt::solid_gray_bgr(64, 48, 90);
  std::vector<std::uint8_t> png = pt::encode_png(f);
  ASSERT_GT(png.size(), 16u);
  png.resize(16);
  auto r = pv::decode_frame(png);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), pc::PipelineError::DecodeFailed);
}

TEST(DecodeFrame, PngDecodesToBgr) {
  pc::Frame f = pt::solid_bgr(64, 48, 10, 20, 30);
  auto r = pv::decode_frame(pt::encode_png(f));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->width(), 64u);
  EXPECT_EQ(r->height(), 48u);
  EXPECT_EQ(r->format(), pc::PixelFormat::BGR8);
  EXPECT_EQ(pt::pixel_at(*r, 5, 5, 0), 10);
  EXPECT_EQ(pt::pixel_at(*r, 5, 5, 1), 20);
  EXPECT_EQ(pt::pixel_at(*r, 5, 5, 2), 30);
}

TEST(LoadFrameFromImage, MissingFileFails) {
  auto r = pv::load_frame_from_image("/nonexistent/pillsight/none.png");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), pc::PipelineError::DecodeFailed);
}

TEST(LoadFrameFromImage, ReadsPngFromDisk) {
  const auto path = std::filesystem::temp_directory_path() / "pillsight_load_image_test.png";
  const std::vector<std::uint8_t> png = pt::encode_png(pt::solid_gray_bgr(32, 16, 77));
  {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(png.data()), static_cast<std::streamsize>(png.size()));
  }
  auto r = pv::load_frame_from_image(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->width(), 32u);
  EXPECT_EQ(r->height(), 16u);
  EXPECT_EQ(pt::pixel_at(*r, 3, 3, 1), 77);
}
