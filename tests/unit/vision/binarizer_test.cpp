#include <pillsight/vision/binarizer.hpp>
#include <pillsight/vision/region_selector.hpp>
#include "support/synthetic.hpp"
#include <gtest/gtest.h>

namespace pc = pillsight::core;
namespace pv = pillsight::vision;
namespace pt = pillsight::testing;

namespace {

pc::RegionGeometry whole(std::uint32_t w, std::uint32_t h) {
  return *pv::make_region(w, h, pv::RegionConfig{pc::RegionShape::Rect, 1.0});
}

/// 100x100 signal: background 50, 40x40 square of 200 at (30, 30).
pc::Frame square_signal() {
  pc::Frame s = pt::solid_gray8(100, 100, 50);
  pt::fill_rect(s, 30, 30, 40, 40, 200);
  return s;
}

pv::BinarizeConfig no_morphology(pv::BinarizeMode mode) {
  pv::BinarizeConfig cfg;
  cfg.mode = mode;
  cfg.morphology.open_kernel = 0;
  return cfg;
}

}  // namespace

TEST(Binarize, OtsuSplitsTwoLevels) {
  auto out = pv::binarize(square_signal(), no_morphology(pv::BinarizeMode::Otsu), whole(100, 100));
  ASSERT_TRUE(out.has_value());
  ASSERT_TRUE(out->threshold.has_value());
  EXPECT_GE(*out->threshold, 50.0);
  EXPECT_LT(*out->threshold, 200.0);
  EXPECT_EQ(pt::count_nonzero(out->map), 1600);
  EXPECT_EQ(pt::pixel_at(out->map, 50, 50), 255);
  EXPECT_EQ(pt::pixel_at(out->map, 5, 5), 0);
}

TEST(Binarize, FixedThresholdAndInverse) {
  auto cfg = no_morphology(pv::BinarizeMode::Fixed);
  cfg.threshold = 127.0;
  auto out = pv::binarize(square_signal(), cfg, whole(100, 100));
  ASSERT_TRUE(out.has_value());
  ASSERT_TRUE(out->threshold.has_value());
  EXPECT_DOUBLE_EQ(*out->threshold, 127.0);
  EXPECT_EQ(pt::count_nonzero(out->map), 1600);

  cfg.inverse = true;
  auto inv = pv::binarize(square_signal(), cfg, whole(100, 100));
  ASSERT_TRUE(inv.has_value());
  EXPECT_EQ(pt::count_nonzero(inv->map), 10000 - 1600);
}

TEST(Binarize, AdaptiveFindsSmallBrightSpot) {
  pc::Frame s = pt::solid_gray8(120, 120, 50);
  pt::draw_disc(s, 60, 60, 5, 200);
  auto cfg = pv::BinarizeConfig{};
  cfg.mode = pv::BinarizeMode::Adaptive;
  auto out = pv::binarize(s, cfg, whole(120, 120));
  ASSERT_TRUE(out.has_value());
  EXPECT_FALSE(out->threshold.has_value());
  EXPECT_EQ(pt::pixel_at(out->map, 60, 60), 255);
  EXPECT_EQ(pt::pixel_at(out->map, 10, 10), 0);
}

TEST(Binarize, EvenBlockSizeRejected) {
  auto cfg = pv::BinarizeConfig{};
  cfg.mode = pv::BinarizeMode::Adaptive;
  cfg.block_size = 50;
  auto out = pv::binarize(square_signal(), cfg, whole(100, 100));
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), pc::PipelineError::InvalidConfig);
}

TEST(Binarize, FlatSignalIsAllBackgroundInEveryScalarMode) {
  const pc::Frame flat = pt::solid_gray8(80, 80, 100);
  for (auto mode : {pv::BinarizeMode::Otsu, pv::BinarizeMode::Fixed, pv::BinarizeMode::Adaptive}) {
    auto cfg = pv::BinarizeConfig{};
    cfg.mode = mode;
    cfg.threshold = 10.0;
    auto out = pv::binarize(flat, cfg, whole(80, 80));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(pt::count_nonzero(out->map), 0) << static_cast<int>(mode);
  }
}

TEST(Binarize, MaskDominatesThreshold) {
  // Bright left half, dark right half; spotlight of radius 25 in the middle.
  pc::Frame s = pt::solid_gray8(100, 100, 50);
  pt::fill_rect(s, 0, 0, 50, 100, 200);
  auto region = *pv::make_region(100, 100, pv::RegionConfig{pc::RegionShape::Circle, 0.5});
  auto cfg = no_morphology(pv::BinarizeMode::Fixed);
  auto out = pv::binarize(s, cfg, region);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(pt::pixel_at(out->map, 0, 0), 0);
  EXPECT_EQ(pt::pixel_at(out->map, 10, 50), 0);
  EXPECT_EQ(pt::pixel_at(out->map, 40, 50), 255);
  EXPECT_EQ(pt::pixel_at(out->map, 60, 50), 0);
}

TEST(Binarize, HsvRangeSelectsColourBox) {
  pc::Frame s = pt::solid_gray_bgr(100, 100, 120);
  pt::draw_disc_bgr(s, 50, 50, 15, 0, 0, 255);
  auto cfg = no_morphology(pv::BinarizeMode::HsvRange);
  cfg.hsv_lower = {0, 100, 100};
  cfg.hsv_upper = {10, 255, 255};
  auto out = pv::binarize(s, cfg, whole(100, 100));
  ASSERT_TRUE(out.has_value());
  EXPECT_FALSE(out->threshold.has_value());
  EXPECT_EQ(pt::pixel_at(out->map, 50, 50), 255);
  EXPECT_EQ(pt::pixel_at(out->map, 5, 5), 0);
}

TEST(Binarize, HsvRangeMatchingNothingIsEmpty) {
  auto cfg = pv::BinarizeConfig{};
  cfg.mode = pv::BinarizeMode::HsvRange;
  auto out = pv::binarize(pt::solid_gray_bgr(50, 50, 180), cfg, whole(50, 50));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(pt::count_nonzero(out->map), 0);
}

TEST(Binarize, HsvRangeFlatColourInsideBoxIsEmpty) {
  auto cfg = pv::BinarizeConfig{};
  cfg.mode = pv::BinarizeMode::HsvRange;
  const pc::Frame orange = pt::solid_bgr(50, 50, 60, 120, 200);
  auto out = pv::binarize(orange, cfg, whole(50, 50));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(pt::count_nonzero(out->map), 0);

  cfg.min_contrast = 0.0;
  auto unguarded = pv::binarize(orange, cfg, whole(50, 50));
  ASSERT_TRUE(unguarded.has_value());
  EXPECT_EQ(pt::count_nonzero(unguarded->map), 2500);
}

TEST(Binarize, SignalFormatMustMatchMode) {
  auto hsv = pv::BinarizeConfig{};
  hsv.mode = pv::BinarizeMode::HsvRange;
  auto a = pv::binarize(square_signal(), hsv, whole(100, 100));
  ASSERT_FALSE(a.has_value());
  EXPECT_EQ(a.error(), pc::PipelineError::InvalidFrame);

  auto b = pv::binarize(pt::solid_gray_bgr(100, 100, 3), pv::BinarizeConfig{}, whole(100, 100));
  ASSERT_FALSE(b.has_value());
  EXPECT_EQ(b.error(), pc::PipelineError::InvalidFrame);
}

TEST(Binarize, OpeningRemovesSpecks) {
  pc::Frame s = square_signal();
  pt::fill_rect(s, 5, 5, 1, 1, 200);
  auto cfg = pv::BinarizeConfig{};
  cfg.mode = pv::BinarizeMode::Fixed;
  auto out = pv::binarize(s, cfg, whole(100, 100));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(pt::pixel_at(out->map, 5, 5), 0);
  EXPECT_EQ(pt::pixel_at(out->map, 50, 50), 255);
}

TEST(RefineBinary, FillHolesClosesRing) {
  pc::Frame ring = pt::solid_gray8(100, 100, 0);
  pt::draw_disc(ring, 50, 50, 25, 255);
  pt::draw_disc(ring, 50, 50, 18, 0);
  pv::MorphologyConfig cfg;
  cfg.open_kernel = 0;
  cfg.fill_holes = true;
  auto out = pv::refine_binary(ring, cfg, whole(100, 100));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(pt::pixel_at(*out, 50, 50), 255);
  EXPECT_EQ(pt::pixel_at(ring, 50, 50), 0);
}

TEST(RefineBinary, ClosingBridgesNarrowGap) {
  pc::Frame bin = pt::solid_gray8(60, 30, 0);
  pt::fill_rect(bin, 5, 10, 24, 10, 255);
  pt::fill_rect(bin, 31, 10, 24, 10, 255);
  pv::MorphologyConfig cfg;
  cfg.open_kernel = 0;
  cfg.close_kernel = 5;
  auto out = pv::refine_binary(bin, cfg, whole(60, 30));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(pt::pixel_at(*out, 29, 15), 255);
  EXPECT_EQ(pt::pixel_at(*out, 30, 15), 255);
}
