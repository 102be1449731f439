#include <pillsight/vision/separator.hpp>
#include "support/synthetic.hpp"
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace pc = pillsight::core;
namespace pv = pillsight::vision;
namespace pt = pillsight::testing;

namespace {

pc::Frame discs_binary(std::initializer_list<std::pair<int, int>> centres, int radius = 30) {
  pc::Frame bin = pt::solid_gray8(300, 300, 0);
  for (const auto& [x, y] : centres) pt::draw_disc(bin, x, y, radius, 255);
  return bin;
}

std::vector<pc::Candidate> sorted_by_x(std::vector<pc::Candidate> c) {
  std::sort(c.begin(), c.end(),
            [](const pc::Candidate& a, const pc::Candidate& b) { return a.centroid.x < b.centroid.x; });
  return c;
}

float distance_value(const pc::Frame& dist, int x, int y) {
  const cv::Mat m(static_cast<int>(dist.height()), static_cast<int>(dist.width()), CV_32FC1,
                  const_cast<std::byte*>(dist.data().data()));
  return m.at<float>(y, x);
}

}  // namespace

TEST(DistanceField, DistanceToNearestBackground) {
  pc::Frame bin = pt::solid_gray8(41, 41, 0);
  pt::fill_rect(bin, 10, 10, 21, 21, 255);
  auto dist = pv::distance_field(bin);
  ASSERT_TRUE(dist.has_value());
  EXPECT_EQ(dist->format(), pc::PixelFormat::Float32Gray);
  EXPECT_NEAR(distance_value(*dist, 20, 20), 11.f, 0.01f);
  EXPECT_NEAR(distance_value(*dist, 10, 20), 1.f, 0.01f);
  EXPECT_FLOAT_EQ(distance_value(*dist, 0, 0), 0.f);
}

TEST(SeparateTouching, EmptyMapHasNoCandidates) {
  auto out = pv::separate_touching(pt::solid_gray8(50, 50, 0), pv::SeparateConfig{});
  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(out->candidates.empty());
  EXPECT_EQ(out->peaks.width(), 50u);
  EXPECT_EQ(pt::count_nonzero(out->peaks), 0);
}

TEST(SeparateTouching, SingleDiscDescribed) {
  auto out = pv::separate_touching(discs_binary({{150, 150}}), pv::SeparateConfig{});
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->candidates.size(), 1u);
  const auto& c = out->candidates[0];
  EXPECT_NEAR(c.centroid.x, 150.f, 1.5f);
  EXPECT_NEAR(c.centroid.y, 150.f, 1.5f);
  const double disc = std::numbers::pi * 30.0 * 30.0;
  EXPECT_NEAR(c.area, disc, disc * 0.1);
  EXPECT_GE(c.peak_area, 1.0);
  ASSERT_TRUE(c.radius.has_value());
  EXPECT_NEAR(*c.radius, 30.f, 3.f);
  ASSERT_TRUE(c.circularity.has_value());
  EXPECT_GT(*c.circularity, 0.8);
  EXPECT_LE(*c.circularity, 1.0);
  ASSERT_TRUE(c.bbox.has_value());
  EXPECT_NEAR(c.bbox->w, 60.f, 4.f);
}

TEST(SeparateTouching, SeparateDiscsGiveTwoCandidatesForAnyTau) {
  for (double tau : {0.3, 0.5, 0.7}) {
    for (auto mode : {pv::SeparateMode::Peaks, pv::SeparateMode::Threshold}) {
      pv::SeparateConfig cfg;
      cfg.mode = mode;
      cfg.tau = tau;
      auto out = pv::separate_touching(discs_binary({{100, 150}, {200, 150}}), cfg);
      ASSERT_TRUE(out.has_value());
      EXPECT_EQ(out->candidates.size(), 2u) << "tau=" << tau << " mode=" << static_cast<int>(mode);
    }
  }
}

TEST(SeparateTouching, TouchingPairSplitIntoTwo) {
  auto out = pv::separate_touching(discs_binary({{125, 150}, {175, 150}}), pv::SeparateConfig{});
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->candidates.size(), 2u);
  const auto c = sorted_by_x(out->candidates);
  EXPECT_NEAR(c[0].centroid.x, 125.f, 3.f);
  EXPECT_NEAR(c[1].centroid.x, 175.f, 3.f);
  EXPECT_NEAR(c[0].area, c[1].area, c[0].area * 0.1);
  // Flooded regions partition the union, so neither spans both discs.
  ASSERT_TRUE(c[0].bbox.has_value());
  EXPECT_LT(c[0].bbox->w, 70.f);
}

TEST(SeparateTouching, ThresholdModeEqualPairNeverMergesAsTauRises) {
  const pc::Frame bin = discs_binary({{125, 150}, {175, 150}});
  std::size_t previous = 0;
  for (double tau : {0.3, 0.45, 0.6, 0.75, 0.9}) {
    pv::SeparateConfig cfg;
    cfg.mode = pv::SeparateMode::Threshold;
    cfg.tau = tau;
    auto out = pv::separate_touching(bin, cfg);
    ASSERT_TRUE(out.has_value());
    EXPECT_GE(out->candidates.size(), previous) << "tau=" << tau;
    previous = out->candidates.size();
  }
  EXPECT_EQ(previous, 2u);
}

TEST(SeparateTouching, LowTauThresholdMergesTouchingPair) {
  pv::SeparateConfig cfg;
  cfg.mode = pv::SeparateMode::Threshold;
  cfg.tau = 0.3;
  auto out = pv::separate_touching(discs_binary({{125, 150}, {175, 150}}), cfg);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->candidates.size(), 1u);
}

TEST(SeparateTouching, MinPeakAreaDropsSmallPeaks) {
  pv::SeparateConfig cfg;
  cfg.mode = pv::SeparateMode::Threshold;
  cfg.min_peak_area = 1000000;
  auto out = pv::separate_touching(discs_binary({{150, 150}}), cfg);
  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(out->candidates.empty());
}

TEST(SeparateTouching, HugeMinDistKeepsOnePeak) {
  pv::SeparateConfig cfg;
  cfg.min_dist = 1e12;
  auto out = pv::separate_touching(discs_binary({{150, 150}}), cfg);
  ASSERT_TRUE(out.has_value());
  ASSERT_EQ(out->candidates.size(), 1u);
  EXPECT_NEAR(out->candidates[0].centroid.x, 150.f, 1.5f);
}

TEST(SeparateTouching, InvalidSettingsRejected) {
  const pc::Frame bin = discs_binary({{150, 150}});
  for (double tau : {0.0, 1.0}) {
    pv::SeparateConfig cfg;
    cfg.tau = tau;
    auto out = pv::separate_touching(bin, cfg);
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error(), pc::PipelineError::InvalidConfig);
  }
  pv::SeparateConfig hough;
  hough.mode = pv::SeparateMode::Hough;
  auto out = pv::separate_touching(bin, hough);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), pc::PipelineError::InvalidConfig);
}

TEST(SeparateTouching, RejectsNonBinaryFormat) {
  auto out = pv::separate_touching(pt::solid_gray_bgr(20, 20, 0), pv::SeparateConfig{});
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), pc::PipelineError::InvalidFrame);
}

TEST(DetectCircles, FindsSingleDisc) {
  pc::Frame signal = pt::solid_gray8(200, 200, 30);
  pt::draw_disc(signal, 100, 100, 25, 220);
  {
    cv::Mat m(200, 200, CV_8UC1, signal.data().data());
    cv::GaussianBlur(m, m, cv::Size(5, 5), 0);
  }
  pv::SeparateConfig cfg;
  cfg.mode = pv::SeparateMode::Hough;
  cfg.min_dist = 50.0;
  cfg.min_radius = 15;
  cfg.max_radius = 40;
  cfg.hough_votes = 20.0;
  auto out = pv::detect_circles(signal, cfg);
  ASSERT_TRUE(out.has_value());
  ASSERT_FALSE(out->empty());
  const auto& c = out->front();
  EXPECT_NEAR(c.centroid.x, 100.f, 3.f);
  EXPECT_NEAR(c.centroid.y, 100.f, 3.f);
  ASSERT_TRUE(c.radius.has_value());
  EXPECT_NEAR(*c.radius, 25.f, 4.f);
  EXPECT_NEAR(c.area, std::numbers::pi * (*c.radius) * (*c.radius), 1.0);
}

TEST(DetectCircles, FlatSignalHasNoCircles) {
  pv::SeparateConfig cfg;
  cfg.mode = pv::SeparateMode::Hough;
  auto out = pv::detect_circles(pt::solid_gray8(120, 120, 90), cfg);
  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(out->empty());
}

TEST(DetectCircles, RadiusRangeValidated) {
  pv::SeparateConfig cfg;
  cfg.mode = pv::SeparateMode::Hough;
  cfg.min_radius = 30;
  cfg.max_radius = 20;
  auto out = pv::detect_circles(pt::solid_gray8(50, 50, 0), cfg);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), pc::PipelineError::InvalidConfig);
}
