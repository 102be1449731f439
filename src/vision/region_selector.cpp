#include <pillsight/vision/region_selector.hpp>
#include "frame_cv_utils.hpp"
#include "region_cv.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace pillsight::vision {

namespace pc = pillsight::core;

std::expected<pc::RegionGeometry, pc::PipelineError> make_region(
    std::uint32_t width, std::uint32_t height, const RegionConfig& config) {
  if (width == 0 || height == 0) {
    return std::unexpected(pc::PipelineError::InvalidFrame);
  }
  if (!(config.extent > 0.0 && config.extent <= 1.0)) {
    return std::unexpected(pc::PipelineError::InvalidConfig);
  }

  pc::RegionGeometry g;
  g.shape = config.shape;
  g.frame_width = width;
  g.frame_height = height;

  if (config.shape == pc::RegionShape::Circle) {
    const double r = std::floor(config.extent * static_cast<double>(std::min(width, height)) / 2.0);
    if (r < 1.0) {
      return std::unexpected(pc::PipelineError::InvalidConfig);
    }
    g.center_x = static_cast<float>(width / 2);
    g.center_y = static_cast<float>(height / 2);
    g.radius = static_cast<float>(r);
    g.width = width;
    g.height = height;
    return g;
  }

  const auto kept_w = static_cast<std::uint32_t>(std::lround(config.extent * width));
  const auto kept_h = static_cast<std::uint32_t>(std::lround(config.extent * height));
  if (kept_w < 1 || kept_h < 1) {
    return std::unexpected(pc::PipelineError::InvalidConfig);
  }
  g.left = (width - kept_w) / 2;
  g.top = (height - kept_h) / 2;
  g.width = kept_w;
  g.height = kept_h;
  const pc::Point2 c = g.center();
  g.center_x = c.x;
  g.center_y = c.y;
  return g;
}

pc::Frame region_mask(const pc::RegionGeometry& region) {
  cv::Mat mask = cv::Mat::zeros(static_cast<int>(region.frame_height),
                                static_cast<int>(region.frame_width), CV_8UC1);
  if (region.shape == pc::RegionShape::Circle) {
    cv::circle(mask,
               cv::Point(static_cast<int>(region.center_x), static_cast<int>(region.center_y)),
               static_cast<int>(region.radius), cv::Scalar(255), cv::FILLED);
  } else {
    mask(cv::Rect(static_cast<int>(region.left), static_cast<int>(region.top),
                  static_cast<int>(region.width), static_cast<int>(region.height)))
        .setTo(cv::Scalar(255));
  }
  return detail::mat_to_frame(mask, pc::PixelFormat::Grayscale8);
}

std::expected<pc::Frame, pc::PipelineError> apply_region(
    const pc::Frame& frame, const pc::RegionGeometry& region) {
  auto bgr = detail::to_bgr_mat(frame);
  if (!bgr) {
    return std::unexpected(pc::PipelineError::InvalidFrame);
  }
  if (frame.width() != region.frame_width || frame.height() != region.frame_height) {
    return std::unexpected(pc::PipelineError::InvalidFrame);
  }

  try {
    cv::Mat out;
    if (region.shape == pc::RegionShape::Circle) {
      const cv::Mat mask = detail::working_mask(region);
      out = cv::Mat::zeros(bgr->size(), bgr->type());
      bgr->copyTo(out, mask);
    } else {
      out = (*bgr)(cv::Rect(static_cast<int>(region.left), static_cast<int>(region.top),
                            static_cast<int>(region.width), static_cast<int>(region.height)))
                .clone();
    }
    return detail::mat_to_frame(out, pc::PixelFormat::BGR8);
  } catch (const cv::Exception&) {
    return std::unexpected(pc::PipelineError::StageFailed);
  }
}

namespace detail {

cv::Mat working_mask(const pc::RegionGeometry& region) {
  if (region.shape == pc::RegionShape::Rect) {
    return cv::Mat(static_cast<int>(region.height), static_cast<int>(region.width), CV_8UC1,
                   cv::Scalar(255));
  }
  cv::Mat mask = cv::Mat::zeros(static_cast<int>(region.frame_height),
                                static_cast<int>(region.frame_width), CV_8UC1);
  cv::circle(mask,
             cv::Point(static_cast<int>(region.center_x), static_cast<int>(region.center_y)),
             static_cast<int>(region.radius), cv::Scalar(255), cv::FILLED);
  return mask;
}

cv::Mat fill_outside_with_mean(const cv::Mat& img, const cv::Mat& mask) {
  cv::Mat out = img.clone();
  if (cv::countNonZero(mask) == 0) return out;
  cv::Mat outside;
  cv::bitwise_not(mask, outside);
  out.setTo(cv::mean(img, mask), outside);
  return out;
}

}  // namespace detail

}  // namespace pillsight::vision
