#include <pillsight/vision/reporter.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace pillsight::vision {

namespace pc = pillsight::core;

namespace {

constexpr int kDotRadius = 8;
constexpr float kDefaultRingRadius = 20.f;

const cv::Scalar kRegionColor(0, 255, 255);  // yellow
const cv::Scalar kDotColor(0, 0, 255);       // red
const cv::Scalar kRingColor(0, 255, 0);      // green
const cv::Scalar kLabelColor(255, 255, 0);   // cyan

cv::Point to_pixel(pc::Point2 p) {
  return cv::Point(static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y)));
}

}  // namespace

std::expected<pc::Frame, pc::PipelineError> annotate(
    const pc::Frame& original, std::span<const pc::Detection> detections,
    const pc::RegionGeometry& region, const ReportConfig& config) {
  auto canvas = detail::to_bgr_mat(original);
  if (!canvas) {
    return std::unexpected(pc::PipelineError::InvalidFrame);
  }

  try {
    if (config.draw_region) {
      if (region.shape == pc::RegionShape::Circle) {
        cv::circle(*canvas, to_pixel({region.center_x, region.center_y}),
                   static_cast<int>(region.radius), kRegionColor, 2);
      } else {
        cv::rectangle(*canvas,
                      cv::Rect(static_cast<int>(region.left), static_cast<int>(region.top),
                               static_cast<int>(region.width), static_cast<int>(region.height)),
                      kRegionColor, 2);
      }
    }

    for (const auto& d : detections) {
      const cv::Point c = to_pixel(d.candidate.centroid);
      const float ring = d.candidate.radius.value_or(kDefaultRingRadius);
      cv::circle(*canvas, c, kDotRadius, kDotColor, cv::FILLED);
      cv::circle(*canvas, c, std::max(1, static_cast<int>(std::lround(ring))), kRingColor, 2);
      cv::putText(*canvas, std::to_string(d.index), c - cv::Point(10, 10),
                  cv::FONT_HERSHEY_SIMPLEX, 0.8, kLabelColor, 2);
    }
    return detail::mat_to_frame(*canvas, pc::PixelFormat::BGR8);
  } catch (const cv::Exception&) {
    return std::unexpected(pc::PipelineError::StageFailed);
  }
}

}  // namespace pillsight::vision
