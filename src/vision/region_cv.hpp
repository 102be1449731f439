#pragma once

#include <pillsight/core/region.hpp>
#include <opencv2/core/mat.hpp>

namespace pillsight::vision::detail {

/// Trusted-pixel mask in working coordinates (CV_8UC1, 255 = trusted).
cv::Mat working_mask(const pillsight::core::RegionGeometry& region);

/// True when mat has the working size of the region.
inline bool matches_working_size(const cv::Mat& mat,
                                 const pillsight::core::RegionGeometry& region) {
  return mat.cols == static_cast<int>(region.width) &&
         mat.rows == static_cast<int>(region.height);
}

/// True when the working arrays contain untrusted (spotlighted) pixels.
inline bool has_outside(const pillsight::core::RegionGeometry& region) {
  return region.shape == pillsight::core::RegionShape::Circle;
}

/// Copy of img with untrusted pixels replaced by the mean of the trusted ones,
/// so neighbourhood filters do not see the spotlight rim as an edge.
cv::Mat fill_outside_with_mean(const cv::Mat& img, const cv::Mat& mask);

}  // namespace pillsight::vision::detail
