#pragma once

#include <pillsight/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace pillsight::vision::detail {

/// Wrap a Frame as a cv::Mat view (no copy). Returns nullopt if format unsupported.
/// The view aliases the Frame's buffer; callers must not write through it.
std::optional<cv::Mat> frame_to_mat(const pillsight::core::Frame& frame);

/// Convert cv::Mat to Frame (deep copy, rows packed).
pillsight::core::Frame mat_to_frame(const cv::Mat& mat,
                                    pillsight::core::PixelFormat format);

/// Copy of the frame as 3-channel BGR, converting from RGB8 or Grayscale8.
std::optional<cv::Mat> to_bgr_mat(const pillsight::core::Frame& frame);

}  // namespace pillsight::vision::detail
