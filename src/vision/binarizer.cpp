#include <pillsight/vision/binarizer.hpp>
#include "frame_cv_utils.hpp"
#include "region_cv.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace pillsight::vision {

namespace pc = pillsight::core;

namespace {

cv::Mat ellipse_kernel(int size) {
  return cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(size, size));
}

void apply_morphology(cv::Mat& bin, const MorphologyConfig& config, const cv::Mat& mask) {
  if (config.open_kernel > 0) {
    cv::morphologyEx(bin, bin, cv::MORPH_OPEN, ellipse_kernel(config.open_kernel));
  }
  if (config.close_kernel > 0) {
    cv::morphologyEx(bin, bin, cv::MORPH_CLOSE, ellipse_kernel(config.close_kernel),
                     cv::Point(-1, -1), config.close_iterations);
  }
  if (config.fill_holes) {
    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(bin.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
    cv::drawContours(bin, contours, -1, cv::Scalar(255), cv::FILLED);
  }
  // Mask dominates whatever the filters bled outside.
  cv::bitwise_and(bin, mask, bin);
}

bool has_contrast(const cv::Mat& signal, const cv::Mat& mask, double min_contrast) {
  double lo = 0.0;
  double hi = 0.0;
  cv::minMaxLoc(signal, &lo, &hi, nullptr, nullptr, mask);
  return hi - lo >= min_contrast;
}

bool has_color_contrast(const cv::Mat& hsv, const cv::Mat& mask, double min_contrast) {
  std::vector<cv::Mat> planes;
  cv::split(hsv, planes);
  for (const auto& plane : planes) {
    if (has_contrast(plane, mask, min_contrast)) return true;
  }
  return false;
}

cv::Mat threshold_hsv(const cv::Mat& bgr, const cv::Mat& mask, const BinarizeConfig& config) {
  cv::Mat hsv;
  cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);
  // A flat trusted region holds no objects, whichever box it falls in.
  if (!has_color_contrast(hsv, mask, config.min_contrast)) {
    return cv::Mat::zeros(bgr.size(), CV_8UC1);
  }
  cv::Mat out;
  cv::inRange(hsv,
              cv::Scalar(config.hsv_lower.h, config.hsv_lower.s, config.hsv_lower.v),
              cv::Scalar(config.hsv_upper.h, config.hsv_upper.s, config.hsv_upper.v), out);
  if (config.inverse) cv::bitwise_not(out, out);
  return out;
}

}  // namespace

std::expected<BinaryMap, pc::PipelineError> binarize(
    const pc::Frame& signal, const BinarizeConfig& config, const pc::RegionGeometry& region) {
  auto mat = detail::frame_to_mat(signal);
  if (!mat || !detail::matches_working_size(*mat, region)) {
    return std::unexpected(pc::PipelineError::InvalidFrame);
  }
  const bool color_mode = config.mode == BinarizeMode::HsvRange;
  if (color_mode != (signal.format() == pc::PixelFormat::BGR8) ||
      (!color_mode && signal.format() != pc::PixelFormat::Grayscale8)) {
    return std::unexpected(pc::PipelineError::InvalidFrame);
  }
  if (config.mode == BinarizeMode::Adaptive &&
      (config.block_size < 3 || config.block_size % 2 == 0)) {
    return std::unexpected(pc::PipelineError::InvalidConfig);
  }

  try {
    const cv::Mat mask = detail::working_mask(region);
    const int polarity = config.inverse ? cv::THRESH_BINARY_INV : cv::THRESH_BINARY;
    BinaryMap result;
    cv::Mat bin;

    if (color_mode) {
      bin = threshold_hsv(*mat, mask, config);
    } else if (!has_contrast(*mat, mask, config.min_contrast)) {
      bin = cv::Mat::zeros(mat->size(), CV_8UC1);
    } else {
      switch (config.mode) {
        case BinarizeMode::Otsu:
          result.threshold = cv::threshold(*mat, bin, 0, 255, polarity | cv::THRESH_OTSU);
          break;
        case BinarizeMode::Fixed:
          result.threshold = cv::threshold(*mat, bin, config.threshold, 255, polarity);
          break;
        case BinarizeMode::Adaptive: {
          const cv::Mat padded = detail::has_outside(region)
                                     ? detail::fill_outside_with_mean(*mat, mask)
                                     : *mat;
          const int method = config.adaptive_method == AdaptiveMethod::Mean
                                 ? cv::ADAPTIVE_THRESH_MEAN_C
                                 : cv::ADAPTIVE_THRESH_GAUSSIAN_C;
          cv::adaptiveThreshold(padded, bin, 255, method, polarity, config.block_size, config.c);
          break;
        }
        case BinarizeMode::HsvRange:
          break;
      }
    }

    apply_morphology(bin, config.morphology, mask);
    result.map = detail::mat_to_frame(bin, pc::PixelFormat::Grayscale8);
    return result;
  } catch (const cv::Exception&) {
    return std::unexpected(pc::PipelineError::StageFailed);
  }
}

std::expected<pc::Frame, pc::PipelineError> refine_binary(
    const pc::Frame& binary, const MorphologyConfig& config, const pc::RegionGeometry& region) {
  auto mat = detail::frame_to_mat(binary);
  if (!mat || binary.format() != pc::PixelFormat::Grayscale8 ||
      !detail::matches_working_size(*mat, region)) {
    return std::unexpected(pc::PipelineError::InvalidFrame);
  }
  try {
    cv::Mat bin = mat->clone();
    apply_morphology(bin, config, detail::working_mask(region));
    return detail::mat_to_frame(bin, pc::PixelFormat::Grayscale8);
  } catch (const cv::Exception&) {
    return std::unexpected(pc::PipelineError::StageFailed);
  }
}

}  // namespace pillsight::vision
