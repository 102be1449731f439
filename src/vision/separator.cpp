#include <pillsight/vision/separator.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <climits>
#include <cmath>
#include <numbers>
#include <numeric>

namespace pillsight::vision {

namespace pc = pillsight::core;

namespace {

struct Peak {
  int contour{0};
  cv::Rect box;
  cv::Mat pixels;  // CV_8UC1 over box
  cv::Point2f centroid;
  double area{0.0};
  float value{0.f};
};

int odd_at_least_3(double size, int limit) {
  int k = static_cast<int>(std::lround(std::clamp(size, 3.0, static_cast<double>(limit))));
  return k % 2 == 0 ? k + 1 : k;
}

cv::Mat find_peak_pixels(const cv::Mat& dist, double max_dist, const SeparateConfig& config) {
  const double floor_value = config.tau * max_dist;
  cv::Mat peaks;
  if (config.mode == SeparateMode::Threshold) {
    cv::compare(dist, floor_value, peaks, cv::CMP_GT);
    return peaks;
  }
  // A pixel is a peak if dilation leaves it unchanged; the kernel sets the minimum spacing.
  const int k = odd_at_least_3(config.min_dist, 2 * std::max(dist.cols, dist.rows) + 1);
  cv::Mat dilated;
  cv::dilate(dist, dilated, cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(k, k)));
  cv::Mat is_max;
  cv::Mat above;
  cv::compare(dist, dilated, is_max, cv::CMP_GE);
  cv::compare(dist, floor_value, above, cv::CMP_GT);
  cv::bitwise_and(is_max, above, peaks);
  return peaks;
}

std::vector<Peak> collect_peaks(const cv::Mat& peaks, const cv::Mat& dist,
                                std::vector<std::vector<cv::Point>>& contours,
                                int min_peak_area) {
  cv::findContours(peaks.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

  std::vector<Peak> out;
  out.reserve(contours.size());
  for (int i = 0; i < static_cast<int>(contours.size()); ++i) {
    Peak p;
    p.contour = i;
    p.box = cv::boundingRect(contours[static_cast<std::size_t>(i)]);
    p.pixels = cv::Mat::zeros(p.box.size(), CV_8UC1);
    cv::drawContours(p.pixels, contours, i, cv::Scalar(255), cv::FILLED, cv::LINE_8,
                     cv::noArray(), INT_MAX, -p.box.tl());
    cv::bitwise_and(p.pixels, peaks(p.box), p.pixels);

    p.area = cv::countNonZero(p.pixels);
    if (p.area < min_peak_area || p.area <= 0) continue;

    const cv::Moments m = cv::moments(p.pixels, true);
    p.centroid = cv::Point2f(static_cast<float>(p.box.x + m.m10 / m.m00),
                             static_cast<float>(p.box.y + m.m01 / m.m00));
    double v = 0.0;
    cv::minMaxLoc(dist(p.box), nullptr, &v, nullptr, nullptr, p.pixels);
    p.value = static_cast<float>(v);
    out.push_back(std::move(p));
  }
  return out;
}

/// Greedy strongest-first suppression; survivors keep discovery order.
std::vector<Peak> suppress_close_peaks(std::vector<Peak> peaks, double min_dist) {
  std::vector<std::size_t> order(peaks.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return peaks[a].value > peaks[b].value;
  });

  std::vector<bool> keep(peaks.size(), false);
  std::vector<cv::Point2f> accepted;
  for (const std::size_t idx : order) {
    const cv::Point2f c = peaks[idx].centroid;
    const bool crowded = std::any_of(accepted.begin(), accepted.end(), [&](const cv::Point2f& a) {
      return cv::norm(a - c) < min_dist;
    });
    if (crowded) continue;
    keep[idx] = true;
    accepted.push_back(c);
  }

  std::vector<Peak> out;
  for (std::size_t i = 0; i < peaks.size(); ++i) {
    if (keep[i]) out.push_back(std::move(peaks[i]));
  }
  return out;
}

pc::Candidate describe_region(const cv::Mat& markers, int label, const Peak& peak) {
  pc::Candidate c;
  c.centroid = pc::Point2{peak.centroid.x, peak.centroid.y};
  c.peak_area = peak.area;

  cv::Mat region;
  cv::compare(markers, label, region, cv::CMP_EQ);
  const int area = cv::countNonZero(region);
  if (area == 0) {
    c.area = peak.area;
    return c;
  }
  c.area = area;

  const cv::Rect box = cv::boundingRect(region);
  c.bbox = pc::BBox{static_cast<float>(box.x), static_cast<float>(box.y),
                    static_cast<float>(box.width), static_cast<float>(box.height)};

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(region(box).clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_NONE,
                   box.tl());
  if (contours.empty()) return c;
  const auto largest = std::max_element(
      contours.begin(), contours.end(),
      [](const auto& a, const auto& b) { return cv::contourArea(a) < cv::contourArea(b); });

  const double perimeter = cv::arcLength(*largest, true);
  if (perimeter > 0.0) {
    const double circ = 4.0 * std::numbers::pi * cv::contourArea(*largest) /
                        (perimeter * perimeter);
    c.circularity = std::min(1.0, circ);
  }
  cv::Point2f center;
  float radius = 0.f;
  cv::minEnclosingCircle(*largest, center, radius);
  c.radius = radius;
  return c;
}

}  // namespace

std::expected<pc::Frame, pc::PipelineError> distance_field(const pc::Frame& binary) {
  auto mat = detail::frame_to_mat(binary);
  if (!mat || binary.format() != pc::PixelFormat::Grayscale8) {
    return std::unexpected(pc::PipelineError::InvalidFrame);
  }
  try {
    cv::Mat bin;
    cv::compare(*mat, 0, bin, cv::CMP_GT);
    cv::Mat dist;
    cv::distanceTransform(bin, dist, cv::DIST_L2, cv::DIST_MASK_PRECISE);
    return detail::mat_to_frame(dist, pc::PixelFormat::Float32Gray);
  } catch (const cv::Exception&) {
    return std::unexpected(pc::PipelineError::StageFailed);
  }
}

std::expected<Separation, pc::PipelineError> separate_touching(
    const pc::Frame& binary, const SeparateConfig& config) {
  if (config.mode == SeparateMode::Hough || !(config.tau > 0.0 && config.tau < 1.0) ||
      config.min_dist <= 0.0) {
    return std::unexpected(pc::PipelineError::InvalidConfig);
  }
  auto mat = detail::frame_to_mat(binary);
  if (!mat || binary.format() != pc::PixelFormat::Grayscale8) {
    return std::unexpected(pc::PipelineError::InvalidFrame);
  }

  try {
    cv::Mat bin;
    cv::compare(*mat, 0, bin, cv::CMP_GT);
    cv::Mat dist;
    cv::distanceTransform(bin, dist, cv::DIST_L2, cv::DIST_MASK_PRECISE);

    double max_dist = 0.0;
    cv::minMaxLoc(dist, nullptr, &max_dist);

    Separation out;
    out.distance = detail::mat_to_frame(dist, pc::PixelFormat::Float32Gray);
    if (max_dist <= 0.0) {
      out.peaks = detail::mat_to_frame(cv::Mat::zeros(bin.size(), CV_8UC1),
                                       pc::PixelFormat::Grayscale8);
      return out;
    }

    const cv::Mat peak_map = find_peak_pixels(dist, max_dist, config);
    out.peaks = detail::mat_to_frame(peak_map, pc::PixelFormat::Grayscale8);

    std::vector<std::vector<cv::Point>> contours;
    std::vector<Peak> peaks = collect_peaks(peak_map, dist, contours, config.min_peak_area);
    if (config.mode == SeparateMode::Peaks) {
      peaks = suppress_close_peaks(std::move(peaks), config.min_dist);
    }
    if (peaks.empty()) return out;

    // Markers: 1 = background, 2.. = one label per peak, 0 = to be flooded.
    cv::Mat markers = cv::Mat::zeros(bin.size(), CV_32SC1);
    markers.setTo(cv::Scalar(1), bin == 0);
    for (std::size_t k = 0; k < peaks.size(); ++k) {
      markers(peaks[k].box).setTo(cv::Scalar(static_cast<int>(k) + 2), peaks[k].pixels);
    }

    cv::Mat relief;
    cv::normalize(dist, relief, 0, 255, cv::NORM_MINMAX, CV_8U);
    cv::bitwise_not(relief, relief);
    cv::Mat relief_bgr;
    cv::cvtColor(relief, relief_bgr, cv::COLOR_GRAY2BGR);
    cv::watershed(relief_bgr, markers);

    out.candidates.reserve(peaks.size());
    for (std::size_t k = 0; k < peaks.size(); ++k) {
      out.candidates.push_back(describe_region(markers, static_cast<int>(k) + 2, peaks[k]));
    }
    return out;
  } catch (const cv::Exception&) {
    return std::unexpected(pc::PipelineError::StageFailed);
  }
}

std::expected<std::vector<pc::Candidate>, pc::PipelineError> detect_circles(
    const pc::Frame& signal, const SeparateConfig& config) {
  if (config.min_radius <= 0 || config.max_radius < config.min_radius ||
      config.min_dist <= 0.0) {
    return std::unexpected(pc::PipelineError::InvalidConfig);
  }
  auto mat = detail::frame_to_mat(signal);
  if (!mat || signal.format() != pc::PixelFormat::Grayscale8) {
    return std::unexpected(pc::PipelineError::InvalidFrame);
  }

  try {
    std::vector<cv::Vec3f> circles;
    cv::HoughCircles(*mat, circles, cv::HOUGH_GRADIENT, 1.0, config.min_dist,
                     config.hough_edge, config.hough_votes, config.min_radius,
                     config.max_radius);

    std::vector<pc::Candidate> out;
    out.reserve(circles.size());
    for (const auto& c : circles) {
      const float r = c[2];
      pc::Candidate cand;
      cand.centroid = pc::Point2{c[0], c[1]};
      cand.area = std::numbers::pi * static_cast<double>(r) * r;
      cand.radius = r;
      cand.bbox = pc::BBox{c[0] - r, c[1] - r, 2.f * r, 2.f * r};
      cand.circularity = 1.0;
      out.push_back(cand);
    }
    return out;
  } catch (const cv::Exception&) {
    return std::unexpected(pc::PipelineError::StageFailed);
  }
}

}  // namespace pillsight::vision
