#include <pillsight/vision/channel_normalizer.hpp>
#include "frame_cv_utils.hpp"
#include "region_cv.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace pillsight::vision {

namespace pc = pillsight::core;

namespace {

cv::Mat smooth(const cv::Mat& in, SmoothingKind kind, int kernel) {
  if (kernel <= 1) return in.clone();
  cv::Mat out;
  if (kind == SmoothingKind::Bilateral) {
    cv::bilateralFilter(in, out, kernel, 75.0, 75.0);
  } else {
    cv::GaussianBlur(in, out, cv::Size(kernel, kernel), 0);
  }
  return out;
}

/// Filters run on a copy padded with the trusted mean; the result is re-zeroed outside.
cv::Mat filter_inside(const cv::Mat& in, const cv::Mat& mask,
                      const pc::RegionGeometry& region,
                      const NormalizeConfig& config, bool equalize) {
  cv::Mat work = detail::has_outside(region) ? detail::fill_outside_with_mean(in, mask)
                                             : in.clone();
  if (equalize) {
    auto clahe = cv::createCLAHE(config.clip_limit, cv::Size(config.tile_grid, config.tile_grid));
    cv::Mat equalized;
    clahe->apply(work, equalized);
    work = equalized;
  }
  const cv::Mat smoothed = smooth(work, config.smoothing, config.blur_kernel);
  cv::Mat out = cv::Mat::zeros(smoothed.size(), smoothed.type());
  smoothed.copyTo(out, mask);
  return out;
}

Channel channel_for(ChannelMode mode) {
  switch (mode) {
    case ChannelMode::Red:
      return Channel::Red;
    case ChannelMode::Blue:
      return Channel::Blue;
    case ChannelMode::Green:
    default:
      return Channel::Green;
  }
}

}  // namespace

std::string_view to_string(Channel channel) noexcept {
  switch (channel) {
    case Channel::Blue:
      return "blue";
    case Channel::Green:
      return "green";
    case Channel::Red:
      return "red";
  }
  return "unknown";
}

std::expected<Channel, pc::PipelineError> select_max_dispersion_channel(
    const pc::Frame& bgr, const pc::RegionGeometry& region) {
  auto mat = detail::frame_to_mat(bgr);
  if (!mat || bgr.format() != pc::PixelFormat::BGR8 ||
      !detail::matches_working_size(*mat, region)) {
    return std::unexpected(pc::PipelineError::InvalidFrame);
  }

  cv::Scalar mean;
  cv::Scalar stddev;
  try {
    cv::meanStdDev(*mat, mean, stddev, detail::working_mask(region));
  } catch (const cv::Exception&) {
    return std::unexpected(pc::PipelineError::StageFailed);
  }

  Channel best = Channel::Green;
  double best_sd = stddev[static_cast<int>(Channel::Green)];
  for (const Channel c : {Channel::Blue, Channel::Red}) {
    const double sd = stddev[static_cast<int>(c)];
    if (sd > best_sd) {
      best = c;
      best_sd = sd;
    }
  }
  return best;
}

std::expected<NormalizedSignal, pc::PipelineError> normalize_signal(
    const pc::Frame& bgr, const NormalizeConfig& config, const pc::RegionGeometry& region) {
  if (config.blur_kernel <= 0 || config.blur_kernel % 2 == 0 || config.clip_limit <= 0.0 ||
      config.tile_grid < 1) {
    return std::unexpected(pc::PipelineError::InvalidConfig);
  }
  auto mat = detail::frame_to_mat(bgr);
  if (!mat || bgr.format() != pc::PixelFormat::BGR8 ||
      !detail::matches_working_size(*mat, region)) {
    return std::unexpected(pc::PipelineError::InvalidFrame);
  }

  try {
    const cv::Mat mask = detail::working_mask(region);

    if (config.channel_mode == ChannelMode::HsvRange) {
      const cv::Mat color = filter_inside(*mat, mask, region, config, false);
      return NormalizedSignal{detail::mat_to_frame(color, pc::PixelFormat::BGR8), std::nullopt};
    }

    Channel channel = channel_for(config.channel_mode);
    if (config.channel_mode == ChannelMode::Auto) {
      auto picked = select_max_dispersion_channel(bgr, region);
      if (!picked) {
        return std::unexpected(picked.error());
      }
      channel = *picked;
    }

    cv::Mat plane;
    cv::extractChannel(*mat, plane, static_cast<int>(channel));
    const cv::Mat signal = filter_inside(plane, mask, region, config, config.contrast_enabled);
    return NormalizedSignal{detail::mat_to_frame(signal, pc::PixelFormat::Grayscale8), channel};
  } catch (const cv::Exception&) {
    return std::unexpected(pc::PipelineError::StageFailed);
  }
}

}  // namespace pillsight::vision
