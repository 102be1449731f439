#include <pillsight/vision/separate_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <memory>
#include <string>

namespace pillsight::vision {

namespace pc = pillsight::core;

namespace {

/// Distance field scaled to 0..255 for display.
std::shared_ptr<const pc::Frame> displayable_distance(const pc::Frame& distance) {
  auto mat = detail::frame_to_mat(distance);
  if (!mat) return nullptr;
  cv::Mat view;
  cv::normalize(*mat, view, 0, 255, cv::NORM_MINMAX, CV_8U);
  return std::make_shared<const pc::Frame>(
      detail::mat_to_frame(view, pc::PixelFormat::Grayscale8));
}

}  // namespace

SeparateStage::SeparateStage(SeparateConfig config, bool emit_debug)
    : config_(config), emit_debug_(emit_debug) {}

std::expected<pc::StageOutput, pc::PipelineError> SeparateStage::process(
    const pc::PipelineState& input) {
  pc::PipelineState out = input;

  if (config_.mode == SeparateMode::Hough) {
    if (!input.signal) {
      return std::unexpected(pc::PipelineError::InvalidConfig);
    }
    auto circles = detect_circles(*input.signal, config_);
    if (!circles) {
      return std::unexpected(circles.error());
    }
    out.add_metadata("circles", std::to_string(circles->size()));
    out.candidates = std::move(*circles);
    return pc::StageOutput{std::move(out)};
  }

  if (!input.binary) {
    return std::unexpected(pc::PipelineError::InvalidConfig);
  }
  auto separation = separate_touching(*input.binary, config_);
  if (!separation) {
    return std::unexpected(separation.error());
  }

  out.add_metadata("peaks", std::to_string(separation->candidates.size()));
  if (emit_debug_) {
    try {
      if (auto view = displayable_distance(separation->distance)) {
        out.debug.push_back({"distance", std::move(view)});
      }
    } catch (const cv::Exception&) {
      return std::unexpected(pc::PipelineError::StageFailed);
    }
    out.debug.push_back(
        {"peaks", std::make_shared<const pc::Frame>(std::move(separation->peaks))});
  }
  out.candidates = std::move(separation->candidates);
  return pc::StageOutput{std::move(out)};
}

}  // namespace pillsight::vision
