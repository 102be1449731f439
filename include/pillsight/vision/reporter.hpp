#pragma once

#include <pillsight/core/detection.hpp>
#include <pillsight/core/error.hpp>
#include <pillsight/core/frame.hpp>
#include <pillsight/core/region.hpp>
#include <expected>
#include <span>

namespace pillsight::vision {

struct ReportConfig {
  bool debug_images{true};  // attach intermediate grids to the result
  bool draw_region{true};   // outline the trusted region on the annotated image
};

/// Copy of the original frame (BGR8) with, per detection, a centroid dot, an
/// enclosing circle and its index. The original is not modified.
[[nodiscard]] std::expected<pillsight::core::Frame, pillsight::core::PipelineError>
annotate(const pillsight::core::Frame& original,
         std::span<const pillsight::core::Detection> detections,
         const pillsight::core::RegionGeometry& region,
         const ReportConfig& config = {});

}  // namespace pillsight::vision
