#pragma once

#include <pillsight/core/error.hpp>
#include <pillsight/core/frame.hpp>
#include <pillsight/core/region.hpp>
#include <cstdint>
#include <expected>

namespace pillsight::vision {

/// Where the user is told to place the pills.
struct RegionConfig {
  pillsight::core::RegionShape shape{pillsight::core::RegionShape::Circle};
  /// Circle: radius = extent * min(W, H) / 2. Rect: kept fraction of each side. Range (0, 1].
  double extent{0.7};
};

/// Geometry of the trusted region for a frame of the given size.
/// Fails with InvalidConfig when the extent is outside (0, 1] or leaves less than one pixel.
[[nodiscard]] std::expected<pillsight::core::RegionGeometry, pillsight::core::PipelineError>
make_region(std::uint32_t width, std::uint32_t height, const RegionConfig& config);

/// Full-frame Grayscale8 mask: 255 inside the trusted region, 0 outside.
[[nodiscard]] pillsight::core::Frame region_mask(
    const pillsight::core::RegionGeometry& region);

/// Spotlight (circle: outside forced to zero in every channel) or crop (rect).
/// Output is BGR8; RGB8 and Grayscale8 inputs are converted first. The input is not modified.
[[nodiscard]] std::expected<pillsight::core::Frame, pillsight::core::PipelineError>
apply_region(const pillsight::core::Frame& frame,
             const pillsight::core::RegionGeometry& region);

}  // namespace pillsight::vision
