#pragma once

#include <cstdint>

namespace pillsight::core {

/// Shape of the trusted area of the frame.
enum class RegionShape : std::uint8_t {
  Circle,  // spotlight: pixels outside are zeroed, array size unchanged
  Rect,    // concentric crop: pixels outside are dropped, arrays shrink
};

/// Point in pixel coordinates (x right, y down).
struct Point2 {
  float x{0.f};
  float y{0.f};
};

/// Algebraic description of the trusted region (the Mask).
///
/// "Frame" coordinates refer to the decoded photograph. "Working" coordinates
/// refer to the arrays the later stages operate on: identical to frame
/// coordinates for a circle, offset by (left, top) for a rectangle.
struct RegionGeometry {
  RegionShape shape{RegionShape::Circle};
  std::uint32_t frame_width{0};
  std::uint32_t frame_height{0};

  /// Circle centre and radius, frame coordinates. Unused for Rect.
  float center_x{0.f};
  float center_y{0.f};
  float radius{0.f};

  /// Working window inside the frame; the whole frame for Circle.
  std::uint32_t left{0};
  std::uint32_t top{0};
  std::uint32_t width{0};
  std::uint32_t height{0};

  /// Geometric centre of the trusted region, frame coordinates.
  [[nodiscard]] Point2 center() const noexcept;

  /// Circle radius, or half the shorter side of the kept rectangle.
  [[nodiscard]] float trusted_radius() const noexcept;

  /// True if (x, y) in frame coordinates lies inside the trusted region.
  [[nodiscard]] bool contains(float x, float y) const noexcept;

  [[nodiscard]] Point2 to_frame(Point2 working) const noexcept {
    return Point2{working.x + static_cast<float>(left),
                  working.y + static_cast<float>(top)};
  }
};

}  // namespace pillsight::core
