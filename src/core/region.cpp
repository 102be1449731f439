#include <pillsight/core/region.hpp>
#include <algorithm>

namespace pillsight::core {

Point2 RegionGeometry::center() const noexcept {
  if (shape == RegionShape::Circle) {
    return Point2{center_x, center_y};
  }
  return Point2{static_cast<float>(left) + static_cast<float>(width) / 2.f,
                static_cast<float>(top) + static_cast<float>(height) / 2.f};
}

float RegionGeometry::trusted_radius() const noexcept {
  if (shape == RegionShape::Circle) return radius;
  return static_cast<float>(std::min(width, height)) / 2.f;
}

bool RegionGeometry::contains(float x, float y) const noexcept {
  if (shape == RegionShape::Circle) {
    const float dx = x - center_x;
    const float dy = y - center_y;
    return dx * dx + dy * dy <= radius * radius;
  }
  const auto l = static_cast<float>(left);
  const auto t = static_cast<float>(top);
  return x >= l && y >= t && x < l + static_cast<float>(width) &&
         y < t + static_cast<float>(height);
}

}  // namespace pillsight::core
