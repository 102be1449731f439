#pragma once

#include <pillsight/core/region.hpp>
#include <cstdint>
#include <optional>

namespace pillsight::core {

/// Axis-aligned bounding box (pixel coords).
struct BBox {
  float x{0.f};
  float y{0.f};
  float w{0.f};
  float h{0.f};
};

/// Region produced by the separator, one intended per physical object.
/// Coordinates are working coordinates until the filter translates them.
struct Candidate {
  Point2 centroid{};
  double area{0.0};       // pixel count of the separated region
  double peak_area{0.0};  // pixel count of the seeding peak (0 for circle fits)
  std::optional<float> radius;
  std::optional<BBox> bbox;
  std::optional<double> circularity;  // 4*pi*area / perimeter^2
};

/// Candidate that survived filtering. index runs 1..count in discovery order.
struct Detection {
  std::uint32_t index{0};
  Candidate candidate{};
};

}  // namespace pillsight::core
