#pragma once

#include <pillsight/core/detection.hpp>
#include <pillsight/core/region.hpp>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace pillsight::vision {

/// Rules are ANDed. The group rule adapts to the population in one photograph;
/// its fractions are heuristics to be re-tuned per deployment.
struct FilterConfig {
  double min_area{10.0};
  std::optional<double> max_area;
  double min_circularity{0.0};  // 0 disables; 1 = perfect circle only
  /// Reject centroids farther than this fraction of the trusted radius from the region centre.
  double max_center_frac{0.9};

  bool group_stats{false};
  double group_min_area_frac{0.2};    // reject area < frac * median area
  double group_max_offset_frac{0.4};  // reject centroid farther than frac * working width
  std::size_t group_min_count{3};     // fewer survivors: group rule skipped
};

/// Keeps candidates that pass every enabled rule and lie inside the trusted region.
/// Survivors keep their input order, are numbered 1..n and are translated to frame coordinates.
[[nodiscard]] std::vector<pillsight::core::Detection> filter_candidates(
    std::span<const pillsight::core::Candidate> candidates,
    const FilterConfig& config,
    const pillsight::core::RegionGeometry& region);

}  // namespace pillsight::vision
