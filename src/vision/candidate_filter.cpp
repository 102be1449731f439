#include <pillsight/vision/candidate_filter.hpp>
#include <algorithm>
#include <cmath>

namespace pillsight::vision {

namespace pc = pillsight::core;

namespace {

float distance(pc::Point2 a, pc::Point2 b) {
  return std::hypot(a.x - b.x, a.y - b.y);
}

bool passes_fixed_rules(const pc::Candidate& c, const FilterConfig& config,
                        const pc::RegionGeometry& region) {
  const pc::Point2 p = region.to_frame(c.centroid);
  if (!region.contains(p.x, p.y)) return false;
  if (c.area < config.min_area) return false;
  if (config.max_area && c.area > *config.max_area) return false;
  if (config.min_circularity > 0.0 && c.circularity &&
      *c.circularity < config.min_circularity) {
    return false;
  }
  const float limit = static_cast<float>(config.max_center_frac) * region.trusted_radius();
  return distance(p, region.center()) <= limit;
}

double median_area(const std::vector<const pc::Candidate*>& kept) {
  std::vector<double> areas;
  areas.reserve(kept.size());
  for (const auto* c : kept) areas.push_back(c->area);
  std::sort(areas.begin(), areas.end());
  const std::size_t n = areas.size();
  return n % 2 == 1 ? areas[n / 2] : 0.5 * (areas[n / 2 - 1] + areas[n / 2]);
}

std::vector<const pc::Candidate*> apply_group_rule(std::vector<const pc::Candidate*> kept,
                                                   const FilterConfig& config,
                                                   const pc::RegionGeometry& region) {
  const double median = median_area(kept);
  pc::Point2 group{};
  for (const auto* c : kept) {
    group.x += c->centroid.x;
    group.y += c->centroid.y;
  }
  group.x /= static_cast<float>(kept.size());
  group.y /= static_cast<float>(kept.size());

  const double max_offset = config.group_max_offset_frac * static_cast<double>(region.width);
  std::erase_if(kept, [&](const pc::Candidate* c) {
    return c->area < config.group_min_area_frac * median ||
           distance(c->centroid, group) > max_offset;
  });
  return kept;
}

}  // namespace

std::vector<pc::Detection> filter_candidates(std::span<const pc::Candidate> candidates,
                                             const FilterConfig& config,
                                             const pc::RegionGeometry& region) {
  std::vector<const pc::Candidate*> kept;
  for (const auto& c : candidates) {
    if (passes_fixed_rules(c, config, region)) kept.push_back(&c);
  }
  if (config.group_stats && !kept.empty() && kept.size() >= config.group_min_count) {
    kept = apply_group_rule(std::move(kept), config, region);
  }

  std::vector<pc::Detection> out;
  out.reserve(kept.size());
  std::uint32_t index = 0;
  for (const auto* c : kept) {
    pc::Detection d;
    d.index = ++index;
    d.candidate = *c;
    d.candidate.centroid = region.to_frame(c->centroid);
    if (d.candidate.bbox) {
      d.candidate.bbox->x += static_cast<float>(region.left);
      d.candidate.bbox->y += static_cast<float>(region.top);
    }
    out.push_back(d);
  }
  return out;
}

}  // namespace pillsight::vision
