#include <pillsight/app/config.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace pillsight::app {

namespace pv = pillsight::vision;
namespace pc = pillsight::core;

namespace {

constexpr double kMaxMinDist = 10000.0;

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

ConfigIssue issue(std::string_view key, std::string reason) {
  return ConfigIssue{std::string(key), std::move(reason)};
}

std::expected<double, ConfigIssue> parse_double(std::string_view key, const std::string& value) {
  try {
    std::size_t used = 0;
    const double d = std::stod(value, &used);
    if (used == value.size()) return d;
  } catch (const std::invalid_argument&) {
  } catch (const std::out_of_range&) {
  }
  return std::unexpected(issue(key, "expected a number, got '" + value + "'"));
}

std::expected<int, ConfigIssue> parse_int(std::string_view key, const std::string& value) {
  try {
    std::size_t used = 0;
    const int i = std::stoi(value, &used);
    if (used == value.size()) return i;
  } catch (const std::invalid_argument&) {
  } catch (const std::out_of_range&) {
  }
  return std::unexpected(issue(key, "expected an integer, got '" + value + "'"));
}

std::expected<bool, ConfigIssue> parse_bool(std::string_view key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
  if (value == "false" || value == "0" || value == "no" || value == "off") return false;
  return std::unexpected(issue(key, "expected true/false, got '" + value + "'"));
}

std::expected<pv::HsvBounds, ConfigIssue> parse_hsv(std::string_view key, const std::string& value) {
  std::istringstream in(value);
  std::string part;
  std::vector<int> parts;
  while (std::getline(in, part, ',')) {
    trim(part);
    auto v = parse_int(key, part);
    if (!v) return std::unexpected(v.error());
    parts.push_back(*v);
  }
  if (parts.size() != 3) {
    return std::unexpected(issue(key, "expected h,s,v, got '" + value + "'"));
  }
  return pv::HsvBounds{parts[0], parts[1], parts[2]};
}

bool is_odd_positive(int k) { return k > 0 && k % 2 == 1; }

bool hsv_in_range(const pv::HsvBounds& b) {
  return b.h >= 0 && b.h <= 179 && b.s >= 0 && b.s <= 255 && b.v >= 0 && b.v <= 255;
}

/// Assign a parsed value or forward the parse failure.
template <typename T, typename Parsed>
std::expected<void, ConfigIssue> assign(T& field, Parsed parsed) {
  if (!parsed) return std::unexpected(parsed.error());
  field = static_cast<T>(*parsed);
  return {};
}

}  // namespace

PipelineConfig default_config() {
  PipelineConfig c;
  c.region.shape = pc::RegionShape::Circle;
  c.region.extent = 0.7;
  c.normalize.channel_mode = pv::ChannelMode::Green;
  c.normalize.clip_limit = 5.0;
  c.normalize.tile_grid = 8;
  c.normalize.blur_kernel = 15;
  c.binarize.mode = pv::BinarizeMode::Otsu;
  c.separate.mode = pv::SeparateMode::Peaks;
  c.separate.tau = 0.5;
  c.filter.min_area = 10.0;
  c.filter.max_center_frac = 0.9;
  return c;
}

std::expected<PipelineConfig, ConfigIssue> load_config(const std::string& path) {
  PipelineConfig c = default_config();
  std::ifstream f(path);
  if (!f) return std::unexpected(issue("config", "cannot open " + path));

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) {
      return std::unexpected(issue(line, "expected key=value"));
    }
    auto applied = apply_config_value(c, key, value);
    if (!applied) return std::unexpected(applied.error());
  }
  return c;
}

std::expected<void, ConfigIssue> apply_config_value(PipelineConfig& c, std::string_view key,
                                                    std::string_view raw) {
  std::string value(raw);
  trim(value);

  if (key == "region.shape") {
    if (value == "circle") c.region.shape = pc::RegionShape::Circle;
    else if (value == "rect") c.region.shape = pc::RegionShape::Rect;
    else return std::unexpected(issue(key, "expected circle or rect"));
    return {};
  }
  if (key == "region.extent") return assign(c.region.extent, parse_double(key, value));

  if (key == "channel.mode") {
    if (value == "red") c.normalize.channel_mode = pv::ChannelMode::Red;
    else if (value == "green") c.normalize.channel_mode = pv::ChannelMode::Green;
    else if (value == "blue") c.normalize.channel_mode = pv::ChannelMode::Blue;
    else if (value == "auto") c.normalize.channel_mode = pv::ChannelMode::Auto;
    else if (value == "hsv-range") c.normalize.channel_mode = pv::ChannelMode::HsvRange;
    else return std::unexpected(issue(key, "expected red, green, blue, auto or hsv-range"));
    return {};
  }
  if (key == "contrast.enabled") return assign(c.normalize.contrast_enabled, parse_bool(key, value));
  if (key == "contrast.clipLimit") return assign(c.normalize.clip_limit, parse_double(key, value));
  if (key == "contrast.tileGrid") return assign(c.normalize.tile_grid, parse_int(key, value));
  if (key == "blur.kind") {
    if (value == "gaussian") c.normalize.smoothing = pv::SmoothingKind::Gaussian;
    else if (value == "bilateral") c.normalize.smoothing = pv::SmoothingKind::Bilateral;
    else return std::unexpected(issue(key, "expected gaussian or bilateral"));
    return {};
  }
  if (key == "blur.kernel") return assign(c.normalize.blur_kernel, parse_int(key, value));

  if (key == "binarize.mode") {
    if (value == "otsu") c.binarize.mode = pv::BinarizeMode::Otsu;
    else if (value == "fixed") c.binarize.mode = pv::BinarizeMode::Fixed;
    else if (value == "adaptive") c.binarize.mode = pv::BinarizeMode::Adaptive;
    else if (value == "hsv-range") c.binarize.mode = pv::BinarizeMode::HsvRange;
    else return std::unexpected(issue(key, "expected otsu, fixed, adaptive or hsv-range"));
    return {};
  }
  if (key == "binarize.threshold") return assign(c.binarize.threshold, parse_double(key, value));
  if (key == "binarize.blockSize") return assign(c.binarize.block_size, parse_int(key, value));
  if (key == "binarize.C") return assign(c.binarize.c, parse_double(key, value));
  if (key == "binarize.adaptiveMethod") {
    if (value == "mean") c.binarize.adaptive_method = pv::AdaptiveMethod::Mean;
    else if (value == "gaussian") c.binarize.adaptive_method = pv::AdaptiveMethod::Gaussian;
    else return std::unexpected(issue(key, "expected mean or gaussian"));
    return {};
  }
  if (key == "binarize.inverse") return assign(c.binarize.inverse, parse_bool(key, value));
  if (key == "binarize.minContrast") return assign(c.binarize.min_contrast, parse_double(key, value));
  if (key == "binarize.hsvLower") return assign(c.binarize.hsv_lower, parse_hsv(key, value));
  if (key == "binarize.hsvUpper") return assign(c.binarize.hsv_upper, parse_hsv(key, value));

  if (key == "morph.openKernel") return assign(c.binarize.morphology.open_kernel, parse_int(key, value));
  if (key == "morph.closeKernel") return assign(c.binarize.morphology.close_kernel, parse_int(key, value));
  if (key == "morph.closeIterations") {
    return assign(c.binarize.morphology.close_iterations, parse_int(key, value));
  }
  if (key == "morph.fillHoles") return assign(c.binarize.morphology.fill_holes, parse_bool(key, value));

  if (key == "separate.mode") {
    if (value == "peaks") c.separate.mode = pv::SeparateMode::Peaks;
    else if (value == "threshold") c.separate.mode = pv::SeparateMode::Threshold;
    else if (value == "hough") c.separate.mode = pv::SeparateMode::Hough;
    else return std::unexpected(issue(key, "expected peaks, threshold or hough"));
    return {};
  }
  if (key == "separate.tau") return assign(c.separate.tau, parse_double(key, value));
  if (key == "separate.minDist") return assign(c.separate.min_dist, parse_double(key, value));
  if (key == "separate.minPeakArea") return assign(c.separate.min_peak_area, parse_int(key, value));
  if (key == "separate.minRadius") return assign(c.separate.min_radius, parse_int(key, value));
  if (key == "separate.maxRadius") return assign(c.separate.max_radius, parse_int(key, value));
  if (key == "separate.houghEdge") return assign(c.separate.hough_edge, parse_double(key, value));
  if (key == "separate.houghVotes") return assign(c.separate.hough_votes, parse_double(key, value));

  if (key == "filter.minArea") return assign(c.filter.min_area, parse_double(key, value));
  if (key == "filter.maxArea") {
    if (value == "none") {
      c.filter.max_area.reset();
      return {};
    }
    auto v = parse_double(key, value);
    if (!v) return std::unexpected(v.error());
    c.filter.max_area = *v;
    return {};
  }
  if (key == "filter.minCircularity") return assign(c.filter.min_circularity, parse_double(key, value));
  if (key == "filter.maxCenterFrac") return assign(c.filter.max_center_frac, parse_double(key, value));
  if (key == "filter.groupStats") return assign(c.filter.group_stats, parse_bool(key, value));
  if (key == "filter.groupMinAreaFrac") {
    return assign(c.filter.group_min_area_frac, parse_double(key, value));
  }
  if (key == "filter.groupMaxOffsetFrac") {
    return assign(c.filter.group_max_offset_frac, parse_double(key, value));
  }
  if (key == "filter.groupMinCount") {
    auto v = parse_int(key, value);
    if (!v) return std::unexpected(v.error());
    if (*v < 0) return std::unexpected(issue(key, "must be >= 0"));
    c.filter.group_min_count = static_cast<std::size_t>(*v);
    return {};
  }

  if (key == "report.debugImages") return assign(c.report.debug_images, parse_bool(key, value));
  if (key == "report.drawRegion") return assign(c.report.draw_region, parse_bool(key, value));

  return std::unexpected(issue(key, "unknown option"));
}

std::expected<void, ConfigIssue> validate_config(const PipelineConfig& c) {
  if (!(c.region.extent > 0.0 && c.region.extent <= 1.0)) {
    return std::unexpected(issue("region.extent", "must be in (0, 1]"));
  }

  const auto& n = c.normalize;
  if (!(n.clip_limit > 0.0)) return std::unexpected(issue("contrast.clipLimit", "must be > 0"));
  if (n.tile_grid < 1) return std::unexpected(issue("contrast.tileGrid", "must be >= 1"));
  if (!is_odd_positive(n.blur_kernel)) {
    return std::unexpected(issue("blur.kernel", "must be an odd positive integer"));
  }

  const auto& b = c.binarize;
  const bool hsv_channel = n.channel_mode == pv::ChannelMode::HsvRange;
  const bool hsv_binarize = b.mode == pv::BinarizeMode::HsvRange;
  if (hsv_channel != hsv_binarize) {
    return std::unexpected(issue("binarize.mode",
                                 "hsv-range must be selected for both channel.mode and binarize.mode"));
  }
  if (!(b.threshold >= 0.0 && b.threshold <= 255.0)) {
    return std::unexpected(issue("binarize.threshold", "must be in [0, 255]"));
  }
  if (b.block_size < 3 || b.block_size % 2 == 0) {
    return std::unexpected(issue("binarize.blockSize", "must be odd and >= 3"));
  }
  if (!(b.min_contrast >= 0.0)) {
    return std::unexpected(issue("binarize.minContrast", "must be >= 0"));
  }
  if (!hsv_in_range(b.hsv_lower)) {
    return std::unexpected(issue("binarize.hsvLower", "h must be in [0, 179], s and v in [0, 255]"));
  }
  if (!hsv_in_range(b.hsv_upper)) {
    return std::unexpected(issue("binarize.hsvUpper", "h must be in [0, 179], s and v in [0, 255]"));
  }
  if (b.hsv_lower.h > b.hsv_upper.h || b.hsv_lower.s > b.hsv_upper.s ||
      b.hsv_lower.v > b.hsv_upper.v) {
    return std::unexpected(issue("binarize.hsvLower", "must not exceed binarize.hsvUpper"));
  }

  const auto& m = b.morphology;
  if (m.open_kernel != 0 && !is_odd_positive(m.open_kernel)) {
    return std::unexpected(issue("morph.openKernel", "must be 0 or odd"));
  }
  if (m.close_kernel != 0 && !is_odd_positive(m.close_kernel)) {
    return std::unexpected(issue("morph.closeKernel", "must be 0 or odd"));
  }
  if (m.close_iterations < 1) {
    return std::unexpected(issue("morph.closeIterations", "must be >= 1"));
  }

  const auto& s = c.separate;
  if (!(s.tau > 0.0 && s.tau < 1.0)) return std::unexpected(issue("separate.tau", "must be in (0, 1)"));
  if (!(s.min_dist > 0.0 && s.min_dist <= kMaxMinDist)) {
    return std::unexpected(issue("separate.minDist", "must be in (0, 10000]"));
  }
  if (s.min_peak_area < 1) return std::unexpected(issue("separate.minPeakArea", "must be >= 1"));
  if (s.mode == pv::SeparateMode::Hough) {
    if (hsv_channel) {
      return std::unexpected(issue("separate.mode", "hough needs a scalar channel, not hsv-range"));
    }
    if (s.min_radius <= 0) return std::unexpected(issue("separate.minRadius", "must be > 0"));
    if (s.max_radius < s.min_radius) {
      return std::unexpected(issue("separate.maxRadius", "must be >= separate.minRadius"));
    }
    if (!(s.hough_edge > 0.0)) return std::unexpected(issue("separate.houghEdge", "must be > 0"));
    if (!(s.hough_votes > 0.0)) return std::unexpected(issue("separate.houghVotes", "must be > 0"));
  }

  const auto& f = c.filter;
  if (!(f.min_area > 0.0)) return std::unexpected(issue("filter.minArea", "must be > 0"));
  if (f.max_area && !(*f.max_area >= f.min_area)) {
    return std::unexpected(issue("filter.maxArea", "must be >= filter.minArea"));
  }
  if (!(f.min_circularity >= 0.0 && f.min_circularity <= 1.0)) {
    return std::unexpected(issue("filter.minCircularity", "must be in [0, 1]"));
  }
  if (!(f.max_center_frac > 0.0 && f.max_center_frac <= 1.0)) {
    return std::unexpected(issue("filter.maxCenterFrac", "must be in (0, 1]"));
  }
  if (!(f.group_min_area_frac >= 0.0 && f.group_min_area_frac <= 1.0)) {
    return std::unexpected(issue("filter.groupMinAreaFrac", "must be in [0, 1]"));
  }
  if (!(f.group_max_offset_frac > 0.0)) {
    return std::unexpected(issue("filter.groupMaxOffsetFrac", "must be > 0"));
  }
  return {};
}

}  // namespace pillsight::app
