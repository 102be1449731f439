#pragma once

#include <pillsight/core/error.hpp>
#include <pillsight/core/frame.hpp>
#include <pillsight/core/region.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>

namespace pillsight::vision {

/// Which signal feeds binarization.
enum class ChannelMode : std::uint8_t {
  Red,
  Green,     // pink pill on wood: green is usually the cleanest
  Blue,      // pink pill on a red lid: pink is high in blue, red is not
  Auto,      // channel with the largest standard deviation inside the region
  HsvRange,  // keep colour; the binarizer filters on an HSV box
};

/// Colour plane, valued by its index in BGR order.
enum class Channel : std::uint8_t {
  Blue = 0,
  Green = 1,
  Red = 2,
};

enum class SmoothingKind : std::uint8_t {
  Gaussian,
  Bilateral,  // edge-preserving; slower
};

struct NormalizeConfig {
  ChannelMode channel_mode{ChannelMode::Green};
  bool contrast_enabled{true};
  double clip_limit{5.0};  // CLAHE clip limit, > 0
  int tile_grid{8};        // CLAHE tiles per side
  SmoothingKind smoothing{SmoothingKind::Gaussian};
  int blur_kernel{15};  // odd, > 0; 1 disables smoothing
};

struct NormalizedSignal {
  pillsight::core::Frame signal;  // Grayscale8, or BGR8 for ChannelMode::HsvRange
  std::optional<Channel> channel;
};

[[nodiscard]] std::string_view to_string(Channel channel) noexcept;

/// Channel with maximal standard deviation over the trusted pixels of a BGR8 frame.
/// Ties resolve green, then blue, then red.
[[nodiscard]] std::expected<Channel, pillsight::core::PipelineError>
select_max_dispersion_channel(const pillsight::core::Frame& bgr,
                              const pillsight::core::RegionGeometry& region);

/// Reduce the masked colour frame to one bright-foreground signal: channel pick,
/// CLAHE, then low-pass filtering to suppress engraving and wood grain.
/// Pixels outside the trusted region are zero in the result.
[[nodiscard]] std::expected<NormalizedSignal, pillsight::core::PipelineError>
normalize_signal(const pillsight::core::Frame& bgr,
                 const NormalizeConfig& config,
                 const pillsight::core::RegionGeometry& region);

}  // namespace pillsight::vision
