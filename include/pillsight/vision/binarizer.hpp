#pragma once

#include <pillsight/core/error.hpp>
#include <pillsight/core/frame.hpp>
#include <pillsight/core/region.hpp>
#include <cstdint>
#include <expected>
#include <optional>

namespace pillsight::vision {

enum class BinarizeMode : std::uint8_t {
  Otsu,      // global, automatic; statistics over the whole (spotlighted) signal
  Fixed,     // global, user threshold
  Adaptive,  // per-pixel threshold against the local mean minus C
  HsvRange,  // colour box on the BGR signal instead of a scalar threshold
};

enum class AdaptiveMethod : std::uint8_t {
  Mean,
  Gaussian,
};

/// OpenCV HSV ranges: h in [0, 179], s and v in [0, 255].
struct HsvBounds {
  int h{0};
  int s{0};
  int v{0};
};

/// Post-processing applied after every binarization mode. Kernel 0 disables a step.
struct MorphologyConfig {
  int open_kernel{3};   // erode then dilate: drops specks
  int close_kernel{0};  // dilate then erode: bridges gaps
  int close_iterations{1};
  bool fill_holes{false};  // fill the interior of every external contour
};

struct BinarizeConfig {
  BinarizeMode mode{BinarizeMode::Otsu};
  double threshold{127.0};  // Fixed mode cutoff
  int block_size{51};       // Adaptive neighbourhood, odd >= 3
  double c{-10.0};          // Adaptive offset: threshold = local mean - c
  AdaptiveMethod adaptive_method{AdaptiveMethod::Gaussian};
  bool inverse{false};  // foreground = below threshold
  /// Trusted-region spread (max - min) below which the map is all background.
  double min_contrast{8.0};
  HsvBounds hsv_lower{0, 40, 60};
  HsvBounds hsv_upper{179, 255, 255};
  MorphologyConfig morphology{};
};

struct BinaryMap {
  pillsight::core::Frame map;      // Grayscale8, 255 = foreground
  std::optional<double> threshold;  // global cutoff when one was applied
};

/// Foreground/background map from the normalized signal. Nothing outside the
/// trusted region is ever foreground.
[[nodiscard]] std::expected<BinaryMap, pillsight::core::PipelineError>
binarize(const pillsight::core::Frame& signal,
         const BinarizeConfig& config,
         const pillsight::core::RegionGeometry& region);

/// Morphological cleanup of a Grayscale8 map, followed by re-applying the region mask.
[[nodiscard]] std::expected<pillsight::core::Frame, pillsight::core::PipelineError>
refine_binary(const pillsight::core::Frame& binary,
              const MorphologyConfig& config,
              const pillsight::core::RegionGeometry& region);

}  // namespace pillsight::vision
