#pragma once

#include <pillsight/core/detection.hpp>
#include <pillsight/core/error.hpp>
#include <pillsight/core/frame.hpp>
#include <cstdint>
#include <expected>
#include <vector>

namespace pillsight::vision {

enum class SeparateMode : std::uint8_t {
  Peaks,      // local maxima of the distance field (dilation test), above tau * max
  Threshold,  // connected components of the distance field above tau * max
  Hough,      // circle fit on the signal; no binary map needed
};

struct SeparateConfig {
  SeparateMode mode{SeparateMode::Peaks};
  /// Fraction of the maximum distance a peak must exceed, (0, 1).
  /// Threshold mode: lower merges touching pills, higher fragments one pill's ridge.
  double tau{0.5};
  /// Minimum centre-to-centre separation of two peaks or circles, pixels.
  double min_dist{20.0};
  int min_peak_area{1};  // peaks with fewer pixels are noise
  int min_radius{10};    // Hough radius range, pixels
  int max_radius{60};
  double hough_edge{100.0};  // upper Canny threshold used by the Hough gradient
  double hough_votes{30.0};  // accumulator threshold for circle centres
};

/// Separated candidates plus the intermediate grids, in working coordinates.
struct Separation {
  std::vector<pillsight::core::Candidate> candidates;
  pillsight::core::Frame distance;  // Float32Gray
  pillsight::core::Frame peaks;     // Grayscale8, 255 = peak pixel
};

/// Euclidean distance from every foreground pixel of a Grayscale8 map to the nearest background pixel.
[[nodiscard]] std::expected<pillsight::core::Frame, pillsight::core::PipelineError>
distance_field(const pillsight::core::Frame& binary);

/// Split touching foreground blobs: one candidate per distance-field peak, in the
/// order contour traversal discovers the peaks. Each peak seeds a watershed over
/// the distance field; the flooded region gives the candidate's area and shape.
/// config.mode must be Peaks or Threshold.
[[nodiscard]] std::expected<Separation, pillsight::core::PipelineError>
separate_touching(const pillsight::core::Frame& binary, const SeparateConfig& config);

/// Circle candidates found directly on a Grayscale8 signal with the Hough gradient method.
[[nodiscard]] std::expected<std::vector<pillsight::core::Candidate>,
                            pillsight::core::PipelineError>
detect_circles(const pillsight::core::Frame& signal, const SeparateConfig& config);

}  // namespace pillsight::vision
