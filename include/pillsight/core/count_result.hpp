#pragma once

#include <pillsight/core/detection.hpp>
#include <pillsight/core/error.hpp>
#include <pillsight/core/frame.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pillsight::core {

/// Named intermediate grid for diagnostic display ("masked", "binary", ...).
struct DebugImage {
  std::string name;
  std::shared_ptr<const Frame> image;
};

/// Result of the counting pipeline for one photograph.
struct CountResult {
  std::size_t count{0};
  std::vector<Detection> detections;  // frame coordinates
  Frame annotated;                    // copy of the input with markers drawn
  std::vector<DebugImage> debug_images;
  std::vector<PipelineWarning> warnings;
  std::string metadata;  // free-form "key=value" pairs set by the stages

  /// Which photograph this result belongs to (file name, upload id). Set by the runner.
  std::optional<std::string> image_id;

  [[nodiscard]] bool has_warning(PipelineWarning w) const noexcept {
    for (const auto x : warnings) {
      if (x == w) return true;
    }
    return false;
  }
};

}  // namespace pillsight::core
