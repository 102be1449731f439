#pragma once

#include <pillsight/core/count_result.hpp>
#include <pillsight/core/detection.hpp>
#include <pillsight/core/error.hpp>
#include <pillsight/core/frame.hpp>
#include <pillsight/core/region.hpp>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pillsight::core {

/// Everything one invocation has derived so far. Frames are written once by the
/// stage that produces them and only read afterwards, so copying a state is cheap.
struct PipelineState {
  std::shared_ptr<const Frame> original;  // decoded photograph, never modified
  std::optional<RegionGeometry> region;
  std::shared_ptr<const Frame> color;   // spotlighted or cropped BGR view
  std::shared_ptr<const Frame> signal;  // normalized intensity (BGR on the HSV path)
  std::shared_ptr<const Frame> binary;  // 0 / 255 foreground map
  std::optional<std::vector<Candidate>> candidates;
  std::vector<DebugImage> debug;
  std::string metadata;

  void add_metadata(std::string_view key, std::string_view value);
};

/// Output of a pipeline stage: either the state for the next stage or the final CountResult.
using StageOutput = std::variant<PipelineState, CountResult>;

/// Abstract pipeline stage: derive a new state from the previous one, or finish.
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual std::expected<StageOutput, PipelineError> process(
      const PipelineState& input) = 0;
};

}  // namespace pillsight::core
