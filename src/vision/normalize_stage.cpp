#include <pillsight/vision/normalize_stage.hpp>
#include <memory>

namespace pillsight::vision {

namespace pc = pillsight::core;

NormalizeStage::NormalizeStage(NormalizeConfig config, bool emit_debug)
    : config_(config), emit_debug_(emit_debug) {}

std::expected<pc::StageOutput, pc::PipelineError> NormalizeStage::process(
    const pc::PipelineState& input) {
  if (!input.color || !input.region) {
    return std::unexpected(pc::PipelineError::InvalidConfig);
  }

  auto normalized = normalize_signal(*input.color, config_, *input.region);
  if (!normalized) {
    return std::unexpected(normalized.error());
  }

  pc::PipelineState out = input;
  if (normalized->channel) {
    out.add_metadata("channel", to_string(*normalized->channel));
  }
  out.signal = std::make_shared<const pc::Frame>(std::move(normalized->signal));
  if (emit_debug_) {
    out.debug.push_back({"signal", out.signal});
  }
  return pc::StageOutput{std::move(out)};
}

}  // namespace pillsight::vision
