#include <pillsight/vision/region_stage.hpp>
#include <memory>

namespace pillsight::vision {

namespace pc = pillsight::core;

RegionStage::RegionStage(RegionConfig config, bool emit_debug)
    : config_(config), emit_debug_(emit_debug) {}

std::expected<pc::StageOutput, pc::PipelineError> RegionStage::process(
    const pc::PipelineState& input) {
  if (!input.original || input.original->empty()) {
    return std::unexpected(pc::PipelineError::InvalidFrame);
  }

  auto region = make_region(input.original->width(), input.original->height(), config_);
  if (!region) {
    return std::unexpected(region.error());
  }
  auto masked = apply_region(*input.original, *region);
  if (!masked) {
    return std::unexpected(masked.error());
  }

  pc::PipelineState out = input;
  out.region = *region;
  out.color = std::make_shared<const pc::Frame>(std::move(*masked));
  if (emit_debug_) {
    out.debug.push_back({"masked", out.color});
  }
  return pc::StageOutput{std::move(out)};
}

}  // namespace pillsight::vision
