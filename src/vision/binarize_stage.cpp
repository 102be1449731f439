#include <pillsight/vision/binarize_stage.hpp>
#include <iomanip>
#include <memory>
#include <sstream>

namespace pillsight::vision {

namespace pc = pillsight::core;

BinarizeStage::BinarizeStage(BinarizeConfig config, bool emit_debug)
    : config_(config), emit_debug_(emit_debug) {}

std::expected<pc::StageOutput, pc::PipelineError> BinarizeStage::process(
    const pc::PipelineState& input) {
  if (!input.signal || !input.region) {
    return std::unexpected(pc::PipelineError::InvalidConfig);
  }

  auto binary = binarize(*input.signal, config_, *input.region);
  if (!binary) {
    return std::unexpected(binary.error());
  }

  pc::PipelineState out = input;
  if (binary->threshold) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << *binary->threshold;
    out.add_metadata("threshold", os.str());
  }
  out.binary = std::make_shared<const pc::Frame>(std::move(binary->map));
  if (emit_debug_) {
    out.debug.push_back({"binary", out.binary});
  }
  return pc::StageOutput{std::move(out)};
}

}  // namespace pillsight::vision
