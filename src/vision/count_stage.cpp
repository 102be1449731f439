#include <pillsight/vision/count_stage.hpp>
#include <pillsight/core/count_result.hpp>

namespace pillsight::vision {

namespace pc = pillsight::core;

CountStage::CountStage(FilterConfig filter, ReportConfig report)
    : filter_(filter), report_(report) {}

std::expected<pc::StageOutput, pc::PipelineError> CountStage::process(
    const pc::PipelineState& input) {
  if (!input.original || !input.region || !input.candidates) {
    return std::unexpected(pc::PipelineError::InvalidConfig);
  }

  pc::CountResult out;
  out.detections = filter_candidates(*input.candidates, filter_, *input.region);
  out.count = out.detections.size();

  auto annotated = annotate(*input.original, out.detections, *input.region, report_);
  if (!annotated) {
    return std::unexpected(annotated.error());
  }
  out.annotated = std::move(*annotated);

  if (out.count == 0) {
    out.warnings.push_back(pc::PipelineWarning::NoDetections);
  }
  if (report_.debug_images) {
    out.debug_images = input.debug;
  }
  out.metadata = input.metadata;
  return pc::StageOutput{std::move(out)};
}

}  // namespace pillsight::vision
