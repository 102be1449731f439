#pragma once

#include <pillsight/core/error.hpp>
#include <pillsight/core/pipeline_stage.hpp>
#include <pillsight/vision/separator.hpp>
#include <expected>

namespace pillsight::vision {

/// Binary map (or, on the Hough path, the signal) -> candidates, one per object.
class SeparateStage : public pillsight::core::IPipelineStage {
 public:
  explicit SeparateStage(SeparateConfig config, bool emit_debug = true);

  [[nodiscard]] std::expected<pillsight::core::StageOutput,
                              pillsight::core::PipelineError>
  process(const pillsight::core::PipelineState& input) override;

 private:
  SeparateConfig config_;
  bool emit_debug_;
};

}  // namespace pillsight::vision
