#pragma once

#include <pillsight/core/error.hpp>
#include <pillsight/core/pipeline_stage.hpp>
#include <pillsight/vision/binarizer.hpp>
#include <expected>

namespace pillsight::vision {

/// Signal -> binary map, including morphological cleanup.
class BinarizeStage : public pillsight::core::IPipelineStage {
 public:
  explicit BinarizeStage(BinarizeConfig config, bool emit_debug = true);

  [[nodiscard]] std::expected<pillsight::core::StageOutput,
                              pillsight::core::PipelineError>
  process(const pillsight::core::PipelineState& input) override;

 private:
  BinarizeConfig config_;
  bool emit_debug_;
};

}  // namespace pillsight::vision
