#pragma once

#include <pillsight/core/error.hpp>
#include <pillsight/core/pipeline_stage.hpp>
#include <pillsight/vision/channel_normalizer.hpp>
#include <expected>

namespace pillsight::vision {

/// Reduces the masked colour view to the single-channel signal fed to binarization.
class NormalizeStage : public pillsight::core::IPipelineStage {
 public:
  explicit NormalizeStage(NormalizeConfig config, bool emit_debug = true);

  [[nodiscard]] std::expected<pillsight::core::StageOutput,
                              pillsight::core::PipelineError>
  process(const pillsight::core::PipelineState& input) override;

 private:
  NormalizeConfig config_;
  bool emit_debug_;
};

}  // namespace pillsight::vision
