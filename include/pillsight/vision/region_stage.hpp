#pragma once

#include <pillsight/core/error.hpp>
#include <pillsight/core/pipeline_stage.hpp>
#include <pillsight/vision/region_selector.hpp>
#include <expected>

namespace pillsight::vision {

/// Computes the trusted region for the input photograph and spotlights or crops it.
class RegionStage : public pillsight::core::IPipelineStage {
 public:
  explicit RegionStage(RegionConfig config, bool emit_debug = true);

  [[nodiscard]] std::expected<pillsight::core::StageOutput,
                              pillsight::core::PipelineError>
  process(const pillsight::core::PipelineState& input) override;

 private:
  RegionConfig config_;
  bool emit_debug_;
};

}  // namespace pillsight::vision
