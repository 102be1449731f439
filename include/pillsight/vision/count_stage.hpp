#pragma once

#include <pillsight/core/error.hpp>
#include <pillsight/core/pipeline_stage.hpp>
#include <pillsight/vision/candidate_filter.hpp>
#include <pillsight/vision/reporter.hpp>
#include <expected>

namespace pillsight::vision {

/// Final stage: filter candidates, number the survivors, draw them -> CountResult.
class CountStage : public pillsight::core::IPipelineStage {
 public:
  CountStage(FilterConfig filter, ReportConfig report);

  [[nodiscard]] std::expected<pillsight::core::StageOutput,
                              pillsight::core::PipelineError>
  process(const pillsight::core::PipelineState& input) override;

 private:
  FilterConfig filter_;
  ReportConfig report_;
};

}  // namespace pillsight::vision
