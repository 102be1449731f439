#include <pillsight/app/pipeline_builder.hpp>
#include <pillsight/vision/binarize_stage.hpp>
#include <pillsight/vision/count_stage.hpp>
#include <pillsight/vision/normalize_stage.hpp>
#include <pillsight/vision/region_stage.hpp>
#include <pillsight/vision/separate_stage.hpp>
#include <memory>

namespace pillsight::app {

std::expected<pillsight::core::Pipeline, pillsight::core::PipelineError> build_pipeline(
    const PipelineConfig& cfg) {
  using namespace pillsight::vision;

  if (!validate_config(cfg)) {
    return std::unexpected(pillsight::core::PipelineError::InvalidConfig);
  }

  const bool debug = cfg.report.debug_images;
  pillsight::core::Pipeline pipeline;
  pipeline.add_stage(std::make_unique<RegionStage>(cfg.region, debug));
  pipeline.add_stage(std::make_unique<NormalizeStage>(cfg.normalize, debug));
  if (cfg.separate.mode != SeparateMode::Hough) {
    pipeline.add_stage(std::make_unique<BinarizeStage>(cfg.binarize, debug));
  }
  pipeline.add_stage(std::make_unique<SeparateStage>(cfg.separate, debug));
  pipeline.add_stage(std::make_unique<CountStage>(cfg.filter, cfg.report));
  return pipeline;
}

}  // namespace pillsight::app
