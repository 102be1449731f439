#pragma once

#include <pillsight/app/config.hpp>
#include <pillsight/core/error.hpp>
#include <pillsight/core/pipeline.hpp>
#include <expected>

namespace pillsight::app {

/// Validates cfg and assembles Region -> Normalize -> Binarize -> Separate -> Count.
/// The Binarize stage is left out on the Hough path. An invalid cfg yields
/// PipelineError::InvalidConfig and no pipeline, so nothing is processed.
[[nodiscard]] std::expected<pillsight::core::Pipeline, pillsight::core::PipelineError>
build_pipeline(const PipelineConfig& cfg);

}  // namespace pillsight::app
