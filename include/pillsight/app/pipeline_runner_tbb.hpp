#pragma once

#include <pillsight/app/pipeline_runner.hpp>
#include <pillsight/core/frame.hpp>
#include <pillsight/core/pipeline.hpp>
#include <string>
#include <utility>
#include <vector>

#ifdef PILLSIGHT_HAS_TBB

namespace pillsight::app {

/// Runs one pipeline on a batch of (image_id, frame) work items in parallel using TBB.
///
/// The pipeline's stages hold only configuration, so a single pipeline may serve every
/// task. On success the result's image_id is set and callback(result) is invoked; on
/// failure on_error(index, error) is invoked when given. Callbacks run on TBB worker
/// threads and must be thread-safe.
void run_pipeline_batch_tbb(
    pillsight::core::Pipeline& pipeline,
    const std::vector<std::pair<std::string, pillsight::core::Frame>>& work_items,
    CountResultCallback callback,
    CountErrorCallback on_error = nullptr);

}  // namespace pillsight::app

#endif  // PILLSIGHT_HAS_TBB
