#pragma once

#include <pillsight/core/count_result.hpp>
#include <pillsight/core/error.hpp>
#include <pillsight/core/frame.hpp>
#include <pillsight/core/pipeline.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pillsight::app {

/// Callback for each CountResult; may be invoked from worker threads.
/// Must be thread-safe if using run_pipeline_batch_parallel.
using CountResultCallback =
    std::function<void(const pillsight::core::CountResult&)>;

/// Callback for a photograph whose run failed: (index into frames, error).
using CountErrorCallback =
    std::function<void(std::size_t index, pillsight::core::PipelineError)>;

/// Optional per-stage timing: (stage_index, duration_ms). Pass to run_pipeline to get timings.
using StageTimingCallback = pillsight::core::StageTimingCallback;

/// Runs pipeline on a single frame. No threading; direct call.
/// If timing_cb is non-null, it is invoked for each stage with (stage_index, duration_ms).
/// If image_id is provided, it is set on the returned CountResult for traceability.
[[nodiscard]] std::expected<pillsight::core::CountResult,
                            pillsight::core::PipelineError>
run_pipeline(pillsight::core::Pipeline& pipeline,
             const pillsight::core::Frame& frame,
             StageTimingCallback* timing_cb = nullptr,
             std::optional<std::string> image_id = std::nullopt);

/// Decodes a compressed photograph and runs the pipeline on it.
/// Undecodable bytes yield PipelineError::DecodeFailed and no result.
[[nodiscard]] std::expected<pillsight::core::CountResult,
                            pillsight::core::PipelineError>
count_encoded_image(pillsight::core::Pipeline& pipeline,
                    std::span<const std::uint8_t> bytes,
                    StageTimingCallback* timing_cb = nullptr,
                    std::optional<std::string> image_id = std::nullopt);

/// Runs pipeline on multiple frames sequentially; calls callback for each result.
/// If image_ids is provided (same size as frames), each result is tagged with the corresponding id
/// before callback; empty string = leave unset. Failed runs go to on_error when given.
void run_pipeline_batch(pillsight::core::Pipeline& pipeline,
                        const std::vector<pillsight::core::Frame>& frames,
                        CountResultCallback callback,
                        const std::vector<std::string>* image_ids = nullptr,
                        CountErrorCallback on_error = nullptr);

/// Runs pipeline on multiple frames in parallel using a thread pool.
/// Pipeline::run() is called from worker threads; callbacks may be invoked
/// from any worker (must be thread-safe). num_workers 0 = use hardware concurrency.
void run_pipeline_batch_parallel(
    pillsight::core::Pipeline& pipeline,
    const std::vector<pillsight::core::Frame>& frames,
    CountResultCallback callback,
    std::size_t num_workers = 0,
    const std::vector<std::string>* image_ids = nullptr,
    CountErrorCallback on_error = nullptr);

}  // namespace pillsight::app
