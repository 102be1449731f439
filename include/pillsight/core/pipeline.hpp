#pragma once

#include <pillsight/core/count_result.hpp>
#include <pillsight/core/error.hpp>
#include <pillsight/core/frame.hpp>
#include <pillsight/core/pipeline_stage.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace pillsight::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of stages; passes PipelineState through until a stage returns CountResult.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run pipeline on one frame; returns the CountResult or the first error.
  /// The input is copied once; stages never write to it.
  /// If timing_cb is non-null, it is called after each stage with (stage_index, duration_ms).
  /// Thread-safe: safe to call run() from multiple threads concurrently
  /// (stages are not modified during process()).
  [[nodiscard]] std::expected<CountResult, PipelineError> run(
      const Frame& input,
      StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace pillsight::core
