#include <pillsight/core/pipeline.hpp>
#include <chrono>

namespace pillsight::core {

void PipelineState::add_metadata(std::string_view key, std::string_view value) {
  if (!metadata.empty()) metadata += ' ';
  metadata.append(key);
  metadata += '=';
  metadata.append(value);
}

void Pipeline::add_stage(std::unique_ptr<IPipelineStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<CountResult, PipelineError> Pipeline::run(
    const Frame& input,
    StageTimingCallback* timing_cb) {
  if (!input.is_consistent()) {
    return std::unexpected(PipelineError::InvalidFrame);
  }

  PipelineState initial;
  initial.original = std::make_shared<const Frame>(input);
  StageOutput current = std::move(initial);

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const PipelineState* state_ptr = std::get_if<PipelineState>(&current);
    if (!state_ptr) {
      return std::get<CountResult>(current);
    }

    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(*state_ptr);
    if (timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-3 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::microseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, ms);
    }

    if (!result) {
      return std::unexpected(result.error());
    }

    current = std::move(*result);
  }

  if (auto* result = std::get_if<CountResult>(&current)) {
    return std::move(*result);
  }
  return std::unexpected(PipelineError::InvalidConfig);
}

}  // namespace pillsight::core
