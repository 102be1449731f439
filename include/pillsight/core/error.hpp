#pragma once

#include <string_view>

namespace pillsight::core {

/// Pipeline error codes; used with std::expected. Any error aborts the whole invocation.
enum class PipelineError {
  None = 0,
  InvalidFrame,
  DecodeFailed,   // input bytes are not a decodable image
  InvalidConfig,  // option outside its domain; rejected before any stage runs
  StageFailed,    // image-processing call failed inside a stage
};

/// Non-fatal conditions attached to a successful result.
enum class PipelineWarning {
  NoDetections,  // valid outcome (count == 0), not a failure
};

[[nodiscard]] std::string_view to_string(PipelineError error) noexcept;
[[nodiscard]] std::string_view to_string(PipelineWarning warning) noexcept;

}  // namespace pillsight::core
