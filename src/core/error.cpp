#include <pillsight/core/error.hpp>

namespace pillsight::core {

std::string_view to_string(PipelineError error) noexcept {
  switch (error) {
    case PipelineError::None:
      return "None";
    case PipelineError::InvalidFrame:
      return "InvalidFrame";
    case PipelineError::DecodeFailed:
      return "DecodeFailed";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
    case PipelineError::StageFailed:
      return "StageFailed";
  }
  return "Unknown";
}

std::string_view to_string(PipelineWarning warning) noexcept {
  switch (warning) {
    case PipelineWarning::NoDetections:
      return "NoDetections";
  }
  return "Unknown";
}

}  // namespace pillsight::core
