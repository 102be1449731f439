#pragma once

#include <pillsight/core/error.hpp>
#include <pillsight/core/frame.hpp>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

namespace pillsight::vision {

/// Decode a compressed image (PNG, JPEG, ... whatever the codec build accepts) into a BGR8 Frame.
/// Empty, truncated or unrecognised buffers yield PipelineError::DecodeFailed.
[[nodiscard]] std::expected<pillsight::core::Frame, pillsight::core::PipelineError>
decode_frame(std::span<const std::uint8_t> bytes);

/// Read an image file and decode it. Unreadable files also yield DecodeFailed.
[[nodiscard]] std::expected<pillsight::core::Frame, pillsight::core::PipelineError>
load_frame_from_image(const std::string& path);

}  // namespace pillsight::vision
