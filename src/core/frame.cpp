#include <pillsight/core/frame.hpp>
#include <cstddef>

namespace pillsight::core {

std::size_t Frame::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  switch (format) {
    case PixelFormat::Grayscale8:
      return pixels;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return pixels * 3;
    case PixelFormat::Float32Gray:
      return pixels * sizeof(float);
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

bool Frame::is_consistent() const noexcept {
  if (empty() || width_ == 0 || height_ == 0) return false;
  const std::size_t need = min_bytes(width_, height_, format_);
  return need > 0 && buffer_.size() >= need;
}

}  // namespace pillsight::core
