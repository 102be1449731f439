#include "frame_cv_utils.hpp"
#include <pillsight/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace pillsight::vision::detail {

namespace pc = pillsight::core;

std::optional<cv::Mat> frame_to_mat(const pc::Frame& frame) {
  if (!frame.is_consistent()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  void* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case pc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data);
    case pc::PixelFormat::RGB8:
    case pc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data);
    case pc::PixelFormat::Float32Gray:
      return cv::Mat(h, w, CV_32FC1, data);
    case pc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

pc::Frame mat_to_frame(const cv::Mat& mat, pc::PixelFormat format) {
  if (mat.empty()) return pc::Frame();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return pc::Frame(w, h, format, std::move(buffer));
}

std::optional<cv::Mat> to_bgr_mat(const pc::Frame& frame) {
  auto mat = frame_to_mat(frame);
  if (!mat) return std::nullopt;

  cv::Mat out;
  try {
    switch (frame.format()) {
      case pc::PixelFormat::BGR8:
        out = mat->clone();
        break;
      case pc::PixelFormat::RGB8:
        cv::cvtColor(*mat, out, cv::COLOR_RGB2BGR);
        break;
      case pc::PixelFormat::Grayscale8:
        cv::cvtColor(*mat, out, cv::COLOR_GRAY2BGR);
        break;
      default:
        return std::nullopt;
    }
  } catch (const cv::Exception&) {
    return std::nullopt;
  }
  return out;
}

}  // namespace pillsight::vision::detail
