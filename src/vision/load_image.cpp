#include <pillsight/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <pillsight/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <fstream>
#include <iterator>
#include <vector>

namespace pillsight::vision {

namespace pc = pillsight::core;

std::expected<pc::Frame, pc::PipelineError> decode_frame(
    std::span<const std::uint8_t> bytes) {
  if (bytes.empty()) {
    return std::unexpected(pc::PipelineError::DecodeFailed);
  }

  cv::Mat mat;
  try {
    const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                      const_cast<std::uint8_t*>(bytes.data()));
    mat = cv::imdecode(raw, cv::IMREAD_COLOR);
  } catch (const cv::Exception&) {
    return std::unexpected(pc::PipelineError::DecodeFailed);
  }
  if (mat.empty() || mat.type() != CV_8UC3) {
    return std::unexpected(pc::PipelineError::DecodeFailed);
  }
  return detail::mat_to_frame(mat, pc::PixelFormat::BGR8);
}

std::expected<pc::Frame, pc::PipelineError> load_frame_from_image(
    const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    return std::unexpected(pc::PipelineError::DecodeFailed);
  }
  const std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                                        std::istreambuf_iterator<char>());
  return decode_frame(bytes);
}

}  // namespace pillsight::vision
