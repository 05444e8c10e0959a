#include <veritas/vision/face_frame.hpp>
#include <cstddef>

namespace veritas::vision {

std::size_t FaceFrame::min_bytes(std::uint32_t width,
                                 std::uint32_t height,
                                 PixelFormat format) noexcept {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  switch (format) {
    case PixelFormat::Grayscale8:
      return pixels;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return pixels * 3;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

}  // namespace veritas::vision
