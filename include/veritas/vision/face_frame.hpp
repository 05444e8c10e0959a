#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace veritas::vision {

/// Memory: FaceFrame owns a single contiguous buffer (std::vector<std::byte>);
/// move semantics and RAII throughout. Use data() for std::span views (non-owning).
/// Thread-safety: distinct FaceFrame instances are independent; sharing one
/// across threads is safe for reads only.

/// Pixel layout of a face crop.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
};

/// Decoded, aligned face crop (or its surrounding context) of one video frame.
/// Decoding and face alignment happen upstream.
class FaceFrame {
 public:
  FaceFrame() = default;

  FaceFrame(std::uint32_t width,
            std::uint32_t height,
            PixelFormat format,
            std::vector<std::byte> buffer,
            std::uint64_t frame_index = 0,
            double timestamp = 0.0)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)),
        frame_index_(frame_index),
        timestamp_(timestamp) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::uint64_t frame_index() const noexcept { return frame_index_; }
  [[nodiscard]] double timestamp() const noexcept { return timestamp_; }

  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Non-empty, known format and a buffer large enough for the dimensions.
  [[nodiscard]] bool valid() const noexcept {
    return !empty() && width_ > 0 && height_ > 0 &&
           min_bytes(width_, height_, format_) > 0 &&
           size_bytes() >= min_bytes(width_, height_, format_);
  }

  /// Minimum bytes required for given dimensions and format (0 for Unknown).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
  std::uint64_t frame_index_{0};
  double timestamp_{0.0};
};

}  // namespace veritas::vision
