#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace camctl::camera {

// One (pixel format, width, height) triple the device can deliver.
//
// `format` is the printable fourcc, for example `MJPG` or `YUYV`.
struct CaptureFormat {
  std::string format;
  std::uint32_t width = 0U;
  std::uint32_t height = 0U;

  bool operator==(const CaptureFormat& other) const {
    return format == other.format && width == other.width && height == other.height;
  }
  bool operator!=(const CaptureFormat& other) const {
    return !(*this == other);
  }
};

// Human-readable `MJPG 640x480`.
std::string ToString(const CaptureFormat& format);

// Orders by (width, height) ascending, then format tag, so index 0 is the
// lowest resolution.
void SortCaptureFormats(std::vector<CaptureFormat>& formats);

// Immutable frame payload handed from the producer loop to consumers.
//
// `data` holds either raw pixels (YUYV, BGR3) or a complete compressed image
// (MJPG) exactly as the device delivered it. Consumers receive shared
// read-only references and never mutate a frame.
struct Frame {
  std::uint64_t sequence = 0U;
  // Format generation of the handle that produced the frame. The session
  // bumps it on every format change and the hub refuses older generations.
  std::uint64_t format_generation = 0U;
  std::chrono::system_clock::time_point timestamp{};
  std::uint32_t width = 0U;
  std::uint32_t height = 0U;
  std::string pixel_format;
  std::vector<std::uint8_t> data;
};

using FramePtr = std::shared_ptr<const Frame>;

} // namespace camctl::camera
