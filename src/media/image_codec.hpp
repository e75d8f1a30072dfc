#pragma once

#include "camera/frame.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace camctl::media {

// Still-image output used by the preview encoder, the timelapse sampler and
// photo capture.
class IImageEncoder {
public:
  virtual ~IImageEncoder() = default;

  // Produces a complete JPEG. `quality` is 0-100.
  virtual bool EncodeJpeg(const camera::Frame& frame, int quality, std::vector<std::uint8_t>& jpeg,
                          std::string& error) = 0;

  // Writes one image file; the container follows the path extension.
  virtual bool WriteImage(const camera::Frame& frame, const std::string& path,
                          std::string& error) = 0;
};

// Continuous container output for the video recorder. Not thread-safe; owned
// by one recording loop.
class IVideoWriter {
public:
  virtual ~IVideoWriter() = default;

  // Fails with `WRITER_OPEN_FAILED` text when the container cannot be created.
  virtual bool Open(const std::string& path, std::string_view fourcc, double fps,
                    std::uint32_t width, std::uint32_t height, std::string& error) = 0;
  virtual bool Write(const camera::Frame& frame, std::string& error) = 0;
  virtual bool Close(std::string& error) = 0;
  virtual bool IsOpen() const = 0;
};

using VideoWriterFactory = std::function<std::unique_ptr<IVideoWriter>()>;

} // namespace camctl::media
