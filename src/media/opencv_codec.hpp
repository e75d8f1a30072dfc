#pragma once

#include "media/image_codec.hpp"

#include <memory>
#include <string>

namespace camctl::media {

// Reports whether the OpenCV codec path was compiled into the current binary.
bool IsOpenCvCodecEnabled();

// Human-readable status detail for `status` output.
std::string OpenCvCodecDetail();

// JPEG/still output through OpenCV.
//
// MJPG frames already hold a complete JPEG and are passed through untouched
// (also without OpenCV). YUYV, BGR3 and GREY frames are converted to BGR
// first; without OpenCV those fail with `CODEC_NOT_AVAILABLE`.
class OpenCvImageEncoder final : public IImageEncoder {
public:
  bool EncodeJpeg(const camera::Frame& frame, int quality, std::vector<std::uint8_t>& jpeg,
                  std::string& error) override;
  bool WriteImage(const camera::Frame& frame, const std::string& path,
                  std::string& error) override;
};

// `cv::VideoWriter` wrapper; every frame is converted to BGR at the size
// fixed by `Open`.
class OpenCvVideoWriter final : public IVideoWriter {
public:
  OpenCvVideoWriter();
  ~OpenCvVideoWriter() override;

  OpenCvVideoWriter(const OpenCvVideoWriter&) = delete;
  OpenCvVideoWriter& operator=(const OpenCvVideoWriter&) = delete;

  bool Open(const std::string& path, std::string_view fourcc, double fps, std::uint32_t width,
            std::uint32_t height, std::string& error) override;
  bool Write(const camera::Frame& frame, std::string& error) override;
  bool Close(std::string& error) override;
  bool IsOpen() const override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

VideoWriterFactory MakeOpenCvVideoWriterFactory();

} // namespace camctl::media
