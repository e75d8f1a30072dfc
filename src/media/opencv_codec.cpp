#include "media/opencv_codec.hpp"

#include "core/errors/camera_errors.hpp"
#include "core/fs_utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

#if CAMCTL_ENABLE_OPENCV
#include <opencv2/core.hpp>
#include <opencv2/core/version.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#endif

namespace camctl::media {

namespace {

using core::errors::CameraErrorCode;
using core::errors::FormatCameraError;

constexpr const char* kNotCompiled = "OpenCV codec support is not compiled in this build";

bool IsJpegPath(const std::string& path) {
  std::string extension = std::filesystem::path(path).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension == ".jpg" || extension == ".jpeg";
}

bool WriteBytes(const std::string& path, const std::vector<std::uint8_t>& bytes,
                std::string& error) {
  if (!core::EnsureParentDirectory(path, error)) {
    return false;
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    error = "failed to open image file for writing: " + path;
    return false;
  }
  out.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    error = "failed to write image file: " + path;
    return false;
  }
  return true;
}

#if CAMCTL_ENABLE_OPENCV
// Decodes or converts any supported pixel layout to 8-bit BGR.
bool ToBgr(const camera::Frame& frame, cv::Mat& bgr, std::string& error) {
  if (frame.data.empty()) {
    error = "frame has no payload";
    return false;
  }

  if (frame.pixel_format == "MJPG" || frame.pixel_format == "JPEG") {
    const cv::Mat encoded(1, static_cast<int>(frame.data.size()), CV_8UC1,
                          const_cast<std::uint8_t*>(frame.data.data()));
    bgr = cv::imdecode(encoded, cv::IMREAD_COLOR);
    if (bgr.empty()) {
      error = "failed to decode MJPG frame";
      return false;
    }
    return true;
  }

  const int width = static_cast<int>(frame.width);
  const int height = static_cast<int>(frame.height);
  const std::size_t pixels = static_cast<std::size_t>(frame.width) * frame.height;
  auto* data = const_cast<std::uint8_t*>(frame.data.data());

  if (frame.pixel_format == "YUYV") {
    if (frame.data.size() < pixels * 2U) {
      error = "YUYV payload shorter than " + std::to_string(pixels * 2U) + " bytes";
      return false;
    }
    cv::cvtColor(cv::Mat(height, width, CV_8UC2, data), bgr, cv::COLOR_YUV2BGR_YUYV);
    return true;
  }
  if (frame.pixel_format == "BGR3") {
    if (frame.data.size() < pixels * 3U) {
      error = "BGR3 payload shorter than " + std::to_string(pixels * 3U) + " bytes";
      return false;
    }
    bgr = cv::Mat(height, width, CV_8UC3, data).clone();
    return true;
  }
  if (frame.pixel_format == "GREY") {
    if (frame.data.size() < pixels) {
      error = "GREY payload shorter than " + std::to_string(pixels) + " bytes";
      return false;
    }
    cv::cvtColor(cv::Mat(height, width, CV_8UC1, data), bgr, cv::COLOR_GRAY2BGR);
    return true;
  }

  error = "unsupported pixel format '" + frame.pixel_format + "'";
  return false;
}
#endif

} // namespace

bool IsOpenCvCodecEnabled() {
#if CAMCTL_ENABLE_OPENCV
  return true;
#else
  return false;
#endif
}

std::string OpenCvCodecDetail() {
#if CAMCTL_ENABLE_OPENCV
  return std::string("OpenCV codecs compiled (OpenCV ") + CV_VERSION + ")";
#else
  return "OpenCV codecs not compiled";
#endif
}

bool OpenCvImageEncoder::EncodeJpeg(const camera::Frame& frame, const int quality,
                                    std::vector<std::uint8_t>& jpeg, std::string& error) {
  error.clear();
  if (frame.pixel_format == "MJPG" || frame.pixel_format == "JPEG") {
    jpeg = frame.data;
    return !jpeg.empty();
  }

#if CAMCTL_ENABLE_OPENCV
  cv::Mat bgr;
  if (!ToBgr(frame, bgr, error)) {
    return false;
  }
  const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 0, 100)};
  if (!cv::imencode(".jpg", bgr, jpeg, params)) {
    error = "cv::imencode failed";
    return false;
  }
  return true;
#else
  (void)quality;
  jpeg.clear();
  error = FormatCameraError(CameraErrorCode::kCodecNotAvailable, kNotCompiled);
  return false;
#endif
}

bool OpenCvImageEncoder::WriteImage(const camera::Frame& frame, const std::string& path,
                                    std::string& error) {
  error.clear();
  if ((frame.pixel_format == "MJPG" || frame.pixel_format == "JPEG") && IsJpegPath(path)) {
    return WriteBytes(path, frame.data, error);
  }

#if CAMCTL_ENABLE_OPENCV
  cv::Mat bgr;
  if (!ToBgr(frame, bgr, error)) {
    return false;
  }
  if (!core::EnsureParentDirectory(path, error)) {
    return false;
  }
  if (!cv::imwrite(path, bgr)) {
    error = "cv::imwrite failed for " + path;
    return false;
  }
  return true;
#else
  (void)path;
  error = FormatCameraError(CameraErrorCode::kCodecNotAvailable, kNotCompiled);
  return false;
#endif
}

struct OpenCvVideoWriter::Impl {
  std::uint32_t width = 0U;
  std::uint32_t height = 0U;
  bool open = false;
#if CAMCTL_ENABLE_OPENCV
  cv::VideoWriter writer;
#endif
};

OpenCvVideoWriter::OpenCvVideoWriter() : impl_(std::make_unique<Impl>()) {}

OpenCvVideoWriter::~OpenCvVideoWriter() {
  std::string ignored_error;
  (void)Close(ignored_error);
}

bool OpenCvVideoWriter::Open(const std::string& path, std::string_view fourcc, const double fps,
                             const std::uint32_t width, const std::uint32_t height,
                             std::string& error) {
  error.clear();
  if (impl_->open) {
    error = FormatCameraError(CameraErrorCode::kWriterOpenFailed, "writer is already open");
    return false;
  }
  if (fourcc.size() != 4U || width == 0U || height == 0U || fps <= 0.0) {
    error = FormatCameraError(CameraErrorCode::kWriterOpenFailed,
                              "invalid writer parameters for " + path);
    return false;
  }

#if CAMCTL_ENABLE_OPENCV
  std::string dir_error;
  if (!core::EnsureParentDirectory(path, dir_error)) {
    error = FormatCameraError(CameraErrorCode::kWriterOpenFailed, dir_error);
    return false;
  }
  const int code = cv::VideoWriter::fourcc(fourcc[0], fourcc[1], fourcc[2], fourcc[3]);
  if (!impl_->writer.open(path, code, fps,
                          cv::Size(static_cast<int>(width), static_cast<int>(height))) ||
      !impl_->writer.isOpened()) {
    error = FormatCameraError(CameraErrorCode::kWriterOpenFailed,
                              "cv::VideoWriter could not open " + path);
    return false;
  }
  impl_->width = width;
  impl_->height = height;
  impl_->open = true;
  return true;
#else
  error = FormatCameraError(CameraErrorCode::kWriterOpenFailed,
                            std::string(kNotCompiled) + " (" + path + ")");
  return false;
#endif
}

bool OpenCvVideoWriter::Write(const camera::Frame& frame, std::string& error) {
  error.clear();
  if (!impl_->open) {
    error = "writer is not open";
    return false;
  }

#if CAMCTL_ENABLE_OPENCV
  cv::Mat bgr;
  if (!ToBgr(frame, bgr, error)) {
    return false;
  }
  if (static_cast<std::uint32_t>(bgr.cols) != impl_->width ||
      static_cast<std::uint32_t>(bgr.rows) != impl_->height) {
    error = "frame size " + std::to_string(bgr.cols) + "x" + std::to_string(bgr.rows) +
            " does not match writer size " + std::to_string(impl_->width) + "x" +
            std::to_string(impl_->height);
    return false;
  }
  impl_->writer.write(bgr);
  return true;
#else
  (void)frame;
  error = FormatCameraError(CameraErrorCode::kCodecNotAvailable, kNotCompiled);
  return false;
#endif
}

bool OpenCvVideoWriter::Close(std::string& error) {
  error.clear();
  if (!impl_->open) {
    return true;
  }
#if CAMCTL_ENABLE_OPENCV
  impl_->writer.release();
#endif
  impl_->open = false;
  return true;
}

bool OpenCvVideoWriter::IsOpen() const {
  return impl_->open;
}

VideoWriterFactory MakeOpenCvVideoWriterFactory() {
  return []() -> std::unique_ptr<IVideoWriter> { return std::make_unique<OpenCvVideoWriter>(); };
}

} // namespace camctl::media
