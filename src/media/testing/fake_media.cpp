#include "media/testing/fake_media.hpp"

#include "core/errors/camera_errors.hpp"

#include <fstream>
#include <thread>
#include <utility>

namespace camctl::media::testing {

namespace {

using core::errors::CameraErrorCode;
using core::errors::FormatCameraError;

} // namespace

bool FakeImageEncoder::EncodeJpeg(const camera::Frame& frame, int /*quality*/,
                                  std::vector<std::uint8_t>& jpeg, std::string& error) {
  std::chrono::milliseconds delay{0};
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++encode_calls_;
    delay = delay_;
    if (failing_) {
      error = FormatCameraError(CameraErrorCode::kCodecNotAvailable, "fake encoder failure");
      return false;
    }
  }
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
  jpeg = frame.data;
  return true;
}

bool FakeImageEncoder::WriteImage(const camera::Frame& frame, const std::string& path,
                                  std::string& error) {
  std::chrono::milliseconds delay{0};
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++write_calls_;
    delay = delay_;
    if (failing_) {
      error = FormatCameraError(CameraErrorCode::kCodecNotAvailable, "fake encoder failure");
      return false;
    }
  }
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    error = "failed to open image output: " + path;
    return false;
  }
  out.write(reinterpret_cast<const char*>(frame.data.data()),
            static_cast<std::streamsize>(frame.data.size()));
  if (!out) {
    error = "failed to write image output: " + path;
    return false;
  }

  std::lock_guard<std::mutex> lock(mu_);
  written_paths_.push_back(path);
  written_sequences_.push_back(frame.sequence);
  return true;
}

void FakeImageEncoder::SetDelay(const std::chrono::milliseconds delay) {
  std::lock_guard<std::mutex> lock(mu_);
  delay_ = delay;
}

void FakeImageEncoder::SetFailing(const bool failing) {
  std::lock_guard<std::mutex> lock(mu_);
  failing_ = failing;
}

std::uint64_t FakeImageEncoder::EncodeCalls() const {
  std::lock_guard<std::mutex> lock(mu_);
  return encode_calls_;
}

std::uint64_t FakeImageEncoder::WriteCalls() const {
  std::lock_guard<std::mutex> lock(mu_);
  return write_calls_;
}

std::vector<std::string> FakeImageEncoder::WrittenPaths() const {
  std::lock_guard<std::mutex> lock(mu_);
  return written_paths_;
}

std::vector<std::uint64_t> FakeImageEncoder::WrittenSequences() const {
  std::lock_guard<std::mutex> lock(mu_);
  return written_sequences_;
}

FakeVideoWriter::FakeVideoWriter(std::shared_ptr<FakeVideoWriterLog> log) : log_(std::move(log)) {}

bool FakeVideoWriter::Open(const std::string& path, std::string_view fourcc, const double fps,
                           const std::uint32_t width, const std::uint32_t height,
                           std::string& error) {
  std::lock_guard<std::mutex> lock(log_->mu);
  if (log_->fail_open) {
    error = FormatCameraError(CameraErrorCode::kWriterOpenFailed, path);
    return false;
  }
  ++log_->opens;
  log_->last_path = path;
  log_->last_fourcc = std::string(fourcc);
  log_->last_fps = fps;
  log_->last_width = width;
  log_->last_height = height;
  width_ = width;
  height_ = height;
  open_ = true;
  return true;
}

bool FakeVideoWriter::Write(const camera::Frame& frame, std::string& error) {
  std::chrono::milliseconds delay{0};
  {
    std::lock_guard<std::mutex> lock(log_->mu);
    delay = log_->write_delay;
  }
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }

  std::lock_guard<std::mutex> lock(log_->mu);
  if (!open_) {
    error = "fake writer is not open";
    return false;
  }
  if (log_->fail_writes || frame.width != width_ || frame.height != height_) {
    ++log_->failed_writes;
    error = "fake writer rejected frame";
    return false;
  }
  ++log_->frames;
  log_->sequences.push_back(frame.sequence);
  return true;
}

bool FakeVideoWriter::Close(std::string& /*error*/) {
  std::lock_guard<std::mutex> lock(log_->mu);
  if (open_) {
    ++log_->closes;
    open_ = false;
  }
  return true;
}

bool FakeVideoWriter::IsOpen() const {
  return open_;
}

VideoWriterFactory MakeFakeVideoWriterFactory(std::shared_ptr<FakeVideoWriterLog> log) {
  return [log]() { return std::make_unique<FakeVideoWriter>(log); };
}

} // namespace camctl::media::testing
