#include "camera/video_recorder.hpp"

#include "core/errors/camera_errors.hpp"
#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"

#include <cmath>
#include <filesystem>
#include <utility>

namespace camctl::camera {

namespace {

using core::errors::CameraErrorCode;
using core::errors::FormatCameraError;
using core::errors::ParseCameraErrorCode;

constexpr auto kPopTimeout = std::chrono::milliseconds(200);
constexpr auto kWriteFailureBackoff = std::chrono::milliseconds(5);

} // namespace

VideoRecorder::VideoRecorder(DeviceSession& session, media::VideoWriterFactory writer_factory,
                             core::logging::Logger& logger, std::string output_dir)
    : session_(session), writer_factory_(std::move(writer_factory)), logger_(logger),
      output_dir_(std::move(output_dir)) {}

VideoRecorder::~VideoRecorder() {
  (void)Stop();
}

std::string VideoRecorder::DefaultFileStem(const std::chrono::system_clock::time_point now) {
  return "record_" + core::FormatLocalFileStamp(now);
}

bool VideoRecorder::Start(const std::optional<std::string>& filename, const double fps,
                          std::string& error) {
  error.clear();
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  if (recording_.load()) {
    return true;
  }
  if (!(fps > 0.0) || !std::isfinite(fps)) {
    error = FormatCameraError(CameraErrorCode::kInvalidArgument, "fps must be positive");
    return false;
  }
  if (!writer_factory_) {
    error = FormatCameraError(CameraErrorCode::kWriterOpenFailed, "no video writer configured");
    return false;
  }

  std::string path;
  if (filename.has_value() && !filename->empty()) {
    path = filename.value();
  } else {
    if (!core::EnsureDirectory(output_dir_, error)) {
      error = FormatCameraError(CameraErrorCode::kWriterOpenFailed, error);
      return false;
    }
    path = core::UniqueFilePath(output_dir_, DefaultFileStem(std::chrono::system_clock::now()),
                                ".avi")
               .string();
  }

  CaptureFormat format;
  if (!session_.BeginRecording(format, error)) {
    return false;
  }

  std::unique_ptr<media::IVideoWriter> writer = writer_factory_();
  std::string open_error;
  if (!writer || !writer->Open(path, kFourcc, fps, format.width, format.height, open_error)) {
    session_.EndRecording();
    error = ParseCameraErrorCode(open_error) == CameraErrorCode::kWriterOpenFailed
                ? open_error
                : FormatCameraError(CameraErrorCode::kWriterOpenFailed, path + ": " + open_error);
    logger_.Error("recording writer open failed", {{"path", path}, {"error", error}});
    return false;
  }

  queue_ = session_.Hub().Attach(ConsumerKind::kRecorder);
  if (!queue_) {
    std::string close_error;
    (void)writer->Close(close_error);
    session_.EndRecording();
    error = FormatCameraError(CameraErrorCode::kSessionNotOpen, "frame hub is closed");
    return false;
  }

  writer_ = std::move(writer);
  current_path_ = path;
  frames_written_.store(0U);
  write_failures_.store(0U);
  frames_received_.store(0U);
  stop_requested_.store(false);
  recording_.store(true);
  worker_ = std::thread([this, queue = queue_, writer = writer_.get()]() { Loop(queue, writer); });

  logger_.Info("recording started", {{"path", path},
                                     {"fps", std::to_string(fps)},
                                     {"format", ToString(format)}});
  return true;
}

std::string VideoRecorder::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  if (!recording_.load() && !worker_.joinable()) {
    return "";
  }

  // Unsubscribe first so the backlog the worker drains is final.
  (void)session_.Hub().Unsubscribe(queue_);
  stop_requested_.store(true);
  if (worker_.joinable()) {
    worker_.join();
  }
  std::uint64_t dropped = 0U;
  if (queue_) {
    frames_received_.store(queue_->Accepted());
    dropped = queue_->Dropped();
  }
  session_.Hub().Detach(queue_);
  queue_.reset();

  if (writer_) {
    std::string close_error;
    if (!writer_->Close(close_error)) {
      logger_.Warn("recording writer close failed", {{"error", close_error}});
    }
    writer_.reset();
  }
  session_.EndRecording();
  recording_.store(false);

  std::string path;
  path.swap(current_path_);
  logger_.Info("recording stopped", {{"path", path},
                                     {"frames", std::to_string(frames_written_.load())},
                                     {"write_failures", std::to_string(write_failures_.load())},
                                     {"queue_overflow", std::to_string(dropped)}});
  return path;
}

bool VideoRecorder::IsRecording() const {
  return recording_.load();
}

std::string VideoRecorder::CurrentPath() const {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  return current_path_;
}

void VideoRecorder::SetOutputDir(std::string output_dir) {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  output_dir_ = std::move(output_dir);
}

std::string VideoRecorder::OutputDir() const {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  return output_dir_;
}

std::uint64_t VideoRecorder::FramesWritten() const {
  return frames_written_.load();
}

std::uint64_t VideoRecorder::WriteFailures() const {
  return write_failures_.load();
}

std::uint64_t VideoRecorder::FramesReceived() const {
  return frames_received_.load();
}

void VideoRecorder::Loop(DeliveryHandle queue, media::IVideoWriter* writer) {
  const core::logging::ScopedThreadTag tag("recorder");
  FramePtr frame;
  while (!stop_requested_.load()) {
    const PopStatus status = queue->Pop(frame, kPopTimeout);
    if (status == PopStatus::kClosed) {
      return;
    }
    if (status == PopStatus::kFrame) {
      WriteFrame(*writer, *frame);
    }
  }

  std::uint64_t drained = 0U;
  while (queue->Pop(frame, std::chrono::milliseconds(0)) == PopStatus::kFrame) {
    WriteFrame(*writer, *frame);
    ++drained;
  }
  if (drained > 0U) {
    logger_.Debug("recording backlog drained", {{"frames", std::to_string(drained)}});
  }
}

void VideoRecorder::WriteFrame(media::IVideoWriter& writer, const Frame& frame) {
  std::string error;
  if (writer.Write(frame, error)) {
    frames_written_.fetch_add(1U);
    return;
  }
  const std::uint64_t failures = write_failures_.fetch_add(1U) + 1U;
  if (failures == 1U || failures % 100U == 0U) {
    logger_.Warn("recording frame write failed",
                 {{"error", error}, {"failures", std::to_string(failures)}});
  }
  std::this_thread::sleep_for(kWriteFailureBackoff);
}

} // namespace camctl::camera
