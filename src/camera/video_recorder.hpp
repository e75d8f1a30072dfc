#pragma once

#include "camera/device_session.hpp"
#include "camera/frame_hub.hpp"
#include "core/logging/logger.hpp"
#include "media/image_codec.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace camctl::camera {

// Continuous MJPG/AVI recording: idle -> recording -> idle.
//
// The writer is sized to the session format at `Start`; the session rejects
// resolution changes until `Stop`. Every frame from the recorder's own queue
// is appended, including the backlog still queued when `Stop` is called; a
// failed write is logged, backed off, and skipped.
class VideoRecorder {
public:
  static constexpr double kDefaultFps = 15.0;
  static constexpr const char* kFourcc = "MJPG";

  VideoRecorder(DeviceSession& session, media::VideoWriterFactory writer_factory,
                core::logging::Logger& logger, std::string output_dir);
  ~VideoRecorder();

  VideoRecorder(const VideoRecorder&) = delete;
  VideoRecorder& operator=(const VideoRecorder&) = delete;

  // Without `filename`, records to `<output_dir>/record_YYYYmmdd_HHMMSS.avi`.
  // No-op returning true when already recording. Writer-open failure is
  // reported as `WRITER_OPEN_FAILED` and leaves the recorder idle.
  bool Start(const std::optional<std::string>& filename, double fps, std::string& error);

  // Returns the closed file path, or empty when nothing was recording.
  std::string Stop();

  bool IsRecording() const;
  std::string CurrentPath() const;
  void SetOutputDir(std::string output_dir);
  std::string OutputDir() const;

  std::uint64_t FramesWritten() const;
  std::uint64_t WriteFailures() const;
  // Frames the recorder queue accepted during the last completed recording.
  // Equals `FramesWritten() + WriteFailures()` after a `Stop` on a session
  // that stayed open.
  std::uint64_t FramesReceived() const;

  // `record_<YYYYmmdd_HHMMSS>`; the extension and any collision suffix are
  // added when the path is chosen.
  static std::string DefaultFileStem(std::chrono::system_clock::time_point now);

private:
  void Loop(DeliveryHandle queue, media::IVideoWriter* writer);
  void WriteFrame(media::IVideoWriter& writer, const Frame& frame);

  DeviceSession& session_;
  media::VideoWriterFactory writer_factory_;
  core::logging::Logger& logger_;

  mutable std::mutex lifecycle_mu_;
  std::string output_dir_;
  std::string current_path_;
  std::unique_ptr<media::IVideoWriter> writer_;
  DeliveryHandle queue_;
  std::thread worker_;

  std::atomic<bool> recording_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<std::uint64_t> frames_written_{0U};
  std::atomic<std::uint64_t> write_failures_{0U};
  std::atomic<std::uint64_t> frames_received_{0U};
};

} // namespace camctl::camera
