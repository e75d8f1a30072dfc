#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "backends/sim/sim_device_backend.hpp"
#include "camera/device_session.hpp"
#include "camera/video_recorder.hpp"
#include "core/logging/logger.hpp"
#include "media/testing/fake_media.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

int main() {
  using camctl::backends::sim::SimDeviceBackend;
  using camctl::camera::CaptureFormat;
  using camctl::camera::DeviceSession;
  using camctl::camera::DeviceSessionOptions;
  using camctl::camera::VideoRecorder;
  using camctl::core::errors::CameraErrorCode;
  using camctl::core::logging::Logger;
  using camctl::core::logging::LogLevel;
  using camctl::media::testing::FakeVideoWriterLog;
  using camctl::media::testing::MakeFakeVideoWriterFactory;
  using camctl::tests::common::AssertContains;
  using camctl::tests::common::AssertErrorCode;
  using camctl::tests::common::Fail;
  using camctl::tests::common::ScopedTempDir;
  using camctl::tests::common::WaitUntil;

  Logger logger(LogLevel::kError);
  const ScopedTempDir temp("camctl-recorder");
  const std::filesystem::path videos = temp.path() / "videos";

  SimDeviceBackend backend;
  DeviceSessionOptions options;
  options.capture_fps = 30.0;
  DeviceSession session(backend, logger, options);
  std::string error;
  if (!session.Open("/dev/video0", error)) {
    Fail("open failed: " + error);
  }
  const CaptureFormat mjpg{"MJPG", 640U, 480U};
  if (!session.SetResolution(mjpg, error)) {
    Fail("resolution change failed: " + error);
  }

  auto log = std::make_shared<FakeVideoWriterLog>();
  VideoRecorder recorder(session, MakeFakeVideoWriterFactory(log), logger, videos.string());

  if (recorder.Stop() != "") {
    Fail("stop while idle must return an empty path");
  }
  if (recorder.Start(std::nullopt, 0.0, error)) {
    Fail("zero fps must be rejected");
  }
  AssertErrorCode(error, CameraErrorCode::kInvalidArgument);

  // Writer open failure leaves the recorder idle and the resolution unlocked.
  {
    std::lock_guard<std::mutex> lock(log->mu);
    log->fail_open = true;
  }
  if (recorder.Start(std::nullopt, VideoRecorder::kDefaultFps, error)) {
    Fail("expected writer open failure");
  }
  AssertErrorCode(error, CameraErrorCode::kWriterOpenFailed);
  if (recorder.IsRecording() || session.IsRecordingActive()) {
    Fail("failed start must leave the recorder idle");
  }
  {
    std::lock_guard<std::mutex> lock(log->mu);
    log->fail_open = false;
  }

  if (!recorder.Start(std::nullopt, 20.0, error)) {
    Fail("recording start failed: " + error);
  }
  if (!recorder.Start(std::nullopt, 20.0, error)) {
    Fail("second start must be a no-op");
  }
  const std::string path = recorder.CurrentPath();
  AssertContains(path, "record_");
  AssertContains(path, ".avi");
  if (std::filesystem::path(path).parent_path() != videos) {
    Fail("default recording must land in the output directory");
  }
  {
    std::lock_guard<std::mutex> lock(log->mu);
    if (log->opens != 1U || log->last_fourcc != "MJPG" || log->last_width != 640U ||
        log->last_height != 480U || log->last_fps != 20.0) {
      Fail("writer must be opened with MJPG at the session format and requested fps");
    }
  }

  if (session.SetResolution({"YUYV", 320U, 240U}, error)) {
    Fail("resolution change must be locked while recording");
  }
  AssertErrorCode(error, CameraErrorCode::kResolutionLocked);
  // Reinitialize and reset share the resolution lock.
  if (session.Reinitialize(error)) {
    Fail("reinitialize must be locked while recording");
  }
  AssertErrorCode(error, CameraErrorCode::kResolutionLocked);
  if (session.ResetToStoredDefaults(error)) {
    Fail("reset to stored defaults must be locked while recording");
  }
  AssertErrorCode(error, CameraErrorCode::kResolutionLocked);
  if (session.ReinitializeCount() != 0U || session.CurrentFormat() != mjpg) {
    Fail("locked calls must leave the device untouched");
  }

  if (!WaitUntil([&] { return recorder.FramesWritten() >= 5U; }, std::chrono::seconds(3))) {
    Fail("expected frames to be written");
  }
  {
    std::lock_guard<std::mutex> lock(log->mu);
    for (std::size_t i = 1U; i < log->sequences.size(); ++i) {
      if (log->sequences[i] <= log->sequences[i - 1U]) {
        Fail("recorded frames must be in capture order");
      }
    }
  }

  const std::string stopped = recorder.Stop();
  if (stopped != path) {
    Fail("stop must return the recorded path");
  }
  if (recorder.Stop() != "") {
    Fail("second stop must return an empty path");
  }
  {
    std::lock_guard<std::mutex> lock(log->mu);
    if (log->closes != 1U) {
      Fail("writer must be closed exactly once");
    }
  }
  if (session.IsRecordingActive() || session.Hub().SubscriberCount() != 0U) {
    Fail("stop must release the resolution lock and the queue");
  }
  if (!session.SetResolution({"YUYV", 320U, 240U}, error)) {
    Fail("resolution change must succeed after stop: " + error);
  }

  // A writer slower than the capture rate builds a backlog; stop writes all of it.
  {
    std::lock_guard<std::mutex> lock(log->mu);
    log->write_delay = std::chrono::milliseconds(80);
  }
  const std::uint64_t frames_before = [&] {
    std::lock_guard<std::mutex> lock(log->mu);
    return log->frames;
  }();
  if (!recorder.Start((temp.path() / "backlog.avi").string(), 30.0, error)) {
    Fail("recording start failed: " + error);
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(600));
  const std::uint64_t written_at_stop = recorder.FramesWritten();
  if (recorder.Stop().empty()) {
    Fail("backlog recording must return its path");
  }
  if (recorder.FramesReceived() <= written_at_stop) {
    Fail("expected queued frames at stop");
  }
  if (recorder.FramesWritten() + recorder.WriteFailures() != recorder.FramesReceived()) {
    Fail("every frame the recorder queue accepted must be written, got " +
         std::to_string(recorder.FramesWritten()) + " of " +
         std::to_string(recorder.FramesReceived()));
  }
  {
    std::lock_guard<std::mutex> lock(log->mu);
    if (log->frames - frames_before != recorder.FramesWritten()) {
      Fail("writer must see every counted frame");
    }
    log->write_delay = std::chrono::milliseconds(0);
  }

  // Explicit filename and write failures.
  const std::string explicit_path = (temp.path() / "clip.avi").string();
  {
    std::lock_guard<std::mutex> lock(log->mu);
    log->fail_writes = true;
  }
  if (!recorder.Start(explicit_path, VideoRecorder::kDefaultFps, error)) {
    Fail("recording start failed: " + error);
  }
  if (!WaitUntil([&] { return recorder.WriteFailures() >= 2U; }, std::chrono::seconds(3))) {
    Fail("write failures must be counted and skipped");
  }
  if (!recorder.IsRecording()) {
    Fail("write failures must not end the recording");
  }
  if (recorder.Stop() != explicit_path) {
    Fail("stop must return the explicit path");
  }
  return 0;
}
