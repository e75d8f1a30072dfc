#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "backends/sim/sim_device_backend.hpp"
#include "camera/device_session.hpp"
#include "camera/preview_encoder.hpp"
#include "camera/timelapse_sampler.hpp"
#include "camera/video_recorder.hpp"
#include "core/logging/logger.hpp"
#include "media/testing/fake_media.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Preview, timelapse and recording share one producer. A recorder whose
// writer is far slower than the capture rate must not slow the preview, and
// control writes must not queue behind reads.
int main() {
  using camctl::backends::sim::SimDeviceBackend;
  using camctl::camera::DeviceSession;
  using camctl::camera::DeviceSessionOptions;
  using camctl::camera::EncodedFramePtr;
  using camctl::camera::PreviewEncoder;
  using camctl::camera::TimelapseSampler;
  using camctl::camera::VideoRecorder;
  using camctl::core::logging::Logger;
  using camctl::core::logging::LogLevel;
  using camctl::media::testing::FakeImageEncoder;
  using camctl::media::testing::FakeVideoWriterLog;
  using camctl::media::testing::MakeFakeVideoWriterFactory;
  using camctl::tests::common::Fail;
  using camctl::tests::common::ScopedTempDir;
  using camctl::tests::common::WaitUntil;

  Logger logger(LogLevel::kError);
  const ScopedTempDir temp("camctl-concurrency");

  SimDeviceBackend backend;
  DeviceSessionOptions options;
  options.capture_fps = 60.0;
  options.consumer_queue_capacity = 4U;
  DeviceSession session(backend, logger, options);
  std::string error;
  if (!session.Open("/dev/video0", error)) {
    Fail("open failed: " + error);
  }

  FakeImageEncoder preview_codec;
  FakeImageEncoder still_codec;
  auto video_log = std::make_shared<FakeVideoWriterLog>();
  video_log->write_delay = std::chrono::milliseconds(150);

  PreviewEncoder preview(session.Hub(), preview_codec, logger);
  TimelapseSampler timelapse(session, still_codec, logger, (temp.path() / "stills").string());
  VideoRecorder recorder(session, MakeFakeVideoWriterFactory(video_log), logger,
                         (temp.path() / "videos").string());

  if (!preview.Start(error)) {
    Fail("preview start failed: " + error);
  }
  if (!timelapse.Start(0.2, error)) {
    Fail("timelapse start failed: " + error);
  }
  if (!recorder.Start(std::nullopt, VideoRecorder::kDefaultFps, error)) {
    Fail("recording start failed: " + error);
  }
  if (session.Hub().SubscriberCount() != 3U) {
    Fail("expected three consumers attached");
  }

  // Let the recorder backlog saturate.
  if (!WaitUntil([&] { return session.Hub().PublishedCount() >= 60U; },
                 std::chrono::seconds(5))) {
    Fail("producer did not keep its rate with a slow recorder");
  }

  const std::uint64_t encoded_before = preview.EncodedCount();
  EncodedFramePtr latest = preview.CurrentFrame();
  if (!latest) {
    Fail("preview produced nothing while the recorder stalled");
  }
  if (!WaitUntil([&] { return preview.EncodedCount() >= encoded_before + 10U; },
                 std::chrono::seconds(3))) {
    Fail("preview must keep encoding at the capture rate");
  }
  const EncodedFramePtr fresher = preview.CurrentFrame();
  if (!fresher || fresher->sequence <= latest->sequence) {
    Fail("preview image must advance");
  }

  // Control writes complete promptly while the producer reads continuously.
  const auto write_start = std::chrono::steady_clock::now();
  for (int i = 0; i < 20; ++i) {
    if (!session.SetControlValue("brightness", i, error)) {
      Fail("control write failed under load: " + error);
    }
  }
  const auto write_elapsed = std::chrono::steady_clock::now() - write_start;
  if (write_elapsed > std::chrono::seconds(2)) {
    Fail("control writes starved by the read loop");
  }

  if (!WaitUntil([&] { return timelapse.CapturedCount() >= 2U; }, std::chrono::seconds(3))) {
    Fail("timelapse starved by the slow recorder");
  }

  const std::string video = recorder.Stop();
  timelapse.Stop();
  preview.Stop();
  if (video.empty()) {
    Fail("recorder stop must return its path");
  }
  {
    std::lock_guard<std::mutex> lock(video_log->mu);
    if (video_log->frames == 0U) {
      Fail("slow recorder must still write frames");
    }
  }
  if (session.Hub().SubscriberCount() != 0U) {
    Fail("every consumer must detach on stop");
  }
  session.Close();
  return 0;
}
