#include "../common/assertions.hpp"
#include "backends/sim/sim_device_backend.hpp"
#include "camera/device_session.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <thread>

namespace {

using camctl::camera::DeviceSessionOptions;

DeviceSessionOptions FastOptions() {
  DeviceSessionOptions options;
  options.reopen_delay = std::chrono::milliseconds(10);
  options.capture_fps = 60.0;
  return options;
}

} // namespace

int main() {
  using camctl::backends::sim::SimDeviceBackend;
  using camctl::backends::sim::SimFaultPlan;
  using camctl::camera::CaptureFormat;
  using camctl::camera::ConsumerKind;
  using camctl::camera::DeviceSession;
  using camctl::camera::FramePtr;
  using camctl::camera::PopStatus;
  using camctl::camera::SessionState;
  using camctl::core::errors::CameraErrorCode;
  using camctl::core::logging::Logger;
  using camctl::core::logging::LogLevel;
  using camctl::tests::common::AssertContains;
  using camctl::tests::common::AssertErrorCode;
  using camctl::tests::common::Fail;
  using camctl::tests::common::WaitUntil;

  Logger logger(LogLevel::kError);

  // Open failures leave the session closed without a handle.
  {
    SimDeviceBackend backend;
    DeviceSession session(backend, logger, FastOptions());
    std::string error;
    if (session.Open("/dev/video9", error)) {
      Fail("expected unknown device to fail");
    }
    AssertErrorCode(error, CameraErrorCode::kDeviceUnavailable);
    if (session.State() != SessionState::kClosed || session.IsOpen()) {
      Fail("failed open must leave the session closed");
    }
  }
  {
    SimDeviceBackend backend;
    SimFaultPlan plan;
    plan.report_no_formats = true;
    backend.SetFaultPlan(plan);
    DeviceSession session(backend, logger, FastOptions());
    std::string error;
    if (session.Open("/dev/video0", error)) {
      Fail("expected empty format list to fail");
    }
    AssertErrorCode(error, CameraErrorCode::kNoSupportedFormats);
    if (backend.Counters().open_calls != backend.Counters().close_calls) {
      Fail("handle must be released after a failed open");
    }
  }
  {
    SimDeviceBackend backend;
    SimFaultPlan plan;
    plan.report_no_controls = true;
    backend.SetFaultPlan(plan);
    DeviceSession session(backend, logger, FastOptions());
    std::string error;
    if (session.Open("/dev/video0", error)) {
      Fail("expected empty control list to fail");
    }
    AssertErrorCode(error, CameraErrorCode::kNoControlsFound);
  }

  // Init sequence, administrative calls and close.
  {
    SimDeviceBackend backend;
    DeviceSession session(backend, logger, FastOptions());
    std::string error;
    if (!session.Open("/dev/video0", error)) {
      Fail("open failed: " + error);
    }
    if (session.Open("/dev/video0", error)) {
      Fail("a session must refuse a second open");
    }
    AssertErrorCode(error, CameraErrorCode::kInvalidArgument);

    if (session.State() != SessionState::kStreaming) {
      Fail("expected streaming state after open");
    }
    const CaptureFormat lowest{"YUYV", 320U, 240U};
    if (session.CurrentFormat() != lowest) {
      Fail("open must select the lowest supported resolution");
    }
    if (session.SupportedFormats().size() != 4U) {
      Fail("expected four supported formats");
    }

    if (backend.HardwareValue("/dev/video0", "auto_exposure").value_or(-1) != 1 ||
        backend.HardwareValue("/dev/video0", "exposure_time_absolute").value_or(-1) != 2500 ||
        backend.HardwareValue("/dev/video0", "contrast").value_or(-1) != 47) {
      Fail("calculated defaults were not written to the device");
    }
    if (session.CurrentValues().at("auto_exposure") != 1) {
      Fail("registry must reflect the applied exposure mode");
    }
    if (session.OriginalHardwareDefaults().at("auto_exposure") != 3 ||
        session.OriginalHardwareDefaults().at("contrast") != 32) {
      Fail("original hardware defaults must be preserved");
    }

    const auto probe = session.Hub().Attach(ConsumerKind::kProbe);
    FramePtr frame;
    if (probe->Pop(frame, std::chrono::milliseconds(2000)) != PopStatus::kFrame) {
      Fail("expected a frame from the production loop");
    }
    if (frame->width != 320U || frame->pixel_format != "YUYV" || frame->data.empty()) {
      Fail("frame does not match the active format");
    }

    if (session.SetControlValue("brightness", 999, error)) {
      Fail("out-of-range write must be rejected");
    }
    AssertErrorCode(error, CameraErrorCode::kControlOutOfRange);
    if (session.SetControlValue("zoom_absolute", 1, error)) {
      Fail("unknown control write must be rejected");
    }
    AssertErrorCode(error, CameraErrorCode::kControlUnknown);
    if (backend.HardwareValue("/dev/video0", "brightness").value_or(-1) != 0) {
      Fail("rejected writes must not reach the device");
    }
    if (!session.SetControlValue("brightness", -12, error)) {
      Fail("valid control write failed: " + error);
    }
    if (session.CurrentValues().at("brightness") != -12 ||
        backend.HardwareValue("/dev/video0", "brightness").value_or(0) != -12) {
      Fail("accepted write must update registry and device");
    }

    if (session.SetResolution({"MJPG", 800U, 600U}, error)) {
      Fail("unsupported resolution must be rejected");
    }
    AssertErrorCode(error, CameraErrorCode::kResolutionUnsupported);
    if (session.CurrentFormat() != lowest) {
      Fail("rejected resolution must keep the previous format");
    }
    const CaptureFormat mjpg{"MJPG", 640U, 480U};
    if (!session.SetResolution(mjpg, error)) {
      Fail("supported resolution failed: " + error);
    }
    if (session.CurrentFormat() != mjpg) {
      Fail("resolution change not reflected");
    }
    if (probe->Pop(frame, std::chrono::milliseconds(2000)) != PopStatus::kFrame ||
        frame->pixel_format != "MJPG" || frame->width != 640U) {
      Fail("first frame after a resolution change must be in the new format");
    }

    // No frame captured before a switch may surface after it returns.
    const auto watcher = session.Hub().Attach(ConsumerKind::kRecorder);
    for (int round = 0; round < 30; ++round) {
      const CaptureFormat& target = round % 2 == 0 ? lowest : mjpg;
      if (!session.SetResolution(target, error)) {
        Fail("resolution switch failed: " + error);
      }
      for (int i = 0; i < 3; ++i) {
        if (watcher->Pop(frame, std::chrono::milliseconds(2000)) != PopStatus::kFrame) {
          Fail("expected frames after a resolution switch");
        }
        if (frame->pixel_format != target.format || frame->width != target.width ||
            frame->height != target.height) {
          Fail("frame from before a resolution switch delivered after it, round " +
               std::to_string(round));
        }
      }
    }
    session.Hub().Detach(watcher);
    if (session.CurrentFormat() != mjpg) {
      Fail("switch loop must end on the MJPG format");
    }

    CaptureFormat locked;
    if (!session.BeginRecording(locked, error) || locked != mjpg) {
      Fail("begin recording must report the active format");
    }
    if (session.SetResolution(lowest, error)) {
      Fail("resolution change must be refused while recording");
    }
    AssertErrorCode(error, CameraErrorCode::kResolutionLocked);
    session.EndRecording();
    if (session.IsRecordingActive()) {
      Fail("end recording must clear the lock");
    }

    // Explicit reinitialize keeps the active format.
    if (!session.Reinitialize(error)) {
      Fail("reinitialize failed: " + error);
    }
    if (session.CurrentFormat() != mjpg || session.ReinitializeCount() != 1U) {
      Fail("reinitialize must restore the previous format");
    }

    if (!session.ResetToStoredDefaults(error)) {
      Fail("reset to stored defaults failed: " + error);
    }
    if (session.CurrentValues().at("brightness") != 0) {
      Fail("reset must restore the stored brightness default");
    }

    session.Close();
    session.Close();
    if (session.State() != SessionState::kClosed) {
      Fail("close must leave the session closed");
    }
    if (probe->Pop(frame, std::chrono::milliseconds(10)) != PopStatus::kClosed) {
      Fail("close must close consumer queues");
    }
    if (session.SetResolution(lowest, error)) {
      Fail("resolution change after close must fail");
    }
    AssertErrorCode(error, CameraErrorCode::kSessionNotOpen);
    if (backend.Counters().open_calls != backend.Counters().close_calls) {
      Fail("every opened handle must be released");
    }
  }

  // Exactly threshold failures are tolerated.
  {
    SimDeviceBackend backend;
    DeviceSession session(backend, logger, FastOptions());
    std::string error;
    if (!session.Open("/dev/video0", error)) {
      Fail("open failed: " + error);
    }
    const auto probe = session.Hub().Attach(ConsumerKind::kProbe);
    backend.FailNextReads(10U);
    if (!WaitUntil([&] { return backend.FaultPlan().fail_next_reads == 0U; },
                   std::chrono::milliseconds(3000))) {
      Fail("scripted read failures were not consumed");
    }
    FramePtr frame;
    if (probe->Pop(frame, std::chrono::milliseconds(2000)) != PopStatus::kFrame) {
      Fail("expected frames to resume after tolerated failures");
    }
    if (session.ReinitializeCount() != 0U) {
      Fail("ten consecutive failures must not trigger reinitialize");
    }
  }

  // One failure past the threshold reinitializes exactly once.
  {
    SimDeviceBackend backend;
    DeviceSession session(backend, logger, FastOptions());
    std::string error;
    if (!session.Open("/dev/video0", error)) {
      Fail("open failed: " + error);
    }
    const std::uint64_t opens_before = backend.Counters().open_calls;
    backend.FailNextReads(11U);
    if (!WaitUntil([&] { return session.ReinitializeCount() == 1U; },
                   std::chrono::milliseconds(3000))) {
      Fail("expected reinitialize after eleven consecutive failures");
    }
    if (!WaitUntil([&] { return backend.Counters().reads_ok > 0U &&
                                session.ConsecutiveReadFailures() == 0U; },
                   std::chrono::milliseconds(2000))) {
      Fail("failure counter must reset after reinitialize");
    }
    if (session.ReinitializeCount() != 1U || backend.Counters().open_calls != opens_before + 1U) {
      Fail("expected exactly one reopen");
    }
    if (session.State() != SessionState::kStreaming) {
      Fail("session must keep streaming after a successful reinitialize");
    }
  }

  // Failed reinitialize faults the session; manual recovery right after the
  // fault restarts production, over several cycles.
  {
    SimDeviceBackend backend;
    DeviceSession session(backend, logger, FastOptions());
    std::string error;
    if (!session.Open("/dev/video0", error)) {
      Fail("open failed: " + error);
    }
    for (int cycle = 0; cycle < 5; ++cycle) {
      backend.SetOpenAlwaysFails(true);
      backend.SetReadsAlwaysFail(true);
      if (!WaitUntil([&] { return session.State() == SessionState::kFaulted; },
                     std::chrono::milliseconds(3000))) {
        Fail("expected faulted state after reinitialize failure");
      }
      AssertErrorCode(session.FaultReason(), CameraErrorCode::kReinitializationFailed);
      AssertContains(session.FaultReason(), "DEVICE_UNAVAILABLE");
      if (session.IsOpen()) {
        Fail("faulted session must not report open");
      }
      if (session.SetControlValue("brightness", 1, error)) {
        Fail("control writes must fail on a faulted session");
      }
      AssertErrorCode(error, CameraErrorCode::kSessionNotOpen);

      // Manual recovery once the device is back.
      backend.SetOpenAlwaysFails(false);
      backend.SetReadsAlwaysFail(false);
      if (!session.Reinitialize(error)) {
        Fail("manual reinitialize failed: " + error);
      }
      if (session.State() != SessionState::kStreaming || !session.FaultReason().empty()) {
        Fail("manual reinitialize must clear the fault");
      }
      const auto probe = session.Hub().Attach(ConsumerKind::kProbe);
      FramePtr frame;
      if (probe->Pop(frame, std::chrono::milliseconds(2000)) != PopStatus::kFrame) {
        Fail("production must restart after manual recovery, cycle " + std::to_string(cycle));
      }
      if (!session.Hub().IsProducing()) {
        Fail("recovered session must keep a running production loop");
      }
      session.Hub().Detach(probe);
    }
  }

  // An explicit reinitialize that lands while the producer is crossing the
  // failure threshold satisfies it; the producer must not reopen again.
  {
    SimDeviceBackend backend;
    DeviceSessionOptions options = FastOptions();
    options.read_failure_threshold = 2U;
    options.read_timeout = std::chrono::milliseconds(100);
    std::ostringstream sink;
    Logger race_logger(LogLevel::kInfo, sink);
    {
      DeviceSession session(backend, race_logger, options);
      std::string error;
      if (!session.Open("/dev/video0", error)) {
        Fail("open failed: " + error);
      }
      // Every read now holds the device for the full timeout and fails.
      SimFaultPlan slow;
      slow.read_delay = std::chrono::milliseconds(1000);
      backend.SetFaultPlan(slow);
      if (!WaitUntil([&] { return session.ConsecutiveReadFailures() == 2U; },
                     std::chrono::milliseconds(3000))) {
        Fail("expected failures up to the threshold");
      }
      // The threshold-crossing read is now in flight.
      std::this_thread::sleep_for(std::chrono::milliseconds(30));
      if (!session.Reinitialize(error)) {
        Fail("explicit reinitialize failed: " + error);
      }
      backend.SetFaultPlan(SimFaultPlan{});
      if (!WaitUntil([&] { return backend.Counters().reads_ok > 0U &&
                                  session.ConsecutiveReadFailures() == 0U; },
                     std::chrono::milliseconds(2000))) {
        Fail("reads must recover after the explicit reinitialize");
      }
      if (session.State() != SessionState::kStreaming) {
        Fail("session must keep streaming");
      }
      session.Close();
    }
    const std::string log = sink.str();
    const std::size_t explicit_done =
        log.find("thread=\"main\" msg=\"device reinitialized\"");
    if (explicit_done == std::string::npos) {
      Fail("explicit reinitialize was not logged");
    }
    if (log.find("thread=\"producer\" msg=\"reinitializing device\"", explicit_done) !=
        std::string::npos) {
      Fail("producer reinitialized again after the explicit reinitialize");
    }
  }

  return 0;
}
