#pragma once

#include "backends/device_backend.hpp"
#include "camera/control_registry.hpp"
#include "camera/frame.hpp"
#include "camera/frame_hub.hpp"
#include "core/logging/logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace camctl::camera {

enum class SessionState {
  kClosed = 0,
  kStreaming,
  // Reinitialization failed; the producer has stopped and the handle is gone.
  kFaulted,
};

const char* ToString(SessionState state);

struct DeviceSessionOptions {
  // Reinitialize once consecutive read failures exceed this count.
  std::uint32_t read_failure_threshold = 10U;
  double capture_fps = 15.0;
  std::size_t consumer_queue_capacity = FrameHub::kDefaultQueueCapacity;
  // Pause between releasing and reopening the handle during reinitialize.
  std::chrono::milliseconds reopen_delay{300};
  // Upper bound on one blocking read, and so on device-lock hold time.
  std::chrono::milliseconds read_timeout{200};
};

struct ReadFrameResult {
  FramePtr frame;
  bool ok = false;
  std::string error;
};

// Exclusive owner of one open capture device.
//
// Every handle operation (open, read, format change, control write, close)
// runs under `device_mutex_`. Administrative calls announce themselves through
// `admin_waiters_`; the producer yields the lock to them before its next read,
// so a steady stream of reads never starves a control write.
//
// Lifecycle:
// - `Open` runs the full init sequence and starts the hub production loop
// - the loop tolerates read failures and reinitializes past the threshold
// - a failed reinitialize moves the session to `kFaulted` and halts streaming
// - `Close` closes consumer queues, stops the producer, then releases the
//   handle; it is idempotent and also run by the destructor
class DeviceSession {
public:
  DeviceSession(backends::IDeviceBackend& backend, core::logging::Logger& logger,
                DeviceSessionOptions options = {});
  ~DeviceSession();

  DeviceSession(const DeviceSession&) = delete;
  DeviceSession& operator=(const DeviceSession&) = delete;

  // Fails with `DEVICE_UNAVAILABLE`, `NO_SUPPORTED_FORMATS` or
  // `NO_CONTROLS_FOUND`; the session is left closed with no handle.
  bool Open(const std::string& device_path, std::string& error);

  // One blocking read under the device lock, bounded by `read_timeout`.
  // Called by the production loop; never concurrently with itself.
  ReadFrameResult ReadFrame();

  // Must be one of `SupportedFormats()`. Stale frames buffered for consumers
  // are drained before the lock is released. On failure the previous format
  // stays active.
  bool SetResolution(const CaptureFormat& format, std::string& error);

  bool SetControlValue(const std::string& name, std::int64_t value, std::string& error);

  // Reopens the handle, re-queries formats and controls, reapplies calculated
  // defaults and restores the active format when still supported. Refused
  // with `RESOLUTION_LOCKED` while a recording is active.
  bool Reinitialize(std::string& error);

  // Writes every stored default, then reinitializes. Same recording lock as
  // `Reinitialize`.
  bool ResetToStoredDefaults(std::string& error);

  void Close();

  // Marks a recording as active and returns the format the writer must be
  // sized to. While active, `SetResolution` fails with `RESOLUTION_LOCKED`.
  bool BeginRecording(CaptureFormat& format, std::string& error);
  void EndRecording();
  bool IsRecordingActive() const;

  std::string DevicePath() const;
  CaptureFormat CurrentFormat() const;
  std::vector<CaptureFormat> SupportedFormats() const;
  SessionState State() const;
  bool IsOpen() const;
  // Reason recorded when the session faulted; empty otherwise.
  std::string FaultReason() const;

  ControlMap ListControls() const;
  ControlValues CurrentValues() const;
  ControlValues StoredDefaults() const;
  ControlValues OriginalHardwareDefaults() const;

  std::uint64_t ReinitializeCount() const;
  std::uint32_t ConsecutiveReadFailures() const;
  const DeviceSessionOptions& Options() const;

  FrameHub& Hub();

private:
  class AdminLock;

  // Full init sequence under the device lock. `restore` is the format to
  // reapply when it is still supported.
  bool InitializeDeviceLocked(const std::string& device_path,
                              const std::optional<CaptureFormat>& restore, std::string& error);
  bool ReinitializeLocked(std::string& error);
  void ReleaseHandleLocked();
  bool RestartProductionIfStopped(bool was_faulted, std::string& error);
  FrameHub::ProduceResult ProduceOnce(FramePtr& frame);
  void MarkFaulted(const std::string& reason);

  backends::IDeviceBackend& backend_;
  core::logging::Logger& logger_;
  const DeviceSessionOptions options_;

  std::mutex device_mutex_;
  std::condition_variable admin_idle_cv_;
  std::atomic<std::uint32_t> admin_waiters_{0U};
  std::unique_ptr<backends::IFrameSource> source_;
  std::uint64_t next_sequence_ = 0U;
  // Stamped on every frame; bumped with each format change.
  std::uint64_t format_generation_ = 0U;

  // Copies of the configuration for readers that must not wait on a read.
  // Written with `device_mutex_` held; lock order is device then info.
  mutable std::mutex info_mu_;
  std::string device_path_;
  CaptureFormat current_format_;
  std::vector<CaptureFormat> supported_formats_;
  SessionState state_ = SessionState::kClosed;
  std::string fault_reason_;
  bool recording_active_ = false;

  ControlRegistry registry_;
  std::atomic<std::uint64_t> reinitialize_count_{0U};
  std::atomic<std::uint32_t> consecutive_read_failures_{0U};

  // Declared last so the production loop is torn down before the members it
  // reads.
  FrameHub hub_;
};

} // namespace camctl::camera
