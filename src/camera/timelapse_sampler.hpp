#pragma once

#include "camera/control_descriptor.hpp"
#include "camera/device_session.hpp"
#include "camera/frame.hpp"
#include "camera/frame_hub.hpp"
#include "core/logging/logger.hpp"
#include "media/image_codec.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace camctl::camera {

// Settings applied for the duration of one timelapse run.
struct TimelapseOverride {
  std::optional<CaptureFormat> format;
  ControlValues controls;
};

// Periodic still capture: idle -> running -> idle.
//
// Start snapshots the session's format and control values, applies the
// optional override, then writes `frame_NNNNN.jpg` once per interval from its
// own hub queue. Deadlines accumulate (`next += interval`) so variable frame
// arrival does not drift the schedule. Stop joins the loop, detaches, and
// restores the snapshot. Image numbers continue across start/stop cycles of
// one sampler.
class TimelapseSampler {
public:
  TimelapseSampler(DeviceSession& session, media::IImageEncoder& encoder,
                   core::logging::Logger& logger, std::string output_dir);
  ~TimelapseSampler();

  TimelapseSampler(const TimelapseSampler&) = delete;
  TimelapseSampler& operator=(const TimelapseSampler&) = delete;

  // No-op returning true when already running. `interval_seconds` must be
  // positive.
  bool Start(double interval_seconds, std::string& error);
  // No-op when idle. Returns after the loop exited and settings are restored.
  void Stop();
  bool IsRunning() const;

  // Both take effect on the next `Start`.
  void SetOutputDir(std::string output_dir);
  void SetOverride(TimelapseOverride override_settings);

  std::string OutputDir() const;
  double IntervalSeconds() const;
  std::uint64_t NextImageIndex() const;
  std::uint64_t CapturedCount() const;
  std::string LastImagePath() const;

  // `frame_00042.jpg`
  static std::string ImageFileName(std::uint64_t index);

private:
  void Loop(DeliveryHandle queue, std::chrono::nanoseconds interval, std::string output_dir);
  void RestoreSnapshot();

  DeviceSession& session_;
  media::IImageEncoder& encoder_;
  core::logging::Logger& logger_;

  // Serializes Start/Stop.
  mutable std::mutex lifecycle_mu_;
  std::string output_dir_;
  TimelapseOverride override_;
  double interval_seconds_ = 0.0;
  CaptureFormat snapshot_format_;
  ControlValues snapshot_controls_;
  DeliveryHandle queue_;
  std::thread worker_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<std::uint64_t> next_index_{0U};
  std::atomic<std::uint64_t> captured_{0U};

  mutable std::mutex last_path_mu_;
  std::string last_image_path_;
};

} // namespace camctl::camera
