#pragma once

#include "backends/device_backend.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace camctl::backends::sim {

// One simulated capture node.
struct SimDevice {
  std::string device_path;
  std::string display_name;
  std::vector<camera::CaptureFormat> formats;
  std::vector<camera::RawControlRecord> controls;
};

// Scripted faults consulted on every backend call.
//
// Counters (`fail_next_*`) are consumed one per call; flags stay in effect
// until the plan is replaced.
struct SimFaultPlan {
  bool open_always_fails = false;
  std::uint32_t fail_next_opens = 0U;
  bool report_no_formats = false;
  bool report_no_controls = false;
  bool reads_always_fail = false;
  std::uint32_t fail_next_reads = 0U;
  std::uint32_t fail_next_set_formats = 0U;
  std::set<std::string> rejected_controls;
  // Extra latency added to every successful read.
  std::chrono::milliseconds read_delay{0};
};

struct SimCounters {
  std::uint64_t open_calls = 0U;
  std::uint64_t close_calls = 0U;
  std::uint64_t set_format_calls = 0U;
  std::uint64_t reads_ok = 0U;
  std::uint64_t reads_failed = 0U;
  std::uint64_t apply_calls = 0U;
  std::uint64_t apply_failures = 0U;
  std::uint64_t list_format_calls = 0U;
  std::uint64_t list_control_calls = 0U;
};

// Deterministic, hardware-free backend.
//
// Frames are synthetic (YUYV gradient or a JPEG-framed marker payload for
// MJPG) paced at the negotiated frame rate. Control writes update a simulated
// hardware value table so later `ListControls` calls observe them. All state
// lives behind one mutex; tests may edit the fault plan while a producer
// thread is reading.
class SimDeviceBackend final : public IDeviceBackend {
public:
  SimDeviceBackend();
  explicit SimDeviceBackend(std::vector<SimDevice> devices);

  // UVC-like node: YUYV 320x240/640x480, MJPG 640x480/1280x720, and a control
  // set whose auto-exposure default is the aperture-priority mode.
  static SimDevice DefaultDevice(std::string device_path = "/dev/video0",
                                 std::string display_name = "camctl simulated camera");

  const char* Name() const override;
  bool ListDevices(std::vector<DeviceEntry>& devices, std::string& error) override;
  bool ListFormats(const std::string& device_path, std::vector<camera::CaptureFormat>& formats,
                   std::string& error) override;
  bool ListControls(const std::string& device_path,
                    std::vector<camera::RawControlRecord>& controls, std::string& error) override;
  bool ApplyControl(const std::string& device_path, const std::string& name, std::int64_t value,
                    std::string& error) override;
  std::unique_ptr<IFrameSource> OpenCapture(const std::string& device_path,
                                            std::string& error) override;

  void SetFaultPlan(SimFaultPlan plan);
  SimFaultPlan FaultPlan() const;
  void FailNextReads(std::uint32_t count);
  void SetReadsAlwaysFail(bool enabled);
  void SetOpenAlwaysFails(bool enabled);

  SimCounters Counters() const;
  // Every accepted control write, in order.
  std::vector<std::pair<std::string, std::int64_t>> AppliedWrites() const;
  // Simulated hardware value for one control; nullopt when unknown.
  std::optional<std::int64_t> HardwareValue(const std::string& device_path,
                                            const std::string& name) const;

  struct State;

private:
  std::shared_ptr<State> state_;
};

} // namespace camctl::backends::sim
