#include "backends/sim/sim_device_backend.hpp"

#include "core/errors/camera_errors.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <thread>

namespace camctl::backends::sim {

namespace {

using core::errors::CameraErrorCode;
using core::errors::FormatCameraError;

constexpr double kDefaultFps = 30.0;

camera::RawControlRecord MakeControl(std::string name, std::string type_tag, std::int64_t minimum,
                                     std::int64_t maximum, std::int64_t step,
                                     std::int64_t default_value) {
  return camera::RawControlRecord{
      .name = std::move(name),
      .type_tag = std::move(type_tag),
      .minimum = minimum,
      .maximum = maximum,
      .step = step,
      .default_value = default_value,
      .current_value = default_value,
  };
}

std::chrono::nanoseconds FrameInterval(const double fps) {
  const double effective = (fps > 0.0 && std::isfinite(fps)) ? fps : kDefaultFps;
  return std::chrono::nanoseconds(static_cast<std::int64_t>(1'000'000'000.0 / effective));
}

void FillYuyv(camera::Frame& frame, const std::uint64_t tick) {
  const std::size_t row_bytes = static_cast<std::size_t>(frame.width) * 2U;
  frame.data.resize(row_bytes * frame.height);
  for (std::uint32_t y = 0; y < frame.height; ++y) {
    std::uint8_t* row = frame.data.data() + static_cast<std::size_t>(y) * row_bytes;
    for (std::uint32_t x = 0; x < frame.width; ++x) {
      row[x * 2U] = static_cast<std::uint8_t>((x + y + tick) & 0xFFU);
      row[x * 2U + 1U] = 128U;
    }
  }
}

// SOI/APP0 header and EOI trailer around a marker body; enough for pass-through
// consumers that only check JPEG framing.
void FillMjpg(camera::Frame& frame, const std::uint64_t tick) {
  frame.data = {0xFFU, 0xD8U, 0xFFU, 0xE0U, 0x00U, 0x10U, 'S', 'I', 'M', 'F'};
  for (int shift = 56; shift >= 0; shift -= 8) {
    frame.data.push_back(static_cast<std::uint8_t>((tick >> shift) & 0xFFU));
  }
  frame.data.push_back(0xFFU);
  frame.data.push_back(0xD9U);
}

} // namespace

struct SimDeviceBackend::State {
  mutable std::mutex mu;
  std::vector<SimDevice> devices;
  SimFaultPlan plan;
  SimCounters counters;
  std::vector<std::pair<std::string, std::int64_t>> applied_writes;

  SimDevice* FindDevice(const std::string& device_path) {
    for (SimDevice& device : devices) {
      if (device.device_path == device_path) {
        return &device;
      }
    }
    return nullptr;
  }
};

namespace {

class SimFrameSource final : public IFrameSource {
public:
  SimFrameSource(std::shared_ptr<SimDeviceBackend::State> state, std::string device_path)
      : state_(std::move(state)), device_path_(std::move(device_path)) {}

  ~SimFrameSource() override {
    std::string ignored_error;
    (void)Close(ignored_error);
  }

  bool SetFormat(const camera::CaptureFormat& requested, const double fps,
                 camera::CaptureFormat& applied, std::string& error) override {
    error.clear();
    if (!open_) {
      error = "device is not open";
      return false;
    }

    std::lock_guard<std::mutex> lock(state_->mu);
    ++state_->counters.set_format_calls;
    if (state_->plan.fail_next_set_formats > 0U) {
      --state_->plan.fail_next_set_formats;
      error = "simulated S_FMT failure for " + camera::ToString(requested);
      return false;
    }

    const SimDevice* device = state_->FindDevice(device_path_);
    if (device == nullptr ||
        std::find(device->formats.begin(), device->formats.end(), requested) ==
            device->formats.end()) {
      error = "S_FMT rejected " + camera::ToString(requested);
      return false;
    }

    active_format_ = requested;
    interval_ = FrameInterval(fps);
    next_due_ = std::chrono::steady_clock::now();
    applied = active_format_;
    return true;
  }

  bool ReadFrame(camera::Frame& frame, const std::chrono::milliseconds timeout,
                 std::string& error) override {
    error.clear();
    if (!open_ || active_format_.width == 0U) {
      error = "device is not streaming";
      return false;
    }

    std::chrono::milliseconds extra_delay{0};
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      SimFaultPlan& plan = state_->plan;
      if (plan.reads_always_fail || plan.fail_next_reads > 0U) {
        if (plan.fail_next_reads > 0U) {
          --plan.fail_next_reads;
        }
        ++state_->counters.reads_failed;
        error = "simulated read failure";
        return false;
      }
      extra_delay = plan.read_delay;
    }

    const auto now = std::chrono::steady_clock::now();
    const auto wait = (next_due_ > now ? next_due_ - now : std::chrono::nanoseconds::zero()) +
                      std::chrono::duration_cast<std::chrono::nanoseconds>(extra_delay);
    if (wait > timeout) {
      std::this_thread::sleep_for(timeout);
      std::lock_guard<std::mutex> lock(state_->mu);
      ++state_->counters.reads_failed;
      error = "timed out after " + std::to_string(timeout.count()) + "ms waiting for frame";
      return false;
    }
    std::this_thread::sleep_for(wait);
    next_due_ = std::max(next_due_, now) + interval_;

    frame.width = active_format_.width;
    frame.height = active_format_.height;
    frame.pixel_format = active_format_.format;
    if (active_format_.format == "MJPG") {
      FillMjpg(frame, tick_);
    } else {
      FillYuyv(frame, tick_);
    }
    ++tick_;

    std::lock_guard<std::mutex> lock(state_->mu);
    ++state_->counters.reads_ok;
    return true;
  }

  bool Close(std::string& error) override {
    error.clear();
    if (!open_) {
      return true;
    }
    open_ = false;
    std::lock_guard<std::mutex> lock(state_->mu);
    ++state_->counters.close_calls;
    return true;
  }

  bool IsOpen() const override {
    return open_;
  }

private:
  std::shared_ptr<SimDeviceBackend::State> state_;
  std::string device_path_;
  bool open_ = true;
  camera::CaptureFormat active_format_;
  std::chrono::nanoseconds interval_ = FrameInterval(kDefaultFps);
  std::chrono::steady_clock::time_point next_due_{};
  std::uint64_t tick_ = 0U;
};

} // namespace

SimDeviceBackend::SimDeviceBackend() : SimDeviceBackend(std::vector<SimDevice>{DefaultDevice()}) {}

SimDeviceBackend::SimDeviceBackend(std::vector<SimDevice> devices)
    : state_(std::make_shared<State>()) {
  state_->devices = std::move(devices);
}

SimDevice SimDeviceBackend::DefaultDevice(std::string device_path, std::string display_name) {
  SimDevice device;
  device.device_path = std::move(device_path);
  device.display_name = std::move(display_name);
  device.formats = {
      {.format = "YUYV", .width = 320U, .height = 240U},
      {.format = "YUYV", .width = 640U, .height = 480U},
      {.format = "MJPG", .width = 640U, .height = 480U},
      {.format = "MJPG", .width = 1280U, .height = 720U},
  };
  device.controls = {
      MakeControl("brightness", "int", -64, 64, 1, 0),
      MakeControl("contrast", "int", 0, 95, 1, 32),
      MakeControl("gain", "int", 0, 100, 1, 0),
      MakeControl("white_balance_automatic", "bool", 0, 1, 1, 1),
      MakeControl("power_line_frequency", "menu", 0, 2, 1, 1),
      // Hardware default 3 (aperture priority) leaves exposure_time_absolute
      // inert until manual mode (1) is selected.
      MakeControl("auto_exposure", "menu", 0, 3, 1, 3),
      MakeControl("exposure_time_absolute", "int", 1, 5000, 1, 157),
  };
  return device;
}

const char* SimDeviceBackend::Name() const {
  return "sim";
}

bool SimDeviceBackend::ListDevices(std::vector<DeviceEntry>& devices, std::string& error) {
  error.clear();
  devices.clear();
  std::lock_guard<std::mutex> lock(state_->mu);
  for (const SimDevice& device : state_->devices) {
    devices.push_back(DeviceEntry{.display_name = device.display_name,
                                  .device_path = device.device_path});
  }
  return true;
}

bool SimDeviceBackend::ListFormats(const std::string& device_path,
                                   std::vector<camera::CaptureFormat>& formats,
                                   std::string& error) {
  error.clear();
  formats.clear();
  std::lock_guard<std::mutex> lock(state_->mu);
  ++state_->counters.list_format_calls;
  const SimDevice* device = state_->FindDevice(device_path);
  if (device == nullptr) {
    error = FormatCameraError(CameraErrorCode::kDeviceUnavailable, "no such device " + device_path);
    return false;
  }
  if (!state_->plan.report_no_formats) {
    formats = device->formats;
  }
  if (formats.empty()) {
    error = FormatCameraError(CameraErrorCode::kNoSupportedFormats,
                              "no capture formats reported by " + device_path);
    return false;
  }
  camera::SortCaptureFormats(formats);
  return true;
}

bool SimDeviceBackend::ListControls(const std::string& device_path,
                                    std::vector<camera::RawControlRecord>& controls,
                                    std::string& error) {
  error.clear();
  controls.clear();
  std::lock_guard<std::mutex> lock(state_->mu);
  ++state_->counters.list_control_calls;
  const SimDevice* device = state_->FindDevice(device_path);
  if (device == nullptr) {
    error = FormatCameraError(CameraErrorCode::kDeviceUnavailable, "no such device " + device_path);
    return false;
  }
  if (!state_->plan.report_no_controls) {
    controls = device->controls;
  }
  return true;
}

bool SimDeviceBackend::ApplyControl(const std::string& device_path, const std::string& name,
                                    const std::int64_t value, std::string& error) {
  error.clear();
  std::lock_guard<std::mutex> lock(state_->mu);
  ++state_->counters.apply_calls;

  SimDevice* device = state_->FindDevice(device_path);
  if (device == nullptr) {
    ++state_->counters.apply_failures;
    error = FormatCameraError(CameraErrorCode::kDeviceUnavailable, "no such device " + device_path);
    return false;
  }

  if (state_->plan.rejected_controls.count(name) != 0U) {
    ++state_->counters.apply_failures;
    error = FormatCameraError(CameraErrorCode::kControlApplyFailed,
                              "simulated hardware rejection of " + name);
    return false;
  }

  for (camera::RawControlRecord& control : device->controls) {
    if (control.name != name) {
      continue;
    }
    if ((control.minimum.has_value() && value < control.minimum.value()) ||
        (control.maximum.has_value() && value > control.maximum.value())) {
      ++state_->counters.apply_failures;
      error = FormatCameraError(CameraErrorCode::kControlApplyFailed,
                                name + "=" + std::to_string(value) + ": Invalid argument");
      return false;
    }
    control.current_value = value;
    state_->applied_writes.emplace_back(name, value);
    return true;
  }

  ++state_->counters.apply_failures;
  error = FormatCameraError(CameraErrorCode::kControlUnknown,
                            "control '" + name + "' not found on " + device_path);
  return false;
}

std::unique_ptr<IFrameSource> SimDeviceBackend::OpenCapture(const std::string& device_path,
                                                            std::string& error) {
  error.clear();
  std::lock_guard<std::mutex> lock(state_->mu);
  ++state_->counters.open_calls;

  if (state_->FindDevice(device_path) == nullptr) {
    error = FormatCameraError(CameraErrorCode::kDeviceUnavailable, "no such device " + device_path);
    return nullptr;
  }
  if (state_->plan.open_always_fails || state_->plan.fail_next_opens > 0U) {
    if (state_->plan.fail_next_opens > 0U) {
      --state_->plan.fail_next_opens;
    }
    error = FormatCameraError(CameraErrorCode::kDeviceUnavailable,
                              "simulated open failure for " + device_path);
    return nullptr;
  }
  return std::make_unique<SimFrameSource>(state_, device_path);
}

void SimDeviceBackend::SetFaultPlan(SimFaultPlan plan) {
  std::lock_guard<std::mutex> lock(state_->mu);
  state_->plan = std::move(plan);
}

SimFaultPlan SimDeviceBackend::FaultPlan() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->plan;
}

void SimDeviceBackend::FailNextReads(const std::uint32_t count) {
  std::lock_guard<std::mutex> lock(state_->mu);
  state_->plan.fail_next_reads = count;
}

void SimDeviceBackend::SetReadsAlwaysFail(const bool enabled) {
  std::lock_guard<std::mutex> lock(state_->mu);
  state_->plan.reads_always_fail = enabled;
}

void SimDeviceBackend::SetOpenAlwaysFails(const bool enabled) {
  std::lock_guard<std::mutex> lock(state_->mu);
  state_->plan.open_always_fails = enabled;
}

SimCounters SimDeviceBackend::Counters() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->counters;
}

std::vector<std::pair<std::string, std::int64_t>> SimDeviceBackend::AppliedWrites() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->applied_writes;
}

std::optional<std::int64_t> SimDeviceBackend::HardwareValue(const std::string& device_path,
                                                            const std::string& name) const {
  std::lock_guard<std::mutex> lock(state_->mu);
  const SimDevice* device = state_->FindDevice(device_path);
  if (device == nullptr) {
    return std::nullopt;
  }
  for (const camera::RawControlRecord& control : device->controls) {
    if (control.name == name) {
      return control.current_value;
    }
  }
  return std::nullopt;
}

} // namespace camctl::backends::sim
