#pragma once

#include "camera/control_descriptor.hpp"
#include "camera/frame.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace camctl::backends {

// One capture-capable device node as presented to an operator.
struct DeviceEntry {
  std::string display_name;
  std::string device_path;
};

// Exclusively owned, open device handle.
//
// Implementations are not required to be thread-safe: the device session
// serializes every call under its own exclusion domain.
class IFrameSource {
public:
  virtual ~IFrameSource() = default;

  // Negotiates pixel format and size, then (re)starts streaming. `applied`
  // receives what the driver accepted, which may differ from `requested`.
  virtual bool SetFormat(const camera::CaptureFormat& requested, double fps,
                         camera::CaptureFormat& applied, std::string& error) = 0;

  // Blocks at most `timeout` for one frame. Fills payload, size and pixel
  // format; sequence and timestamp are stamped by the caller.
  virtual bool ReadFrame(camera::Frame& frame, std::chrono::milliseconds timeout,
                         std::string& error) = 0;

  virtual bool Close(std::string& error) = 0;
  virtual bool IsOpen() const = 0;
};

// Pluggable device capability used by the camera core.
//
// The contracts are backend-agnostic: the native V4L2 implementation and the
// simulated one are drop-in alternatives. Control operations address the
// device by path so they never touch the streaming handle.
class IDeviceBackend {
public:
  virtual ~IDeviceBackend() = default;

  virtual const char* Name() const = 0;

  // Capture devices ordered by the numeric index embedded in the path.
  virtual bool ListDevices(std::vector<DeviceEntry>& devices, std::string& error) = 0;

  // Supported formats sorted by (width, height). An empty result is reported
  // as a `NO_SUPPORTED_FORMATS` failure, never as an empty success.
  virtual bool ListFormats(const std::string& device_path,
                           std::vector<camera::CaptureFormat>& formats, std::string& error) = 0;

  // Raw control rows; classification happens in the control registry.
  virtual bool ListControls(const std::string& device_path,
                            std::vector<camera::RawControlRecord>& controls,
                            std::string& error) = 0;

  virtual bool ApplyControl(const std::string& device_path, const std::string& name,
                            std::int64_t value, std::string& error) = 0;

  // Opens the streaming handle. Returns nullptr with `DEVICE_UNAVAILABLE`
  // text on failure.
  virtual std::unique_ptr<IFrameSource> OpenCapture(const std::string& device_path,
                                                    std::string& error) = 0;
};

} // namespace camctl::backends
