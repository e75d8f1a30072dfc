#pragma once

#include "backends/device_backend.hpp"
#include "backends/v4l2/v4l2_capture_device.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace camctl::backends::v4l2 {

// Native Linux backend talking to `/dev/video*` nodes through ioctl.
//
// Contract:
// - devices are character nodes exposing single-planar video capture, named
//   from the QUERYCAP card string and ordered by the numeric node suffix
// - formats come from ENUM_FMT + ENUM_FRAMESIZES (discrete sizes, and the
//   min/max corners of stepwise ranges)
// - controls come from QUERYCTRL walked with NEXT_CTRL; names are normalized
//   to the `v4l2-ctl` identifier form and current values read with G_CTRL
// - introspection and control writes open their own short-lived descriptor,
//   so they never touch the streaming handle
class V4l2DeviceBackend final : public IDeviceBackend {
public:
  // Lists candidate node paths (`/dev/videoN`). Tests replace this to avoid
  // touching the real `/dev`.
  using NodeLister = std::function<bool(std::vector<std::string>& nodes, std::string& error)>;

  explicit V4l2DeviceBackend(V4l2CaptureDevice::IoOps io_ops = V4l2CaptureDevice::DefaultIoOps(),
                             NodeLister node_lister = {});

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

  // Scans `/dev` for `video*` character nodes, sorted by numeric suffix.
  static bool DiscoverVideoNodes(std::vector<std::string>& nodes, std::string& error);

private:
  // Opens a short-lived descriptor for introspection. Returns -1 and sets
  // `error` on failure.
  int OpenControlDescriptor(const std::string& device_path, std::string& error) const;
  void CloseControlDescriptor(int fd) const;
  int IoctlRetry(int fd, unsigned long request, void* arg) const;

  V4l2CaptureDevice::IoOps io_ops_;
  NodeLister node_lister_;
};

// `IFrameSource` over one streaming `V4l2CaptureDevice`.
class V4l2FrameSource final : public IFrameSource {
public:
  explicit V4l2FrameSource(std::unique_ptr<V4l2CaptureDevice> device);

  bool SetFormat(const camera::CaptureFormat& requested, double fps,
                 camera::CaptureFormat& applied, std::string& error) override;
  bool ReadFrame(camera::Frame& frame, std::chrono::milliseconds timeout,
                 std::string& error) override;
  bool Close(std::string& error) override;
  bool IsOpen() const override;

private:
  std::unique_ptr<V4l2CaptureDevice> device_;
};

} // namespace camctl::backends::v4l2
