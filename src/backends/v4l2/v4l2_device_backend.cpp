#include "backends/v4l2/v4l2_device_backend.hpp"

#include "backends/v4l2/v4l2_utils.hpp"
#include "camera/control_descriptor.hpp"
#include "core/errors/camera_errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#if defined(__linux__)
#include <fcntl.h>
#include <linux/videodev2.h>
#endif

namespace fs = std::filesystem;

namespace camctl::backends::v4l2 {

namespace {

using core::errors::CameraErrorCode;
using core::errors::FormatCameraError;

#if defined(__linux__)
// `v4l2-ctl --list-ctrls` spelling of the control type.
std::string ControlTypeTag(const std::uint32_t type) {
  switch (type) {
  case V4L2_CTRL_TYPE_INTEGER:
    return "int";
  case V4L2_CTRL_TYPE_BOOLEAN:
    return "bool";
  case V4L2_CTRL_TYPE_MENU:
    return "menu";
  case V4L2_CTRL_TYPE_INTEGER_MENU:
    return "intmenu";
  case V4L2_CTRL_TYPE_INTEGER64:
    return "int64";
  case V4L2_CTRL_TYPE_BUTTON:
    return "button";
  case V4L2_CTRL_TYPE_BITMASK:
    return "bitmask";
  case V4L2_CTRL_TYPE_STRING:
    return "str";
  default:
    return "other";
  }
}

bool HasCurrentValue(const std::uint32_t type, const std::uint32_t flags) {
  if ((flags & V4L2_CTRL_FLAG_WRITE_ONLY) != 0U) {
    return false;
  }
  return type == V4L2_CTRL_TYPE_INTEGER || type == V4L2_CTRL_TYPE_BOOLEAN ||
         type == V4L2_CTRL_TYPE_MENU || type == V4L2_CTRL_TYPE_INTEGER_MENU ||
         type == V4L2_CTRL_TYPE_BITMASK;
}

void AppendUnique(std::vector<camera::CaptureFormat>& formats, camera::CaptureFormat format) {
  if (format.width == 0U || format.height == 0U) {
    return;
  }
  if (std::find(formats.begin(), formats.end(), format) == formats.end()) {
    formats.push_back(std::move(format));
  }
}
#endif

} // namespace

V4l2DeviceBackend::V4l2DeviceBackend(V4l2CaptureDevice::IoOps io_ops, NodeLister node_lister)
    : io_ops_(std::move(io_ops)), node_lister_(std::move(node_lister)) {
  if (!node_lister_) {
    node_lister_ = &V4l2DeviceBackend::DiscoverVideoNodes;
  }
}

const char* V4l2DeviceBackend::Name() const {
  return "v4l2";
}

bool V4l2DeviceBackend::DiscoverVideoNodes(std::vector<std::string>& nodes, std::string& error) {
  nodes.clear();
  error.clear();

  std::vector<fs::path> found;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator("/dev", ec)) {
    if (ec) {
      break;
    }
    std::error_code type_ec;
    if (!entry.is_character_file(type_ec) || type_ec) {
      continue;
    }
    if (!ParseVideoIndex(entry.path().filename().string()).has_value()) {
      continue;
    }
    found.push_back(entry.path());
  }
  if (ec) {
    error = "failed to iterate /dev for V4L2 discovery: " + ec.message();
    return false;
  }

  std::sort(found.begin(), found.end(), [](const fs::path& left, const fs::path& right) {
    const std::optional<std::size_t> left_index = ParseVideoIndex(left.filename().string());
    const std::optional<std::size_t> right_index = ParseVideoIndex(right.filename().string());
    if (left_index.has_value() && right_index.has_value() &&
        left_index.value() != right_index.value()) {
      return left_index.value() < right_index.value();
    }
    return left.string() < right.string();
  });

  nodes.reserve(found.size());
  for (const fs::path& path : found) {
    nodes.push_back(path.string());
  }
  return true;
}

bool V4l2DeviceBackend::ListDevices(std::vector<DeviceEntry>& devices, std::string& error) {
  devices.clear();
  error.clear();

#if !defined(__linux__)
  error = "V4L2 enumeration is only supported on Linux";
  return false;
#else
  std::vector<std::string> nodes;
  if (!node_lister_(nodes, error)) {
    return false;
  }

  for (const std::string& node : nodes) {
    std::string open_error;
    const int fd = OpenControlDescriptor(node, open_error);
    if (fd < 0) {
      continue;
    }

    v4l2_capability caps{};
    const int status = IoctlRetry(fd, VIDIOC_QUERYCAP, &caps);
    CloseControlDescriptor(fd);
    if (status != 0) {
      continue;
    }

    // Metadata nodes registered by UVC drivers share the card name but cannot
    // stream video; `device_caps` tells them apart.
    const std::uint32_t effective_caps =
        (caps.device_caps != 0U) ? caps.device_caps : caps.capabilities;
    if ((effective_caps & V4L2_CAP_VIDEO_CAPTURE) == 0U) {
      continue;
    }

    DeviceEntry entry;
    entry.device_path = node;
    entry.display_name = Trim(reinterpret_cast<const char*>(caps.card));
    if (entry.display_name.empty()) {
      entry.display_name = fs::path(node).filename().string();
    }
    devices.push_back(std::move(entry));
  }

  // Node listers other than the built-in scan may return arbitrary order.
  std::stable_sort(devices.begin(), devices.end(),
                   [](const DeviceEntry& left, const DeviceEntry& right) {
                     const auto left_index =
                         ParseVideoIndex(fs::path(left.device_path).filename().string());
                     const auto right_index =
                         ParseVideoIndex(fs::path(right.device_path).filename().string());
                     return left_index.value_or(0U) < right_index.value_or(0U);
                   });
  return true;
#endif
}

bool V4l2DeviceBackend::ListFormats(const std::string& device_path,
                                    std::vector<camera::CaptureFormat>& formats,
                                    std::string& error) {
  formats.clear();
  error.clear();

#if !defined(__linux__)
  (void)device_path;
  error = FormatCameraError(CameraErrorCode::kNoSupportedFormats,
                            "V4L2 enumeration is only supported on Linux");
  return false;
#else
  const int fd = OpenControlDescriptor(device_path, error);
  if (fd < 0) {
    return false;
  }

  v4l2_fmtdesc format_desc{};
  format_desc.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  for (std::uint32_t index = 0U;; ++index) {
    format_desc.index = index;
    if (IoctlRetry(fd, VIDIOC_ENUM_FMT, &format_desc) != 0) {
      break;
    }
    const std::string tag = FourccToString(format_desc.pixelformat);

    v4l2_frmsizeenum frame_size{};
    frame_size.pixel_format = format_desc.pixelformat;
    for (std::uint32_t size_index = 0U;; ++size_index) {
      frame_size.index = size_index;
      if (IoctlRetry(fd, VIDIOC_ENUM_FRAMESIZES, &frame_size) != 0) {
        break;
      }

      if (frame_size.type == V4L2_FRMSIZE_TYPE_DISCRETE) {
        AppendUnique(formats, camera::CaptureFormat{.format = tag,
                                                    .width = frame_size.discrete.width,
                                                    .height = frame_size.discrete.height});
        continue;
      }

      // Stepwise and continuous ranges report a single entry; the corners are
      // the only sizes guaranteed to be accepted.
      const auto& stepwise = frame_size.stepwise;
      AppendUnique(formats, camera::CaptureFormat{.format = tag,
                                                  .width = stepwise.min_width,
                                                  .height = stepwise.min_height});
      AppendUnique(formats, camera::CaptureFormat{.format = tag,
                                                  .width = stepwise.max_width,
                                                  .height = stepwise.max_height});
      break;
    }
  }
  CloseControlDescriptor(fd);

  if (formats.empty()) {
    error = FormatCameraError(CameraErrorCode::kNoSupportedFormats,
                              "no capture formats reported by " + device_path);
    return false;
  }
  camera::SortCaptureFormats(formats);
  return true;
#endif
}

bool V4l2DeviceBackend::ListControls(const std::string& device_path,
                                     std::vector<camera::RawControlRecord>& controls,
                                     std::string& error) {
  controls.clear();
  error.clear();

#if !defined(__linux__)
  (void)device_path;
  error = FormatCameraError(CameraErrorCode::kNoControlsFound,
                            "V4L2 enumeration is only supported on Linux");
  return false;
#else
  const int fd = OpenControlDescriptor(device_path, error);
  if (fd < 0) {
    return false;
  }

  v4l2_queryctrl query{};
  query.id = V4L2_CTRL_FLAG_NEXT_CTRL;
  while (IoctlRetry(fd, VIDIOC_QUERYCTRL, &query) == 0) {
    const std::uint32_t queried_id = query.id;
    if ((query.flags & V4L2_CTRL_FLAG_DISABLED) == 0U &&
        query.type != V4L2_CTRL_TYPE_CTRL_CLASS) {
      camera::RawControlRecord record;
      record.name = camera::NormalizeControlName(reinterpret_cast<const char*>(query.name));
      record.type_tag = ControlTypeTag(query.type);
      record.minimum = query.minimum;
      record.maximum = query.maximum;
      record.step = query.step;
      record.default_value = query.default_value;

      if (HasCurrentValue(query.type, query.flags)) {
        v4l2_control current{};
        current.id = queried_id;
        if (IoctlRetry(fd, VIDIOC_G_CTRL, &current) == 0) {
          record.current_value = current.value;
        }
      }
      if (!record.name.empty()) {
        controls.push_back(std::move(record));
      }
    }

    query = v4l2_queryctrl{};
    query.id = queried_id | V4L2_CTRL_FLAG_NEXT_CTRL;
  }
  CloseControlDescriptor(fd);
  return true;
#endif
}

bool V4l2DeviceBackend::ApplyControl(const std::string& device_path, const std::string& name,
                                     const std::int64_t value, std::string& error) {
  error.clear();

#if !defined(__linux__)
  (void)device_path;
  (void)name;
  (void)value;
  error = FormatCameraError(CameraErrorCode::kControlApplyFailed,
                            "V4L2 control writes are only supported on Linux");
  return false;
#else
  const int fd = OpenControlDescriptor(device_path, error);
  if (fd < 0) {
    return false;
  }

  std::optional<std::uint32_t> control_id;
  v4l2_queryctrl query{};
  query.id = V4L2_CTRL_FLAG_NEXT_CTRL;
  while (IoctlRetry(fd, VIDIOC_QUERYCTRL, &query) == 0) {
    if (query.type != V4L2_CTRL_TYPE_CTRL_CLASS &&
        camera::NormalizeControlName(reinterpret_cast<const char*>(query.name)) == name) {
      control_id = query.id;
      break;
    }
    const std::uint32_t next_id = query.id | V4L2_CTRL_FLAG_NEXT_CTRL;
    query = v4l2_queryctrl{};
    query.id = next_id;
  }

  if (!control_id.has_value()) {
    CloseControlDescriptor(fd);
    error = FormatCameraError(CameraErrorCode::kControlUnknown,
                              "control '" + name + "' not found on " + device_path);
    return false;
  }

  v4l2_control control{};
  control.id = control_id.value();
  control.value = static_cast<std::int32_t>(value);
  const int status = IoctlRetry(fd, VIDIOC_S_CTRL, &control);
  const int saved_errno = errno;
  CloseControlDescriptor(fd);
  if (status != 0) {
    error = FormatCameraError(CameraErrorCode::kControlApplyFailed,
                              "VIDIOC_S_CTRL " + name + "=" + std::to_string(value) + ": " +
                                  std::strerror(saved_errno));
    return false;
  }
  return true;
#endif
}

std::unique_ptr<IFrameSource> V4l2DeviceBackend::OpenCapture(const std::string& device_path,
                                                             std::string& error) {
  error.clear();
  auto device = std::make_unique<V4l2CaptureDevice>(io_ops_);
  V4l2OpenInfo open_info;
  std::string open_error;
  if (!device->Open(device_path, open_info, open_error)) {
    error = FormatCameraError(CameraErrorCode::kDeviceUnavailable, open_error);
    return nullptr;
  }
  return std::make_unique<V4l2FrameSource>(std::move(device));
}

int V4l2DeviceBackend::OpenControlDescriptor(const std::string& device_path,
                                             std::string& error) const {
#if !defined(__linux__)
  (void)device_path;
  error = FormatCameraError(CameraErrorCode::kDeviceUnavailable,
                            "V4L2 is only supported on Linux");
  return -1;
#else
  if (!io_ops_.open_fn || !io_ops_.close_fn || !io_ops_.ioctl_fn) {
    error = FormatCameraError(CameraErrorCode::kDeviceUnavailable,
                              "V4L2 IO operations are not configured");
    return -1;
  }
  const int fd = io_ops_.open_fn(device_path.c_str(), O_RDWR | O_NONBLOCK);
  if (fd < 0) {
    error = FormatCameraError(CameraErrorCode::kDeviceUnavailable,
                              "failed to open '" + device_path + "': " + std::strerror(errno));
  }
  return fd;
#endif
}

void V4l2DeviceBackend::CloseControlDescriptor(const int fd) const {
  if (fd >= 0 && io_ops_.close_fn) {
    (void)io_ops_.close_fn(fd);
  }
}

int V4l2DeviceBackend::IoctlRetry(const int fd, const unsigned long request, void* arg) const {
  if (!io_ops_.ioctl_fn) {
    errno = ENOSYS;
    return -1;
  }
  int status = -1;
  do {
    status = io_ops_.ioctl_fn(fd, request, arg);
  } while (status != 0 && errno == EINTR);
  return status;
}

V4l2FrameSource::V4l2FrameSource(std::unique_ptr<V4l2CaptureDevice> device)
    : device_(std::move(device)) {}

bool V4l2FrameSource::SetFormat(const camera::CaptureFormat& requested, const double fps,
                                camera::CaptureFormat& applied, std::string& error) {
  if (!device_->ApplyFormat(requested, fps, applied, error)) {
    return false;
  }
  if (!device_->IsStreaming()) {
    return device_->StartStreaming(V4l2CaptureDevice::kDefaultBufferCount, error);
  }
  return true;
}

bool V4l2FrameSource::ReadFrame(camera::Frame& frame, const std::chrono::milliseconds timeout,
                                std::string& error) {
  return device_->ReadFrame(frame, timeout, error);
}

bool V4l2FrameSource::Close(std::string& error) {
  return device_->Close(error);
}

bool V4l2FrameSource::IsOpen() const {
  return device_->IsOpen();
}

} // namespace camctl::backends::v4l2
