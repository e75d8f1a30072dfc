#include "backends/v4l2/v4l2_capture_device.hpp"

#include "backends/v4l2/v4l2_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <string>
#include <utility>

#if defined(__linux__)
#include <fcntl.h>
#include <linux/videodev2.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <unistd.h>
#endif

namespace camctl::backends::v4l2 {

namespace {

#if defined(__linux__)
bool TryFpsFromTimePerFrame(const v4l2_fract& time_per_frame, double& fps) {
  if (time_per_frame.numerator == 0U || time_per_frame.denominator == 0U) {
    return false;
  }
  const double computed = static_cast<double>(time_per_frame.denominator) /
                          static_cast<double>(time_per_frame.numerator);
  if (!std::isfinite(computed) || computed <= 0.0) {
    return false;
  }
  fps = computed;
  return true;
}

v4l2_fract BuildTimePerFrameFromFps(const double fps) {
  // Represent fractional FPS as ms period to keep integer math stable.
  constexpr std::uint32_t kBase = 1000U;
  const double scaled = fps * static_cast<double>(kBase);
  std::uint32_t denominator = static_cast<std::uint32_t>(std::llround(scaled));
  if (denominator == 0U) {
    denominator = 1U;
  }
  return v4l2_fract{.numerator = kBase, .denominator = denominator};
}
#endif

std::string ErrnoText(const int saved_errno) {
  return std::strerror(saved_errno);
}

} // namespace

const char* ToString(const V4l2CaptureMethod method) {
  switch (method) {
  case V4l2CaptureMethod::kMmapStreaming:
    return "mmap_streaming";
  case V4l2CaptureMethod::kReadFallback:
    return "read_fallback";
  }
  return "mmap_streaming";
}

V4l2CaptureDevice::IoOps V4l2CaptureDevice::DefaultIoOps() {
  IoOps ops;
#if defined(__linux__)
  ops.open_fn = [](const char* path, const int flags) { return ::open(path, flags); };
  ops.close_fn = [](const int fd) { return ::close(fd); };
  ops.ioctl_fn = [](const int fd, const unsigned long request, void* arg) {
    return ::ioctl(fd, request, arg);
  };
  ops.mmap_fn = [](void* addr, const std::size_t length, const int prot, const int flags,
                   const int fd, const std::int64_t offset) {
    return ::mmap(addr, length, prot, flags, fd, static_cast<off_t>(offset));
  };
  ops.munmap_fn = [](void* addr, const std::size_t length) { return ::munmap(addr, length); };
  ops.poll_fn = [](const int fd, const int timeout_ms) {
    pollfd descriptor{};
    descriptor.fd = fd;
    descriptor.events = POLLIN;
    return ::poll(&descriptor, 1, timeout_ms);
  };
  ops.read_fn = [](const int fd, void* buffer, const std::size_t length) {
    return static_cast<long>(::read(fd, buffer, length));
  };
#else
  ops.open_fn = [](const char* /*path*/, const int /*flags*/) {
    errno = ENOSYS;
    return -1;
  };
  ops.close_fn = [](const int /*fd*/) {
    errno = ENOSYS;
    return -1;
  };
  ops.ioctl_fn = [](const int /*fd*/, const unsigned long /*request*/, void* /*arg*/) {
    errno = ENOSYS;
    return -1;
  };
#endif
  return ops;
}

V4l2CaptureDevice::V4l2CaptureDevice(IoOps io_ops) : io_ops_(std::move(io_ops)) {}

V4l2CaptureDevice::~V4l2CaptureDevice() {
  std::string ignored_error;
  (void)Close(ignored_error);
}

bool V4l2CaptureDevice::Open(const std::string& device_path, V4l2OpenInfo& open_info,
                             std::string& error) {
  error.clear();
  open_info = V4l2OpenInfo{};

  if (device_path.empty()) {
    error = "device path cannot be empty";
    return false;
  }

  if (IsOpen()) {
    error = "device is already open: " + device_path_;
    return false;
  }

#if !defined(__linux__)
  (void)device_path;
  error = "V4L2 capture is only supported on Linux";
  return false;
#else
  if (!io_ops_.open_fn || !io_ops_.close_fn || !io_ops_.ioctl_fn) {
    error = "V4L2 IO operations are not configured";
    return false;
  }

  constexpr int kOpenFlags = O_RDWR | O_NONBLOCK;
  const int opened_fd = io_ops_.open_fn(device_path.c_str(), kOpenFlags);
  if (opened_fd < 0) {
    error = "failed to open V4L2 device '" + device_path + "': " + ErrnoText(errno);
    return false;
  }

  v4l2_capability capability{};
  if (IoctlRetry(opened_fd, VIDIOC_QUERYCAP, &capability) != 0) {
    const int saved_errno = errno;
    (void)io_ops_.close_fn(opened_fd);
    error = "VIDIOC_QUERYCAP failed for '" + device_path + "': " + ErrnoText(saved_errno);
    return false;
  }

  const std::uint32_t effective_caps =
      (capability.device_caps != 0U) ? capability.device_caps : capability.capabilities;
  if ((effective_caps & V4L2_CAP_VIDEO_CAPTURE) == 0U) {
    (void)io_ops_.close_fn(opened_fd);
    error = "device '" + device_path +
            "' does not support single-planar video capture "
            "(capabilities=" +
            FormatCapabilitiesHex(effective_caps) + ")";
    return false;
  }

  V4l2CaptureMethod selected_method = V4l2CaptureMethod::kMmapStreaming;
  std::string selection_reason;
  if (!ChooseCaptureMethod(effective_caps, selected_method, selection_reason)) {
    (void)io_ops_.close_fn(opened_fd);
    error = "device '" + device_path + "' capture method selection failed: " + selection_reason +
            " (capabilities=" + FormatCapabilitiesHex(effective_caps) + ")";
    return false;
  }

  fd_ = opened_fd;
  device_path_ = device_path;
  effective_capabilities_ = effective_caps;
  buffer_type_ = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  capture_method_ = selected_method;

  v4l2_format current{};
  current.type = buffer_type_;
  if (IoctlRetry(fd_, VIDIOC_G_FMT, &current) == 0) {
    active_format_ = camera::CaptureFormat{
        .format = FourccToString(current.fmt.pix.pixelformat),
        .width = current.fmt.pix.width,
        .height = current.fmt.pix.height,
    };
    size_image_ = current.fmt.pix.sizeimage;
  }

  open_info.device_path = device_path_;
  open_info.driver_name = Trim(reinterpret_cast<const char*>(capability.driver));
  open_info.card_name = Trim(reinterpret_cast<const char*>(capability.card));
  open_info.effective_capabilities = effective_caps;
  open_info.capabilities_hex = FormatCapabilitiesHex(effective_caps);
  open_info.capture_method = selected_method;
  open_info.capture_method_reason = std::move(selection_reason);
  return true;
#endif
}

bool V4l2CaptureDevice::Close(std::string& error) {
  error.clear();
  if (!IsOpen()) {
    return true;
  }

  std::string teardown_error;
  if (!StopStreaming(teardown_error)) {
    error = teardown_error;
  }

  if (!io_ops_.close_fn) {
    error = "V4L2 close operation is not configured";
    return false;
  }

  if (io_ops_.close_fn(fd_) != 0) {
    error = "failed to close V4L2 device '" + device_path_ + "': " + ErrnoText(errno);
    return false;
  }

  fd_ = -1;
  device_path_.clear();
  effective_capabilities_ = 0U;
  buffer_type_ = 0U;
  capture_method_ = V4l2CaptureMethod::kMmapStreaming;
  active_format_ = camera::CaptureFormat{};
  size_image_ = 0U;
  negotiated_fps_.reset();
  read_buffer_.clear();
  return error.empty();
}

bool V4l2CaptureDevice::ApplyFormat(const camera::CaptureFormat& request, const double fps,
                                    camera::CaptureFormat& applied, std::string& error) {
  error.clear();
  applied = camera::CaptureFormat{};

  if (!IsOpen()) {
    error = "device must be open before applying a format";
    return false;
  }

#if !defined(__linux__)
  (void)request;
  (void)fps;
  error = "V4L2 capture is only supported on Linux";
  return false;
#else
  const std::optional<std::uint32_t> requested_fourcc = ParseFourcc(request.format);
  if (!requested_fourcc.has_value()) {
    error = "pixel format must be 4 ASCII characters (example: MJPG), got '" + request.format + "'";
    return false;
  }
  if (request.width == 0U || request.height == 0U) {
    error = "width and height must be positive";
    return false;
  }

  // Buffers are sized for the old format; the driver refuses S_FMT while they
  // are allocated.
  const bool was_streaming = streaming_;
  if (!StopStreaming(error)) {
    return false;
  }

  v4l2_format format{};
  format.type = buffer_type_;
  if (IoctlRetry(fd_, VIDIOC_G_FMT, &format) != 0) {
    format = v4l2_format{};
    format.type = buffer_type_;
  }
  format.fmt.pix.width = request.width;
  format.fmt.pix.height = request.height;
  format.fmt.pix.pixelformat = requested_fourcc.value();
  format.fmt.pix.field = V4L2_FIELD_ANY;

  if (IoctlRetry(fd_, VIDIOC_S_FMT, &format) != 0) {
    error = "VIDIOC_S_FMT rejected " + camera::ToString(request) + ": " + ErrnoText(errno);
    return false;
  }

  active_format_ = camera::CaptureFormat{
      .format = FourccToString(format.fmt.pix.pixelformat),
      .width = format.fmt.pix.width,
      .height = format.fmt.pix.height,
  };
  size_image_ = format.fmt.pix.sizeimage;
  applied = active_format_;

  negotiated_fps_.reset();
  if (fps > 0.0 && std::isfinite(fps)) {
    v4l2_streamparm stream_param{};
    stream_param.type = buffer_type_;
    if (IoctlRetry(fd_, VIDIOC_G_PARM, &stream_param) == 0 &&
        (stream_param.parm.capture.capability & V4L2_CAP_TIMEPERFRAME) != 0U) {
      stream_param.parm.capture.timeperframe = BuildTimePerFrameFromFps(fps);
      double actual_fps = 0.0;
      if (IoctlRetry(fd_, VIDIOC_S_PARM, &stream_param) == 0 &&
          TryFpsFromTimePerFrame(stream_param.parm.capture.timeperframe, actual_fps)) {
        negotiated_fps_ = actual_fps;
      }
    }
  }

  if (was_streaming) {
    return StartStreaming(kDefaultBufferCount, error);
  }
  return true;
#endif
}

bool V4l2CaptureDevice::StartStreaming(const std::size_t requested_buffer_count,
                                       std::string& error) {
  error.clear();
  if (!IsOpen()) {
    error = "device must be open before streaming";
    return false;
  }
  if (streaming_) {
    return true;
  }

#if !defined(__linux__)
  (void)requested_buffer_count;
  error = "V4L2 capture is only supported on Linux";
  return false;
#else
  if (capture_method_ == V4l2CaptureMethod::kReadFallback) {
    const std::size_t frame_bytes =
        size_image_ != 0U ? size_image_
                          : static_cast<std::size_t>(active_format_.width) *
                                static_cast<std::size_t>(active_format_.height) * 3U;
    if (frame_bytes == 0U) {
      error = "read() fallback needs a negotiated format before streaming";
      return false;
    }
    read_buffer_.assign(frame_bytes, 0U);
    streaming_ = true;
    return true;
  }

  if (!io_ops_.mmap_fn || !io_ops_.munmap_fn || !io_ops_.poll_fn) {
    error = "V4L2 mmap IO operations are not configured";
    return false;
  }
  if (requested_buffer_count == 0U) {
    error = "requested buffer count must be positive";
    return false;
  }

  v4l2_requestbuffers request{};
  request.count = static_cast<std::uint32_t>(requested_buffer_count);
  request.type = buffer_type_;
  request.memory = V4L2_MEMORY_MMAP;
  if (IoctlRetry(fd_, VIDIOC_REQBUFS, &request) != 0) {
    error = "VIDIOC_REQBUFS failed for '" + device_path_ + "': " + ErrnoText(errno);
    return false;
  }
  if (request.count == 0U) {
    error = "driver granted zero mmap buffers for '" + device_path_ + "'";
    return false;
  }
  mmap_buffers_allocated_ = true;

  for (std::uint32_t index = 0; index < request.count; ++index) {
    v4l2_buffer buffer{};
    buffer.type = buffer_type_;
    buffer.memory = V4L2_MEMORY_MMAP;
    buffer.index = index;
    if (IoctlRetry(fd_, VIDIOC_QUERYBUF, &buffer) != 0) {
      error = "VIDIOC_QUERYBUF failed for buffer " + std::to_string(index) + ": " +
              ErrnoText(errno);
      std::string release_error;
      (void)ReleaseBuffers(release_error);
      return false;
    }

    void* address = io_ops_.mmap_fn(nullptr, buffer.length, PROT_READ | PROT_WRITE, MAP_SHARED,
                                    fd_, static_cast<std::int64_t>(buffer.m.offset));
    if (address == MAP_FAILED || address == nullptr) {
      error = "mmap failed for buffer " + std::to_string(index) + ": " + ErrnoText(errno);
      std::string release_error;
      (void)ReleaseBuffers(release_error);
      return false;
    }
    mmap_buffers_.push_back(MmapBuffer{.address = address, .length = buffer.length});
  }

  for (std::uint32_t index = 0; index < mmap_buffers_.size(); ++index) {
    v4l2_buffer buffer{};
    buffer.type = buffer_type_;
    buffer.memory = V4L2_MEMORY_MMAP;
    buffer.index = index;
    if (IoctlRetry(fd_, VIDIOC_QBUF, &buffer) != 0) {
      error = "VIDIOC_QBUF failed for buffer " + std::to_string(index) + ": " + ErrnoText(errno);
      std::string release_error;
      (void)ReleaseBuffers(release_error);
      return false;
    }
  }

  int stream_type = static_cast<int>(buffer_type_);
  if (IoctlRetry(fd_, VIDIOC_STREAMON, &stream_type) != 0) {
    error = "VIDIOC_STREAMON failed for '" + device_path_ + "': " + ErrnoText(errno);
    std::string release_error;
    (void)ReleaseBuffers(release_error);
    return false;
  }

  streaming_ = true;
  return true;
#endif
}

bool V4l2CaptureDevice::StopStreaming(std::string& error) {
  error.clear();
  if (!streaming_ && !mmap_buffers_allocated_) {
    return true;
  }

#if !defined(__linux__)
  streaming_ = false;
  return true;
#else
  if (capture_method_ == V4l2CaptureMethod::kReadFallback) {
    streaming_ = false;
    return true;
  }

  if (streaming_) {
    int stream_type = static_cast<int>(buffer_type_);
    if (IoctlRetry(fd_, VIDIOC_STREAMOFF, &stream_type) != 0) {
      error = "VIDIOC_STREAMOFF failed for '" + device_path_ + "': " + ErrnoText(errno);
    }
    streaming_ = false;
  }

  std::string release_error;
  if (!ReleaseBuffers(release_error) && error.empty()) {
    error = release_error;
  }
  return error.empty();
#endif
}

bool V4l2CaptureDevice::ReadFrame(camera::Frame& frame, const std::chrono::milliseconds timeout,
                                  std::string& error) {
  error.clear();
  if (!streaming_) {
    error = "device is not streaming";
    return false;
  }
  if (!io_ops_.poll_fn) {
    error = "V4L2 poll operation is not configured";
    return false;
  }

  const int timeout_ms = static_cast<int>(std::max<std::int64_t>(0, timeout.count()));
  const int ready = io_ops_.poll_fn(fd_, timeout_ms);
  if (ready < 0) {
    error = errno == EINTR ? "poll interrupted while waiting for frame"
                           : "poll failed on '" + device_path_ + "': " + ErrnoText(errno);
    return false;
  }
  if (ready == 0) {
    error = "timed out after " + std::to_string(timeout_ms) + "ms waiting for frame";
    return false;
  }

  if (capture_method_ == V4l2CaptureMethod::kReadFallback) {
    return ReadFallbackFrame(frame, error);
  }
  return ReadMmapFrame(frame, error);
}

bool V4l2CaptureDevice::ReadMmapFrame(camera::Frame& frame, std::string& error) {
#if !defined(__linux__)
  (void)frame;
  error = "V4L2 capture is only supported on Linux";
  return false;
#else
  v4l2_buffer buffer{};
  buffer.type = buffer_type_;
  buffer.memory = V4L2_MEMORY_MMAP;
  if (IoctlRetry(fd_, VIDIOC_DQBUF, &buffer) != 0) {
    error = errno == EAGAIN ? "no frame ready after poll"
                            : "VIDIOC_DQBUF failed: " + ErrnoText(errno);
    return false;
  }

  if (buffer.index >= mmap_buffers_.size()) {
    error = "driver returned out-of-range buffer index " + std::to_string(buffer.index);
    return false;
  }

  const MmapBuffer& mapped = mmap_buffers_[buffer.index];
  const bool corrupted = (buffer.flags & V4L2_BUF_FLAG_ERROR) != 0U;
  const std::size_t bytes_used = std::min<std::size_t>(buffer.bytesused, mapped.length);
  if (!corrupted && bytes_used > 0U) {
    const auto* begin = static_cast<const std::uint8_t*>(mapped.address);
    frame.data.assign(begin, begin + bytes_used);
    frame.width = active_format_.width;
    frame.height = active_format_.height;
    frame.pixel_format = active_format_.format;
  }

  if (IoctlRetry(fd_, VIDIOC_QBUF, &buffer) != 0) {
    error = "VIDIOC_QBUF requeue failed: " + ErrnoText(errno);
    return false;
  }

  if (corrupted) {
    error = "driver flagged buffer " + std::to_string(buffer.index) + " as corrupted";
    return false;
  }
  if (bytes_used == 0U) {
    error = "driver returned an empty buffer";
    return false;
  }
  return true;
#endif
}

bool V4l2CaptureDevice::ReadFallbackFrame(camera::Frame& frame, std::string& error) {
  if (!io_ops_.read_fn) {
    error = "V4L2 read operation is not configured";
    return false;
  }
  const long bytes_read = io_ops_.read_fn(fd_, read_buffer_.data(), read_buffer_.size());
  if (bytes_read < 0) {
    error = "read() failed on '" + device_path_ + "': " + ErrnoText(errno);
    return false;
  }
  if (bytes_read == 0) {
    error = "read() returned no data";
    return false;
  }
  frame.data.assign(read_buffer_.begin(), read_buffer_.begin() + bytes_read);
  frame.width = active_format_.width;
  frame.height = active_format_.height;
  frame.pixel_format = active_format_.format;
  return true;
}

bool V4l2CaptureDevice::ReleaseBuffers(std::string& error) {
  error.clear();
#if defined(__linux__)
  for (const MmapBuffer& buffer : mmap_buffers_) {
    if (io_ops_.munmap_fn && io_ops_.munmap_fn(buffer.address, buffer.length) != 0 &&
        error.empty()) {
      error = "munmap failed: " + ErrnoText(errno);
    }
  }
  mmap_buffers_.clear();

  if (mmap_buffers_allocated_) {
    v4l2_requestbuffers request{};
    request.count = 0U;
    request.type = buffer_type_;
    request.memory = V4L2_MEMORY_MMAP;
    if (IoctlRetry(fd_, VIDIOC_REQBUFS, &request) != 0 && error.empty()) {
      error = "VIDIOC_REQBUFS(0) failed: " + ErrnoText(errno);
    }
    mmap_buffers_allocated_ = false;
  }
#endif
  return error.empty();
}

bool V4l2CaptureDevice::IsOpen() const {
  return fd_ >= 0;
}

bool V4l2CaptureDevice::IsStreaming() const {
  return streaming_;
}

const std::string& V4l2CaptureDevice::DevicePath() const {
  return device_path_;
}

V4l2CaptureMethod V4l2CaptureDevice::CaptureMethod() const {
  return capture_method_;
}

std::optional<double> V4l2CaptureDevice::NegotiatedFps() const {
  return negotiated_fps_;
}

bool V4l2CaptureDevice::ChooseCaptureMethod(const std::uint32_t effective_caps,
                                            V4l2CaptureMethod& capture_method,
                                            std::string& reason) {
  reason.clear();
#if !defined(__linux__)
  (void)effective_caps;
  (void)capture_method;
  reason = "V4L2 capture is only supported on Linux";
  return false;
#else
  if ((effective_caps & V4L2_CAP_VIDEO_CAPTURE) == 0U &&
      (effective_caps & V4L2_CAP_VIDEO_CAPTURE_MPLANE) == 0U) {
    reason = "device does not expose VIDEO_CAPTURE capability";
    return false;
  }

  if ((effective_caps & V4L2_CAP_STREAMING) != 0U) {
    capture_method = V4l2CaptureMethod::kMmapStreaming;
    reason = "selected mmap streaming (preferred)";
    return true;
  }

  if ((effective_caps & V4L2_CAP_READWRITE) != 0U) {
    capture_method = V4l2CaptureMethod::kReadFallback;
    reason = "selected read() fallback because streaming is unavailable";
    return true;
  }

  reason = "device does not support mmap streaming or read() capture";
  return false;
#endif
}

int V4l2CaptureDevice::IoctlRetry(const int fd, const unsigned long request, void* arg) const {
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

} // namespace camctl::backends::v4l2
