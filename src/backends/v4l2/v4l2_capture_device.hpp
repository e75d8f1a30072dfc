#pragma once

#include "camera/frame.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace camctl::backends::v4l2 {

// Capture strategy chosen for a Linux V4L2 device.
//
// `mmap_streaming` is preferred for throughput/latency. `read_fallback` exists
// for older/simpler drivers that do not expose streaming buffers.
enum class V4l2CaptureMethod {
  kMmapStreaming = 0,
  kReadFallback,
};

const char* ToString(V4l2CaptureMethod method);

// Evidence recorded after a successful native V4L2 open.
struct V4l2OpenInfo {
  std::string device_path;
  std::string driver_name;
  std::string card_name;
  std::uint32_t effective_capabilities = 0U;
  std::string capabilities_hex;
  V4l2CaptureMethod capture_method = V4l2CaptureMethod::kMmapStreaming;
  std::string capture_method_reason;
};

// Owning wrapper around one V4L2 capture descriptor.
//
// Covers the whole handle lifecycle: open/querycap, format negotiation,
// mmap buffer setup, poll-bounded dequeue, stream off and close. All syscalls
// go through injected IO ops so tests run without a camera.
class V4l2CaptureDevice {
public:
  struct IoOps {
    std::function<int(const char* path, int flags)> open_fn;
    std::function<int(int fd)> close_fn;
    std::function<int(int fd, unsigned long request, void* arg)> ioctl_fn;
    std::function<void*(void* addr, std::size_t length, int prot, int flags, int fd,
                        std::int64_t offset)>
        mmap_fn;
    std::function<int(void* addr, std::size_t length)> munmap_fn;
    // Returns >0 when `fd` is readable, 0 on timeout, <0 on error.
    std::function<int(int fd, int timeout_ms)> poll_fn;
    std::function<long(int fd, void* buffer, std::size_t length)> read_fn;
  };

  static IoOps DefaultIoOps();

  static constexpr std::size_t kDefaultBufferCount = 4U;

  explicit V4l2CaptureDevice(IoOps io_ops = DefaultIoOps());
  ~V4l2CaptureDevice();

  V4l2CaptureDevice(const V4l2CaptureDevice&) = delete;
  V4l2CaptureDevice& operator=(const V4l2CaptureDevice&) = delete;

  bool Open(const std::string& device_path, V4l2OpenInfo& open_info, std::string& error);
  bool Close(std::string& error);

  // Stops streaming if needed, negotiates format/size and frame interval,
  // then restarts streaming when it was active.
  bool ApplyFormat(const camera::CaptureFormat& request, double fps,
                   camera::CaptureFormat& applied, std::string& error);

  bool StartStreaming(std::size_t requested_buffer_count, std::string& error);
  bool StopStreaming(std::string& error);

  // Waits at most `timeout` for one frame and copies it out. The driver
  // buffer is requeued before returning.
  bool ReadFrame(camera::Frame& frame, std::chrono::milliseconds timeout, std::string& error);

  bool IsOpen() const;
  bool IsStreaming() const;
  const std::string& DevicePath() const;
  V4l2CaptureMethod CaptureMethod() const;
  std::optional<double> NegotiatedFps() const;

  static bool ChooseCaptureMethod(std::uint32_t effective_caps, V4l2CaptureMethod& capture_method,
                                  std::string& reason);

private:
  struct MmapBuffer {
    void* address = nullptr;
    std::size_t length = 0U;
  };

  int IoctlRetry(int fd, unsigned long request, void* arg) const;
  bool ReleaseBuffers(std::string& error);
  bool ReadMmapFrame(camera::Frame& frame, std::string& error);
  bool ReadFallbackFrame(camera::Frame& frame, std::string& error);

  IoOps io_ops_;
  int fd_ = -1;
  std::string device_path_;
  std::uint32_t effective_capabilities_ = 0U;
  std::uint32_t buffer_type_ = 0U;
  V4l2CaptureMethod capture_method_ = V4l2CaptureMethod::kMmapStreaming;
  std::vector<MmapBuffer> mmap_buffers_;
  std::vector<std::uint8_t> read_buffer_;
  bool mmap_buffers_allocated_ = false;
  bool streaming_ = false;

  camera::CaptureFormat active_format_;
  std::uint32_t size_image_ = 0U;
  std::optional<double> negotiated_fps_;
};

} // namespace camctl::backends::v4l2
